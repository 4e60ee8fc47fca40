#include <gtest/gtest.h>

#include "evpndfhook/ifnameutil.h"

using namespace evpndf;

static bool isAllowed(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

TEST(IfNameUtil, KeepsSafeNames)
{
    EXPECT_EQ(sanitizeIfName(std::string("Ethernet0")), "Ethernet0");
    EXPECT_EQ(sanitizeIfName(std::string("bond1.100")), "bond1.100");
    EXPECT_EQ(sanitizeIfName(std::string("vxlan-10_a")), "vxlan-10_a");
}

TEST(IfNameUtil, ReplacesUnsafeCharacters)
{
    EXPECT_EQ(sanitizeIfName(std::string("eth0/1.100")), "eth0_1.100");
    EXPECT_EQ(sanitizeIfName(std::string("eth\"0")), "eth_0");
    EXPECT_EQ(sanitizeIfName(std::string("../../etc/passwd")), ".._.._etc_passwd");
    EXPECT_EQ(sanitizeIfName(std::string("a b\tc\n")), "a_b_c_");
    EXPECT_EQ(sanitizeIfName(std::string("eth0; rm -rf /")), "eth0__rm_-rf__");
}

TEST(IfNameUtil, MultibyteIsReplacedPerByte)
{
    /* U+00E9 is two bytes in UTF-8 */
    EXPECT_EQ(sanitizeIfName(std::string("br\xc3\xa9")), "br__");
}

TEST(IfNameUtil, EmptyAndAbsent)
{
    boost::optional<std::string> absent;

    EXPECT_EQ(sanitizeIfName(std::string()), "");
    EXPECT_EQ(sanitizeIfName(absent), "");
    EXPECT_EQ(sanitizeIfName(boost::optional<std::string>(std::string("eth/0"))), "eth_0");
}

TEST(IfNameUtil, LengthAlphabetAndIdempotence)
{
    std::string all;
    for (int c = 1; c < 256; c++)
    {
        all += static_cast<char>(c);
    }

    const std::string samples[] = { "", "eth0", all, std::string("nul\0byte", 8), "//..//", "'\"$`\\" };

    for (const auto &s : samples)
    {
        std::string token = sanitizeIfName(s);

        EXPECT_EQ(token.size(), s.size());
        for (auto c : token)
        {
            EXPECT_TRUE(isAllowed(c)) << "unexpected byte " << int(static_cast<unsigned char>(c));
        }
        EXPECT_EQ(token.find('/'), std::string::npos);
        EXPECT_EQ(sanitizeIfName(token), token);
    }
}
