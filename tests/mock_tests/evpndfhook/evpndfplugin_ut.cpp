#include <gtest/gtest.h>

#include "evpndfhook/evpndfplugin.h"
#include "ut_helpers_evpndfhook.h"

using namespace ut_evpndfhook;

class EvpnDfPluginTest : public ::testing::Test
{
public:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
        m_config = m_dir.path() + "/evpndfhook.conf";
        m_status = m_dir.path() + "/evpn_df_status_bond1.json";
    }

    void TearDown() override
    {
        evpndf_hook_fini();
    }

protected:
    TempDir m_dir;
    std::string m_config;
    std::string m_status;
};

TEST_F(EvpnDfPluginTest, NotInitializedIsNoop)
{
    struct evpndf_dplane_ctx ctx = { "bond1", 1, 1 };

    evpndf_on_rib_process_dplane_results(&ctx);
    evpndf_on_rib_process_dplane_results(NULL);
    evpndf_hook_fini();
}

TEST_F(EvpnDfPluginTest, PublishesStatusFile)
{
    ASSERT_TRUE(writeFile(m_config, "{\"sink\":\"file\",\"base_dir\":\"" + m_dir.path() + "\"}"));
    ASSERT_EQ(evpndf_hook_init(m_config.c_str()), 0);

    struct evpndf_dplane_ctx ctx = { "bond1", 1, 0x3 };
    evpndf_on_rib_process_dplane_results(&ctx);

    std::string contents;
    ASSERT_TRUE(readFile(m_status, contents));
    EXPECT_EQ(contents, "{\"interface\":\"bond1\",\"df_status\":\"non-df\"}\n");

    ctx.br_port_flags = 0x2;
    evpndf_on_rib_process_dplane_results(&ctx);
    ASSERT_TRUE(readFile(m_status, contents));
    EXPECT_EQ(contents, "{\"interface\":\"bond1\",\"df_status\":\"df\"}\n");
}

TEST_F(EvpnDfPluginTest, NoBridgePortWritesNothing)
{
    ASSERT_TRUE(writeFile(m_config, "{\"base_dir\":\"" + m_dir.path() + "\"}"));
    ASSERT_EQ(evpndf_hook_init(m_config.c_str()), 0);

    struct evpndf_dplane_ctx ctx = { "bond1", 0, 1 };
    evpndf_on_rib_process_dplane_results(&ctx);
    evpndf_on_rib_process_dplane_results(NULL);

    EXPECT_FALSE(fileExists(m_status));
}

TEST_F(EvpnDfPluginTest, NullNameUsesEmptyName)
{
    ASSERT_TRUE(writeFile(m_config, "{\"base_dir\":\"" + m_dir.path() + "\"}"));
    ASSERT_EQ(evpndf_hook_init(m_config.c_str()), 0);

    struct evpndf_dplane_ctx ctx = { NULL, 1, 0 };
    evpndf_on_rib_process_dplane_results(&ctx);

    std::string contents;
    ASSERT_TRUE(readFile(m_dir.path() + "/evpn_df_status_.json", contents));
    EXPECT_EQ(contents, "{\"interface\":\"\",\"df_status\":\"df\"}\n");
}

TEST_F(EvpnDfPluginTest, InvalidConfigDisablesHook)
{
    ASSERT_TRUE(writeFile(m_config, "{\"sink\":\"carrier-pigeon\",\"base_dir\":\"" + m_dir.path() + "\"}"));
    EXPECT_EQ(evpndf_hook_init(m_config.c_str()), -1);

    struct evpndf_dplane_ctx ctx = { "bond1", 1, 1 };
    evpndf_on_rib_process_dplane_results(&ctx);

    EXPECT_FALSE(fileExists(m_status));
}

TEST_F(EvpnDfPluginTest, UnwritableBaseDirIsSwallowed)
{
    ASSERT_TRUE(writeFile(m_config, "{\"base_dir\":\"" + m_dir.path() + "/missing\"}"));
    ASSERT_EQ(evpndf_hook_init(m_config.c_str()), 0);

    struct evpndf_dplane_ctx ctx = { "bond1", 1, 1 };
    EXPECT_NO_THROW(evpndf_on_rib_process_dplane_results(&ctx));
}
