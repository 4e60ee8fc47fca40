#include "ifnameutil.h"

using namespace std;

namespace evpndf
{

static bool isSafeIfNameChar(char c)
{
    /* isalnum() is locale dependent, keep to plain ASCII */
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

string sanitizeIfName(const string &ifname)
{
    string token(ifname);

    for (auto &c : token)
    {
        if (!isSafeIfNameChar(c))
        {
            c = '_';
        }
    }

    return token;
}

string sanitizeIfName(const boost::optional<string> &ifname)
{
    return sanitizeIfName(ifname.value_or(""));
}

}
