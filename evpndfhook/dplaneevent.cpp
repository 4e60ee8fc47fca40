#include <cmath>

#include "logger.h"
#include "dplaneevent.h"

using namespace std;
using json = nlohmann::json;

namespace evpndf
{

static int hexDigitValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

bool parseDfFlags(const string &str, uint64_t &flags)
{
    size_t pos = str.find_first_not_of(" \t");
    size_t end = str.find_last_not_of(" \t");

    if (pos == string::npos)
    {
        return false;
    }

    bool negative = false;
    if (str[pos] == '-' || str[pos] == '+')
    {
        negative = (str[pos] == '-');
        pos++;
    }

    uint64_t base = 10;
    if (end > pos + 1 && str[pos] == '0' && (str[pos + 1] == 'x' || str[pos + 1] == 'X'))
    {
        base = 16;
        pos += 2;
    }

    if (pos > end)
    {
        return false;
    }

    /* Unsigned arithmetic wraps, i.e. the value is taken modulo 2^64 */
    uint64_t value = 0;
    for (size_t i = pos; i <= end; i++)
    {
        int digit = hexDigitValue(str[i]);
        if (digit < 0 || static_cast<uint64_t>(digit) >= base)
        {
            return false;
        }
        value = value * base + static_cast<uint64_t>(digit);
    }

    flags = negative ? 0 - value : value;
    return true;
}

uint64_t coerceDfFlags(const json &value)
{
    if (value.is_number_unsigned())
    {
        return value.get<uint64_t>();
    }

    if (value.is_number_integer())
    {
        return static_cast<uint64_t>(value.get<int64_t>());
    }

    if (value.is_number_float())
    {
        /* Beyond 2^64 only the non-DF bit is meaningful */
        double d = value.get<double>();
        if (std::isfinite(d) && std::floor(d) == d)
        {
            return std::fmod(std::fabs(d), 2.0) == 1.0 ? EVPNDF_BR_PORT_FLAG_NON_DF : 0;
        }
        SWSS_LOG_WARN("Bridge port flags %s are not an integer, using 0", value.dump().c_str());
        return 0;
    }

    if (value.is_string())
    {
        uint64_t flags = 0;
        if (parseDfFlags(value.get<string>(), flags))
        {
            return flags;
        }
        SWSS_LOG_WARN("Bridge port flags \"%s\" are not a number, using 0", value.get<string>().c_str());
        return 0;
    }

    if (!value.is_null())
    {
        SWSS_LOG_WARN("Bridge port flags of type %s are not a number, using 0", value.type_name());
    }

    return 0;
}

DplaneEvent decodeDplaneEvent(const json &doc)
{
    DplaneEvent event;

    if (!doc.is_object())
    {
        SWSS_LOG_WARN("Dataplane context of type %s ignored", doc.type_name());
        return event;
    }

    auto name = doc.find("zd_ifname");
    if (name == doc.end())
    {
        name = doc.find("interface");
    }
    if (name != doc.end())
    {
        if (name->is_string())
        {
            event.ifname = name->get<string>();
        }
        else if (!name->is_null())
        {
            SWSS_LOG_WARN("Interface name of type %s ignored", name->type_name());
        }
    }

    auto brPort = doc.find("br_port");
    if (brPort == doc.end() || brPort->is_null())
    {
        return event;
    }

    if (!brPort->is_object())
    {
        SWSS_LOG_WARN("Bridge port of type %s ignored", brPort->type_name());
        return event;
    }

    BridgePortState state;
    auto flags = brPort->find("flags");
    if (flags != brPort->end())
    {
        state.flags = coerceDfFlags(*flags);
    }
    event.brPort = state;

    return event;
}

bool decodeDplaneEvent(const string &line, DplaneEvent &event)
{
    json doc = json::parse(line, nullptr, false);

    if (doc.is_discarded())
    {
        SWSS_LOG_ERROR("Dataplane context is not valid JSON: %s", line.c_str());
        return false;
    }

    event = decodeDplaneEvent(doc);
    return true;
}

size_t processDplaneEventStream(DplaneHook &hook, istream &in)
{
    string line;
    size_t count = 0;

    while (getline(in, line))
    {
        if (line.find_first_not_of(" \t\r") == string::npos)
        {
            continue;
        }

        DplaneEvent event;
        if (!decodeDplaneEvent(line, event))
        {
            continue;
        }

        hook.onRibProcessDplaneResults(&event);
        count++;
    }

    return count;
}

}
