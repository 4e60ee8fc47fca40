#include "dfstatus.h"

#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::ordered_json;

namespace evpndf
{

string DfStatusRecord::toJsonLine() const
{
    json j;

    j["interface"] = m_ifname;
    j["df_status"] = dfStatusToString(m_status);

    /* Interface names are raw bytes, do not let invalid UTF-8 throw */
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

}
