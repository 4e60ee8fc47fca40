#ifndef EVPNDF_DFSTATUS_H
#define EVPNDF_DFSTATUS_H

#include <string>

#include "dfflags.h"

namespace evpndf
{

/* DF role of one interface, as computed from one callback */
class DfStatusRecord
{
public:
    DfStatusRecord(const std::string &ifname, df_classification_t status) :
        m_ifname(ifname),
        m_status(status)
    {
    }

    const std::string &getIfName() const
    {
        return m_ifname;
    }

    df_classification_t getStatus() const
    {
        return m_status;
    }

    bool isNonDf() const
    {
        return m_status == DF_CLASS_NON_DF;
    }

    /* {"interface":"<ifname>","df_status":"<df|non-df>"} followed by '\n' */
    std::string toJsonLine() const;

private:
    const std::string m_ifname;
    const df_classification_t m_status;
};

}

#endif /* EVPNDF_DFSTATUS_H */
