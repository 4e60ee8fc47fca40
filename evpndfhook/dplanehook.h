#ifndef EVPNDF_DPLANEHOOK_H
#define EVPNDF_DPLANEHOOK_H

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "table.h"
#include "statuspublisher.h"

namespace evpndf
{

struct BridgePortState
{
    /* bit 0: local node is non-DF for the port */
    boost::optional<uint64_t> flags;
};

/* Fields of a dataplane result context the hook looks at */
struct DplaneEvent
{
    boost::optional<std::string> ifname;
    boost::optional<BridgePortState> brPort;
};

/* The daemon expects an empty table back from every invocation */
typedef std::vector<swss::FieldValueTuple> DplaneHookResult;

struct DplaneHookStats
{
    uint64_t events{0};
    uint64_t skipped{0};
    uint64_t published{0};
    uint64_t failed{0};
};

class DplaneHook
{
public:
    DplaneHook(std::shared_ptr<StatusPublisher> publisher);

    /*
     * Called once per dataplane result batch. Publishes the DF status of the
     * bridge port carried by the event, if any. Always returns an empty
     * result; publish failures and exceptions are logged and dropped.
     */
    DplaneHookResult onRibProcessDplaneResults(const DplaneEvent *event);

    const DplaneHookStats &getStats() const
    {
        return m_stats;
    }

    void logStats() const;

    StatusPublisher *getPublisher() const
    {
        return m_publisher.get();
    }

private:
    std::shared_ptr<StatusPublisher> m_publisher;
    DplaneHookStats m_stats;

    bool processEvent(const DplaneEvent &event);
};

}

#endif /* EVPNDF_DPLANEHOOK_H */
