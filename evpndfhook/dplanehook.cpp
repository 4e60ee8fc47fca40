#include <inttypes.h>
#include <exception>

#include "logger.h"
#include "dfflags.h"
#include "dfstatus.h"
#include "dplanehook.h"

using namespace std;

namespace evpndf
{

DplaneHook::DplaneHook(shared_ptr<StatusPublisher> publisher) :
        m_publisher(publisher)
{
}

bool DplaneHook::processEvent(const DplaneEvent &event)
{
    const string ifname = event.ifname.value_or("");
    const df_classification_t status = classifyDfFlags(event.brPort->flags);

    SWSS_LOG_DEBUG("Bridge port %s flags 0x%" PRIx64 ", %s", ifname.c_str(),
                   event.brPort->flags.value_or(0), dfStatusToString(status).c_str());

    DfStatusRecord record(ifname, status);

    return m_publisher->publish(record) == PUBLISH_SUCCESS;
}

void DplaneHook::logStats() const
{
    SWSS_LOG_NOTICE("DF status hook: %" PRIu64 " events, %" PRIu64 " skipped, %" PRIu64 " published, %" PRIu64 " failed",
                    m_stats.events, m_stats.skipped, m_stats.published, m_stats.failed);
}

DplaneHookResult DplaneHook::onRibProcessDplaneResults(const DplaneEvent *event)
{
    SWSS_LOG_ENTER();

    m_stats.events++;

    if (event == nullptr || !event->brPort)
    {
        m_stats.skipped++;
        return DplaneHookResult();
    }

    try
    {
        if (!m_publisher)
        {
            SWSS_LOG_ERROR("No status publisher, dropping DF status of %s",
                           event->ifname.value_or("").c_str());
            m_stats.failed++;
        }
        else if (processEvent(*event))
        {
            m_stats.published++;
        }
        else
        {
            m_stats.failed++;
        }
    }
    catch (const std::exception &e)
    {
        SWSS_LOG_ERROR("Exception \"%s\" while publishing DF status of %s",
                       e.what(), event->ifname.value_or("").c_str());
        m_stats.failed++;
    }
    catch (...)
    {
        SWSS_LOG_ERROR("Unknown exception while publishing DF status of %s",
                       event->ifname.value_or("").c_str());
        m_stats.failed++;
    }

    return DplaneHookResult();
}

}
