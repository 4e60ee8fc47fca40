#include "logger.h"
#include "shellcmd.h"
#include "processstatuspublisher.h"

using namespace std;

namespace evpndf
{

ProcessStatusPublisher::ProcessStatusPublisher(const string &runtime,
                                               const string &helperPath,
                                               shared_ptr<ProcessSpawner> spawner) :
        m_runtime(runtime),
        m_helperPath(helperPath),
        m_spawner(spawner)
{
    if (!m_spawner)
    {
        m_spawner = make_shared<DetachedProcessSpawner>();
    }
}

vector<string> ProcessStatusPublisher::buildCommand(const DfStatusRecord &record) const
{
    vector<string> argv;

    if (!m_runtime.empty())
    {
        argv.push_back(m_runtime);
    }
    argv.push_back(m_helperPath);
    argv.push_back(record.getIfName());
    argv.push_back(dfStatusToArg(record.getStatus()));

    return argv;
}

publish_status_t ProcessStatusPublisher::publish(const DfStatusRecord &record)
{
    SWSS_LOG_ENTER();

    auto argv = buildCommand(record);

    if (!m_spawner->spawnDetached(argv))
    {
        SWSS_LOG_ERROR("Failed to notify DF status of %s", record.getIfName().c_str());
        return PUBLISH_SPAWN_ERROR;
    }

    SWSS_LOG_INFO("Interface %s is %s, started %s",
                  record.getIfName().c_str(), dfStatusToString(record.getStatus()).c_str(),
                  shelljoin(argv).c_str());

    return PUBLISH_SUCCESS;
}

}
