#ifndef EVPNDF_PROCESSSTATUSPUBLISHER_H
#define EVPNDF_PROCESSSTATUSPUBLISHER_H

#include <memory>
#include <string>
#include <vector>

#include "statuspublisher.h"
#include "processspawner.h"

namespace evpndf
{

/*
 * Hands the DF status to an external helper:
 *   <runtime> <helper> <ifname> <0|1>
 * The helper is started detached and never waited for. An empty runtime
 * executes the helper directly.
 */
class ProcessStatusPublisher : public StatusPublisher
{
public:
    ProcessStatusPublisher(const std::string &runtime,
                           const std::string &helperPath,
                           std::shared_ptr<ProcessSpawner> spawner = nullptr);

    publish_status_t publish(const DfStatusRecord &record) override;

    std::string getName() const override
    {
        return "process";
    }

    std::vector<std::string> buildCommand(const DfStatusRecord &record) const;

private:
    std::string m_runtime;
    std::string m_helperPath;
    std::shared_ptr<ProcessSpawner> m_spawner;
};

}

#endif /* EVPNDF_PROCESSSTATUSPUBLISHER_H */
