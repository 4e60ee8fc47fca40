#ifndef EVPNDF_EVPNDFHOOKCONF_H
#define EVPNDF_EVPNDFHOOKCONF_H

#include <memory>
#include <string>

#include "shellcmd.h"
#include "statuspublisher.h"

#define EVPNDF_DEFAULT_CONFIG_FILE    "/etc/evpndfhook/evpndfhook.json"
#define EVPNDF_DEFAULT_BASE_DIR       "/run/frr/evpn-mh"
#define EVPNDF_DEFAULT_HELPER_PATH    "/usr/libexec/evpn-mh/evpn_df_update.py"

namespace evpndf
{

typedef enum
{
    STATUS_SINK_FILE,
    STATUS_SINK_PROCESS
} status_sink_t;

struct EvpnDfHookConf
{
    status_sink_t sink{STATUS_SINK_FILE};
    /* file sink */
    std::string baseDir{EVPNDF_DEFAULT_BASE_DIR};
    /* process sink */
    std::string helperRuntime{PYTHON3_CMD};
    std::string helperPath{EVPNDF_DEFAULT_HELPER_PATH};
};

bool parseStatusSink(const std::string &name, status_sink_t &sink);
std::string statusSinkToString(status_sink_t sink);

/*
 * Apply the settings found in a JSON document on top of conf. Keys are
 * optional, unknown keys are ignored. Returns false on a document that does
 * not parse or has values of the wrong type; conf is left untouched then.
 */
bool parseHookConf(const std::string &contents, EvpnDfHookConf &conf);

/* A missing file keeps the defaults; an unreadable or invalid one is an error */
bool loadHookConf(const std::string &path, EvpnDfHookConf &conf);

std::unique_ptr<StatusPublisher> createStatusPublisher(const EvpnDfHookConf &conf);

}

#endif /* EVPNDF_EVPNDFHOOKCONF_H */
