#include <errno.h>
#include <sys/stat.h>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "logger.h"
#include "filestatuspublisher.h"
#include "processstatuspublisher.h"
#include "evpndfhookconf.h"

using namespace std;
using json = nlohmann::json;

namespace evpndf
{

bool parseStatusSink(const string &name, status_sink_t &sink)
{
    if (name == "file")
    {
        sink = STATUS_SINK_FILE;
        return true;
    }
    if (name == "process")
    {
        sink = STATUS_SINK_PROCESS;
        return true;
    }
    return false;
}

string statusSinkToString(status_sink_t sink)
{
    return sink == STATUS_SINK_PROCESS ? "process" : "file";
}

static bool getStringField(const json &cfg, const char *field, string &value)
{
    auto it = cfg.find(field);
    if (it == cfg.end())
    {
        return true;
    }

    if (!it->is_string())
    {
        SWSS_LOG_ERROR("Config field '%s' must be a string", field);
        return false;
    }

    value = it->get<string>();
    return true;
}

bool parseHookConf(const string &contents, EvpnDfHookConf &conf)
{
    json cfg = json::parse(contents, nullptr, false);

    if (cfg.is_discarded())
    {
        SWSS_LOG_ERROR("Config is not valid JSON");
        return false;
    }

    if (!cfg.is_object())
    {
        SWSS_LOG_ERROR("Expected config root to be an object");
        return false;
    }

    EvpnDfHookConf parsed = conf;
    string sink = statusSinkToString(parsed.sink);

    if (!getStringField(cfg, "sink", sink) ||
        !getStringField(cfg, "base_dir", parsed.baseDir) ||
        !getStringField(cfg, "helper_runtime", parsed.helperRuntime) ||
        !getStringField(cfg, "helper_path", parsed.helperPath))
    {
        return false;
    }

    if (!parseStatusSink(sink, parsed.sink))
    {
        SWSS_LOG_ERROR("Unknown status sink '%s'", sink.c_str());
        return false;
    }

    if (parsed.sink == STATUS_SINK_FILE && parsed.baseDir.empty())
    {
        SWSS_LOG_ERROR("Missing mandatory field 'base_dir'");
        return false;
    }

    if (parsed.sink == STATUS_SINK_PROCESS && parsed.helperPath.empty())
    {
        SWSS_LOG_ERROR("Missing mandatory field 'helper_path'");
        return false;
    }

    conf = parsed;
    return true;
}

bool loadHookConf(const string &path, EvpnDfHookConf &conf)
{
    struct stat st;

    if (stat(path.c_str(), &st) < 0 && errno == ENOENT)
    {
        SWSS_LOG_NOTICE("No config at %s, using defaults", path.c_str());
        return true;
    }

    ifstream file(path);
    if (!file.is_open())
    {
        SWSS_LOG_ERROR("Failed to open config %s", path.c_str());
        return false;
    }

    stringstream contents;
    contents << file.rdbuf();

    if (!parseHookConf(contents.str(), conf))
    {
        SWSS_LOG_ERROR("Failed to parse config %s", path.c_str());
        return false;
    }

    SWSS_LOG_NOTICE("Loaded config %s, sink %s", path.c_str(), statusSinkToString(conf.sink).c_str());
    return true;
}

unique_ptr<StatusPublisher> createStatusPublisher(const EvpnDfHookConf &conf)
{
    if (conf.sink == STATUS_SINK_PROCESS)
    {
        return unique_ptr<StatusPublisher>(new ProcessStatusPublisher(conf.helperRuntime, conf.helperPath));
    }

    return unique_ptr<StatusPublisher>(new FileStatusPublisher(conf.baseDir));
}

}
