#include <exception>
#include <memory>

#include "logger.h"
#include "evpndfhookconf.h"
#include "dplanehook.h"
#include "evpndfplugin.h"

using namespace std;
using namespace evpndf;

/* Owned by the module, set up by evpndf_hook_init() */
static unique_ptr<DplaneHook> gDplaneHook;

extern "C" int evpndf_hook_init(const char *config_path)
{
    try
    {
        EvpnDfHookConf conf;
        string path = config_path ? config_path : EVPNDF_DEFAULT_CONFIG_FILE;

        if (!loadHookConf(path, conf))
        {
            SWSS_LOG_ERROR("DF status hook disabled, invalid config %s", path.c_str());
            gDplaneHook.reset();
            return -1;
        }

        gDplaneHook.reset(new DplaneHook(createStatusPublisher(conf)));
        SWSS_LOG_NOTICE("DF status hook enabled, sink %s", statusSinkToString(conf.sink).c_str());
        return 0;
    }
    catch (const std::exception &e)
    {
        SWSS_LOG_ERROR("Exception \"%s\" had been thrown in DF status hook init", e.what());
    }
    catch (...)
    {
        SWSS_LOG_ERROR("Unknown exception had been thrown in DF status hook init");
    }

    gDplaneHook.reset();
    return -1;
}

extern "C" void evpndf_on_rib_process_dplane_results(const struct evpndf_dplane_ctx *ctx)
{
    if (!gDplaneHook || ctx == NULL)
    {
        return;
    }

    try
    {
        DplaneEvent event;

        if (ctx->zd_ifname)
        {
            event.ifname = string(ctx->zd_ifname);
        }
        if (ctx->has_br_port)
        {
            BridgePortState state;
            state.flags = ctx->br_port_flags;
            event.brPort = state;
        }

        gDplaneHook->onRibProcessDplaneResults(&event);
    }
    catch (const std::exception &e)
    {
        SWSS_LOG_ERROR("Exception \"%s\" had been thrown in DF status hook", e.what());
    }
    catch (...)
    {
        SWSS_LOG_ERROR("Unknown exception had been thrown in DF status hook");
    }
}

extern "C" void evpndf_hook_fini(void)
{
    if (!gDplaneHook)
    {
        return;
    }

    try
    {
        gDplaneHook->logStats();
    }
    catch (const std::exception &e)
    {
        SWSS_LOG_ERROR("Exception \"%s\" had been thrown in DF status hook fini", e.what());
    }

    gDplaneHook.reset();
}
