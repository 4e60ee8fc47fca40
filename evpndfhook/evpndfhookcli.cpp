#include <getopt.h>
#include <stdlib.h>
#include <unistd.h>
#include <iostream>
#include <string>

#include "logger.h"
#include "evpndfhookconf.h"
#include "dplaneevent.h"
#include "dplanehook.h"
#include "evpndfhookcli.h"

using namespace std;

namespace evpndf
{

static void usage()
{
    cout << "Usage: evpndfhook [-c config.json] [-s file|process] [-d base_dir] [-i ifname [-f flags]]" << endl;
    cout << "       -c config.json: hook config (default " << EVPNDF_DEFAULT_CONFIG_FILE << ")" << endl;
    cout << "       -s sink: publish DF status to a file or a helper process" << endl;
    cout << "       -d base_dir: directory of the status files" << endl;
    cout << "       -i ifname: handle a single bridge port event for ifname" << endl;
    cout << "       -f flags: bridge port flags of the single event (default 0)" << endl;
    cout << "       Without -i, one JSON dataplane context per line is read from stdin" << endl;
}

int runEvpnDfHook(int argc, char **argv, istream &in)
{
    SWSS_LOG_ENTER();

    string config_file(EVPNDF_DEFAULT_CONFIG_FILE);
    string sink;
    string base_dir;
    string ifname;
    string flags;
    bool single_event = false;
    int opt;

    /* Rescan from argv[1] on every call */
    optind = 0;

    while ((opt = getopt(argc, argv, "c:s:d:i:f:h")) != -1 )
    {
        switch (opt)
        {
        case 'c':
            config_file.assign(optarg);
            break;
        case 's':
            sink.assign(optarg);
            break;
        case 'd':
            base_dir.assign(optarg);
            break;
        case 'i':
            ifname.assign(optarg);
            single_event = true;
            break;
        case 'f':
            flags.assign(optarg);
            break;
        case 'h':
            usage();
            return EXIT_FAILURE;
        default: /* '?' */
            usage();
            return EXIT_FAILURE;
        }
    }

    if (!flags.empty() && !single_event)
    {
        cerr << "-f requires -i" << endl;
        usage();
        return EXIT_FAILURE;
    }

    EvpnDfHookConf conf;
    if (!loadHookConf(config_file, conf))
    {
        SWSS_LOG_ERROR("Invalid config %s", config_file.c_str());
        return EXIT_FAILURE;
    }

    if (!sink.empty() && !parseStatusSink(sink, conf.sink))
    {
        cerr << "Unknown sink " << sink << endl;
        usage();
        return EXIT_FAILURE;
    }

    if (!base_dir.empty())
    {
        conf.baseDir = base_dir;
    }

    try
    {
        DplaneHook hook(createStatusPublisher(conf));

        if (single_event)
        {
            BridgePortState state;
            uint64_t value = 0;

            if (!flags.empty() && !parseDfFlags(flags, value))
            {
                SWSS_LOG_WARN("Bridge port flags \"%s\" are not a number, using 0", flags.c_str());
                value = 0;
            }
            state.flags = value;

            DplaneEvent event;
            event.ifname = ifname;
            event.brPort = state;

            hook.onRibProcessDplaneResults(&event);
        }
        else
        {
            processDplaneEventStream(hook, in);
        }

        hook.logStats();
    }
    catch (const std::exception& e)
    {
        SWSS_LOG_ERROR("Exception \"%s\" had been thrown in evpndfhook", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

}
