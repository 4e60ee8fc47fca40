#include <stdlib.h>
#include <iostream>
#include <string>

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/program_options.hpp>

#include "logger.h"
#include "ut_helpers_evpndfhook.h"

#define EVPNDF_UT_LOG_COMPONENT "EVPNDF_UT"

namespace po = boost::program_options;
using namespace std;

static bool parseArgs(int argc, char **argv)
{
    const char *tmpdir = getenv("TMPDIR");
    string log_level;
    string log_output;
    string tmp_root;

    po::options_description desc("evpndfhook unit test options");
    desc.add_options()
        ("help", "Display program help")
        ("swss-log-level,l", po::value<string>(&log_level)->default_value("WARN"),
         "SWSS logging level: EMERG, ALERT, CRIT, ERROR, WARN, NOTICE, INFO, DEBUG. "
         "The hook logs every dropped or failed publish at ERROR and WARN")
        ("swss-log-output", po::value<string>(&log_output)->default_value("STDERR"),
         "SWSS log stream: SYSLOG, STDOUT, STDERR")
        ("tmp-dir", po::value<string>(&tmp_root)->default_value(tmpdir && *tmpdir ? tmpdir : "/tmp"),
         "Parent directory of the status file scratch directories")
    ;

    try
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).allow_unregistered().run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            cout << desc << "\n";
        }
    }
    catch (const exception &e)
    {
        cerr << "Error while parsing arguments: " << e.what() << "\n";
        return false;
    }

    ut_evpndfhook::tmpRoot() = tmp_root;
    swss::Logger::getInstance().swssPrioNotify(EVPNDF_UT_LOG_COMPONENT, log_level);
    swss::Logger::getInstance().swssOutputNotify(EVPNDF_UT_LOG_COMPONENT, log_output);

    return true;
}

int main(int argc, char **argv)
{
    testing::InitGoogleMock(&argc, argv);

    if (!parseArgs(argc, argv))
    {
        return EXIT_FAILURE;
    }

    return RUN_ALL_TESTS();
}
