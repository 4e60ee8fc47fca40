#include <iostream>

#include "logger.h"
#include "evpndfhookcli.h"

int main(int argc, char **argv)
{
    swss::Logger::linkToDbNative("evpndfhook");

    return evpndf::runEvpnDfHook(argc, argv, std::cin);
}
