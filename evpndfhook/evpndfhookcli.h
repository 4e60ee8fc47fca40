#ifndef EVPNDF_EVPNDFHOOKCLI_H
#define EVPNDF_EVPNDFHOOKCLI_H

#include <istream>

namespace evpndf
{

/*
 * Command line front end of the hook. Parses the options, loads the config
 * and feeds either the single -i/-f event or the JSON lines read from in.
 * Returns EXIT_SUCCESS once the events are handled, whatever the publish
 * outcome, and EXIT_FAILURE on usage or config errors.
 */
int runEvpnDfHook(int argc, char **argv, std::istream &in);

}

#endif /* EVPNDF_EVPNDFHOOKCLI_H */
