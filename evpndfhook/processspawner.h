#ifndef EVPNDF_PROCESSSPAWNER_H
#define EVPNDF_PROCESSSPAWNER_H

#include <string>
#include <vector>

namespace evpndf
{

class ProcessSpawner
{
public:
    virtual ~ProcessSpawner() {}

    /*
     * Start argv[0] with the given argument vector and return without
     * waiting for it. Returns false if the program could not be executed.
     */
    virtual bool spawnDetached(const std::vector<std::string> &argv) = 0;
};

/*
 * fork()/exec() based spawner. The program is double-forked into its own
 * session with stdio on /dev/null, so it is neither a child of the caller
 * nor attached to its terminal. No shell is involved: every element of argv
 * reaches the program as one literal argument.
 */
class DetachedProcessSpawner : public ProcessSpawner
{
public:
    bool spawnDetached(const std::vector<std::string> &argv) override;
};

}

#endif /* EVPNDF_PROCESSSPAWNER_H */
