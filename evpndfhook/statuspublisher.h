#ifndef EVPNDF_STATUSPUBLISHER_H
#define EVPNDF_STATUSPUBLISHER_H

#include <string>

#include "dfstatus.h"

namespace evpndf
{

typedef enum
{
    PUBLISH_SUCCESS,
    PUBLISH_IO_ERROR,
    PUBLISH_SPAWN_ERROR
} publish_status_t;

/*
 * Makes a DF status observable outside of the process.
 *
 * Implementations report failures through the returned status and the
 * syslog; they are not expected to throw.
 */
class StatusPublisher
{
public:
    virtual ~StatusPublisher() {}

    virtual publish_status_t publish(const DfStatusRecord &record) = 0;

    virtual std::string getName() const = 0;
};

}

#endif /* EVPNDF_STATUSPUBLISHER_H */
