#ifndef EVPNDF_IFNAMEUTIL_H
#define EVPNDF_IFNAMEUTIL_H

#include <string>

#include <boost/optional.hpp>

namespace evpndf
{

/*
 * Replace every byte outside [A-Za-z0-9._-] with '_'.
 *
 * The result has the same length as the input and never contains a path
 * separator, so it can be used as a single path component. Absent names
 * sanitize to the empty string.
 */
std::string sanitizeIfName(const std::string &ifname);
std::string sanitizeIfName(const boost::optional<std::string> &ifname);

}

#endif /* EVPNDF_IFNAMEUTIL_H */
