#ifndef EVPNDF_DPLANEEVENT_H
#define EVPNDF_DPLANEEVENT_H

#include <stdint.h>
#include <istream>
#include <string>

#include <nlohmann/json.hpp>

#include "dplanehook.h"

namespace evpndf
{

/*
 * Decoding of dataplane result contexts handed over as JSON:
 *
 *   {"zd_ifname": "bond1", "br_port": {"flags": 1}}
 *
 * Unexpected value types never fail the decode, they fall back to the
 * defaults of the field: a name that is not a string is absent, a br_port
 * that is not an object is absent and unusable flags are 0.
 */
DplaneEvent decodeDplaneEvent(const nlohmann::json &doc);

/* Returns false if line is not JSON; event is left untouched then */
bool decodeDplaneEvent(const std::string &line, DplaneEvent &event);

/*
 * Feed one JSON dataplane context per line to the hook until EOF. Blank
 * lines are skipped, lines that are not JSON are logged and skipped.
 * Returns the number of contexts handed to the hook.
 */
size_t processDplaneEventStream(DplaneHook &hook, std::istream &in);

uint64_t coerceDfFlags(const nlohmann::json &value);

/*
 * Parse a decimal or 0x-prefixed hexadecimal flag word of any length.
 * Wider values are reduced modulo 2^64, which keeps every low bit; a leading
 * '-' yields the two's complement.
 */
bool parseDfFlags(const std::string &str, uint64_t &flags);

}

#endif /* EVPNDF_DPLANEEVENT_H */
