#ifndef EVPNDF_DFFLAGS_H
#define EVPNDF_DFFLAGS_H

#include <stdint.h>
#include <string>

#include <boost/optional.hpp>

namespace evpndf
{

/* Bridge port flag bits reported with the dataplane results */
#define EVPNDF_BR_PORT_FLAG_NON_DF    0x1

typedef enum
{
    DF_CLASS_DF,
    DF_CLASS_NON_DF
} df_classification_t;

/*
 * Map the bridge port flag word to the DF role of the local node.
 * Only the non-DF bit is looked at; an absent flag word means DF.
 */
df_classification_t classifyDfFlags(uint64_t flags);
df_classification_t classifyDfFlags(const boost::optional<uint64_t> &flags);

/* "df" / "non-df", as written in the status file */
std::string dfStatusToString(df_classification_t status);

/* "0" / "1", as passed to the status helper */
std::string dfStatusToArg(df_classification_t status);

}

#endif /* EVPNDF_DFFLAGS_H */
