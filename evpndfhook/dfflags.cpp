#include "dfflags.h"

using namespace std;

namespace evpndf
{

df_classification_t classifyDfFlags(uint64_t flags)
{
    return (flags & EVPNDF_BR_PORT_FLAG_NON_DF) ? DF_CLASS_NON_DF : DF_CLASS_DF;
}

df_classification_t classifyDfFlags(const boost::optional<uint64_t> &flags)
{
    return classifyDfFlags(flags.value_or(0));
}

string dfStatusToString(df_classification_t status)
{
    return status == DF_CLASS_NON_DF ? "non-df" : "df";
}

string dfStatusToArg(df_classification_t status)
{
    return status == DF_CLASS_NON_DF ? "1" : "0";
}

}
