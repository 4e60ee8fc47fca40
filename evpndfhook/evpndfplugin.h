#ifndef EVPNDF_EVPNDFPLUGIN_H
#define EVPNDF_EVPNDFPLUGIN_H

/*
 * C entry points of the hook, for daemons that load it as a module.
 * None of them lets a C++ exception escape.
 */

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

struct evpndf_dplane_ctx
{
    const char *zd_ifname;      /* may be NULL */
    int has_br_port;            /* 0: no bridge port state, nothing to do */
    uint64_t br_port_flags;
};

/* NULL config_path loads the default config; returns 0 on success, -1 otherwise */
int evpndf_hook_init(const char *config_path);

void evpndf_on_rib_process_dplane_results(const struct evpndf_dplane_ctx *ctx);

void evpndf_hook_fini(void);

#ifdef __cplusplus
}
#endif

#endif /* EVPNDF_EVPNDFPLUGIN_H */
