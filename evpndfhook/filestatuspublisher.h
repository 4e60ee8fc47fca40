#ifndef EVPNDF_FILESTATUSPUBLISHER_H
#define EVPNDF_FILESTATUSPUBLISHER_H

#include <string>

#include "statuspublisher.h"

namespace evpndf
{

#define EVPNDF_STATUS_FILE_PREFIX    "evpn_df_status_"
#define EVPNDF_STATUS_FILE_SUFFIX    ".json"

/*
 * Writes one JSON status file per interface:
 *   <base_dir>/evpn_df_status_<sanitized ifname>.json
 *
 * Every publish replaces the whole file through a temporary file and
 * rename(), so a reader sees either the previous or the new record. The
 * base directory is owned by the deployment and is never created here.
 */
class FileStatusPublisher : public StatusPublisher
{
public:
    FileStatusPublisher(const std::string &baseDir);

    publish_status_t publish(const DfStatusRecord &record) override;

    std::string getName() const override
    {
        return "file";
    }

    const std::string &getBaseDir() const
    {
        return m_baseDir;
    }

    std::string getStatusFilePath(const std::string &ifname) const;

private:
    std::string m_baseDir;

    bool writeStatusFile(int fd, const std::string &tmpPath, const std::string &content);
};

}

#endif /* EVPNDF_FILESTATUSPUBLISHER_H */
