#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <vector>

#include "logger.h"
#include "ifnameutil.h"
#include "filestatuspublisher.h"

using namespace std;

namespace evpndf
{

FileStatusPublisher::FileStatusPublisher(const string &baseDir) :
        m_baseDir(baseDir)
{
    while (m_baseDir.size() > 1 && m_baseDir.back() == '/')
    {
        m_baseDir.pop_back();
    }
}

string FileStatusPublisher::getStatusFilePath(const string &ifname) const
{
    return m_baseDir + "/" + EVPNDF_STATUS_FILE_PREFIX + sanitizeIfName(ifname) + EVPNDF_STATUS_FILE_SUFFIX;
}

bool FileStatusPublisher::writeStatusFile(int fd, const string &tmpPath, const string &content)
{
    size_t written = 0;

    while (written < content.size())
    {
        ssize_t ret = write(fd, content.data() + written, content.size() - written);
        if (ret < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            SWSS_LOG_ERROR("Failed to write %s: %s", tmpPath.c_str(), strerror(errno));
            return false;
        }
        written += static_cast<size_t>(ret);
    }

    /* mkstemp() creates the file 0600, the status is read by other users */
    if (fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) < 0)
    {
        SWSS_LOG_ERROR("Failed to set mode of %s: %s", tmpPath.c_str(), strerror(errno));
        return false;
    }

    return true;
}

publish_status_t FileStatusPublisher::publish(const DfStatusRecord &record)
{
    SWSS_LOG_ENTER();

    const string path = getStatusFilePath(record.getIfName());
    const string content = record.toJsonLine();

    /* Leading '.' and no .json suffix: never matches the status file pattern */
    string tmpTemplate = m_baseDir + "/." + EVPNDF_STATUS_FILE_PREFIX +
                         sanitizeIfName(record.getIfName()) + ".XXXXXX";
    vector<char> tmpName(tmpTemplate.begin(), tmpTemplate.end());
    tmpName.push_back('\0');

    int fd = mkstemp(tmpName.data());
    if (fd < 0)
    {
        SWSS_LOG_ERROR("Failed to create status file for %s in %s: %s",
                       record.getIfName().c_str(), m_baseDir.c_str(), strerror(errno));
        return PUBLISH_IO_ERROR;
    }

    const string tmpPath(tmpName.data());
    bool ok = writeStatusFile(fd, tmpPath, content);

    if (close(fd) < 0 && ok)
    {
        SWSS_LOG_ERROR("Failed to close %s: %s", tmpPath.c_str(), strerror(errno));
        ok = false;
    }

    if (ok && rename(tmpPath.c_str(), path.c_str()) < 0)
    {
        SWSS_LOG_ERROR("Failed to replace %s: %s", path.c_str(), strerror(errno));
        ok = false;
    }

    if (!ok)
    {
        unlink(tmpPath.c_str());
        return PUBLISH_IO_ERROR;
    }

    SWSS_LOG_INFO("Interface %s is %s, status written to %s",
                  record.getIfName().c_str(), dfStatusToString(record.getStatus()).c_str(), path.c_str());

    return PUBLISH_SUCCESS;
}

}
