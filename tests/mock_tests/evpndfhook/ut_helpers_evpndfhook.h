#ifndef EVPNDF_UT_HELPERS_EVPNDFHOOK_H
#define EVPNDF_UT_HELPERS_EVPNDFHOOK_H

#include <dirent.h>
#include <stdlib.h>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "evpndfhook/statuspublisher.h"
#include "evpndfhook/processspawner.h"

namespace ut_evpndfhook
{
    class MockStatusPublisher : public evpndf::StatusPublisher
    {
    public:
        MOCK_METHOD1(publish, evpndf::publish_status_t(const evpndf::DfStatusRecord &record));
        MOCK_CONST_METHOD0(getName, std::string());
    };

    class MockProcessSpawner : public evpndf::ProcessSpawner
    {
    public:
        MOCK_METHOD1(spawnDetached, bool(const std::vector<std::string> &argv));
    };

    /* Parent of the scratch directories, set by --tmp-dir */
    inline std::string &tmpRoot()
    {
        static std::string root("/tmp");
        return root;
    }

    /* Scratch directory, removed with its files on destruction */
    class TempDir
    {
    public:
        TempDir()
        {
            std::string tmpl = tmpRoot() + "/evpndfhook_ut.XXXXXX";
            std::vector<char> buf(tmpl.begin(), tmpl.end());
            buf.push_back('\0');
            char *dir = mkdtemp(buf.data());
            m_path = dir ? dir : "";
        }

        ~TempDir()
        {
            for (const auto &name : list(true))
            {
                unlink((m_path + "/" + name).c_str());
            }
            rmdir(m_path.c_str());
        }

        const std::string &path() const
        {
            return m_path;
        }

        std::vector<std::string> list(bool withHidden = false) const
        {
            std::vector<std::string> names;
            DIR *dir = opendir(m_path.c_str());
            if (!dir)
            {
                return names;
            }

            struct dirent *ent;
            while ((ent = readdir(dir)) != nullptr)
            {
                std::string name(ent->d_name);
                if (name == "." || name == "..")
                {
                    continue;
                }
                if (!withHidden && name[0] == '.')
                {
                    continue;
                }
                names.push_back(name);
            }
            closedir(dir);

            return names;
        }

    private:
        std::string m_path;
    };

    inline bool readFile(const std::string &path, std::string &contents)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return false;
        }

        std::stringstream ss;
        ss << file.rdbuf();
        contents = ss.str();
        return true;
    }

    inline bool writeFile(const std::string &path, const std::string &contents)
    {
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open())
        {
            return false;
        }

        file << contents;
        return file.good();
    }

    inline bool fileExists(const std::string &path)
    {
        return access(path.c_str(), F_OK) == 0;
    }
}

#endif /* EVPNDF_UT_HELPERS_EVPNDFHOOK_H */
