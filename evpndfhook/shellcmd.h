#ifndef EVPNDF_SHELLCMD_H
#define EVPNDF_SHELLCMD_H

#include <string>
#include <vector>

#define DEV_NULL             "/dev/null"
#define PYTHON3_CMD          "/usr/bin/python3"

namespace evpndf
{

/*
 * Quote a single shell word: wrap it in single quotes and turn every
 * embedded single quote into '\''.
 */
static inline std::string shellquote(const std::string &str)
{
    std::string quoted("'");

    for (auto c : str)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += c;
        }
    }

    quoted += "'";
    return quoted;
}

/* Render an argument vector as a copy-pasteable command line */
static inline std::string shelljoin(const std::vector<std::string> &argv)
{
    std::string cmd;

    for (const auto &arg : argv)
    {
        if (!cmd.empty())
        {
            cmd += " ";
        }
        cmd += shellquote(arg);
    }

    return cmd;
}

}

#endif /* EVPNDF_SHELLCMD_H */
