#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include "logger.h"
#include "shellcmd.h"
#include "processspawner.h"

using namespace std;

namespace evpndf
{

/* Only async-signal-safe calls between fork() and exec() */
[[noreturn]] static void reportChildError(int fd, int err)
{
    if (write(fd, &err, sizeof(err)) < 0)
    {
        /* nothing left to report to */
    }
    _exit(127);
}

bool DetachedProcessSpawner::spawnDetached(const vector<string> &argv)
{
    SWSS_LOG_ENTER();

    if (argv.empty() || argv[0].empty())
    {
        SWSS_LOG_ERROR("Cannot spawn an empty command");
        return false;
    }

    const string cmd = shelljoin(argv);

    vector<char *> cargv;
    for (const auto &arg : argv)
    {
        cargv.push_back(const_cast<char *>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    /* Closed on a successful exec(), carries errno otherwise */
    int errPipe[2];
    if (pipe2(errPipe, O_CLOEXEC) < 0)
    {
        SWSS_LOG_ERROR("Failed to create pipe for %s: %s", cmd.c_str(), strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        SWSS_LOG_ERROR("Failed to fork for %s: %s", cmd.c_str(), strerror(errno));
        close(errPipe[0]);
        close(errPipe[1]);
        return false;
    }

    if (pid == 0)
    {
        close(errPipe[0]);

        if (setsid() < 0)
        {
            reportChildError(errPipe[1], errno);
        }

        pid_t grandchild = fork();
        if (grandchild < 0)
        {
            reportChildError(errPipe[1], errno);
        }
        if (grandchild > 0)
        {
            _exit(0);
        }

        /* Keep the error pipe clear of the stdio slots when the host closed them */
        int errFd = errPipe[1];
        if (errFd <= STDERR_FILENO)
        {
            errFd = fcntl(errPipe[1], F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
            if (errFd < 0)
            {
                reportChildError(errPipe[1], errno);
            }
            close(errPipe[1]);
        }

        int nullFd = open(DEV_NULL, O_RDWR);
        if (nullFd < 0)
        {
            reportChildError(errFd, errno);
        }
        dup2(nullFd, STDIN_FILENO);
        dup2(nullFd, STDOUT_FILENO);
        dup2(nullFd, STDERR_FILENO);
        if (nullFd > STDERR_FILENO)
        {
            close(nullFd);
        }

        execv(cargv[0], cargv.data());
        reportChildError(errFd, errno);
    }

    close(errPipe[1]);

    /* The intermediate child exits right after the second fork() */
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR)
    {
    }

    int childErrno = 0;
    ssize_t n;
    do
    {
        n = read(errPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    close(errPipe[0]);

    if (n > 0)
    {
        SWSS_LOG_ERROR("Failed to execute %s: %s", cmd.c_str(), strerror(childErrno));
        return false;
    }

    SWSS_LOG_DEBUG("Spawned %s", cmd.c_str());
    return true;
}

}
