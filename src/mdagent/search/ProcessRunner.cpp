//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessRunner.cpp
// Purpose: POSIX child process execution with captured stdout/stderr
//==========================================================================================================

#include "mdagent/search/ProcessRunner.h"

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <sys/wait.h>
#include <cstring>
#include <system_error>

#include "logging/Logger.h"

namespace mdagent {
namespace search {

namespace {

// Closes both ends on scope exit unless released
struct Pipe {
    int fds[2]{-1, -1};
    Pipe() {
        if (::pipe(fds) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe");
        }
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    }
    ~Pipe() { closeRead(); closeWrite(); }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

} // namespace

ProcessOutput PosixProcessRunner::Run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::system_error(EINVAL, std::generic_category(), "empty argv");
    }
    LOG_DEBUG("Spawning {} ({} args)", argv.front(), argv.size() - 1);

    Pipe outPipe;
    Pipe errPipe;

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(outPipe.fds[1], STDOUT_FILENO);
        ::dup2(errPipe.fds[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        const char msg[] = "exec failed\n";
        (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        ::_exit(127);
    }

    outPipe.closeWrite();
    errPipe.closeWrite();

    ProcessOutput result;
    struct pollfd fds[2];
    fds[0] = {outPipe.fds[0], POLLIN, 0};
    fds[1] = {errPipe.fds[0], POLLIN, 0};
    std::string* sinks[2] = {&result.out, &result.err};
    int openStreams = 2;
    char buf[8192];
    while (openStreams > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
        for (int k = 0; k < 2; ++k) {
            if (fds[k].fd < 0 || fds[k].revents == 0) continue;
            ssize_t n = ::read(fds[k].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[k]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[k].fd = -1;
                --openStreams;
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    LOG_DEBUG("{} exited with {}", argv.front(), result.exitCode);
    return result;
}

} // namespace search
} // namespace mdagent
