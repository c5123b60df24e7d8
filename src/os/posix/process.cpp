#include "os/process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <iostream>

namespace {

static void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Drain both pipes until the child closes them. Polling avoids a deadlock
// when the child fills one pipe while we block reading the other.
static void drainPipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    char buf[4096];
    pollfd fds[2];
    fds[0] = {out_fd, POLLIN, 0};
    fds[1] = {err_fd, POLLIN, 0};
    int open_count = 2;

    while (open_count > 0) {
        const int r = ::poll(fds, 2, -1);
        if (r < 0) {
            if (errno == EINTR) continue;
            return;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) continue;
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (i == 0 ? out : err).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;   // poll ignores negative descriptors
                --open_count;
            }
        }
    }
}

} // anonymous namespace

namespace Proc {

bool Run(const std::vector<std::string>& argv, Result& out) {
    out = Result{};
    if (argv.empty()) return false;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
        std::cerr << "[Proc] pipe failed: " << ::strerror(errno) << "\n";
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(err_pipe[0]); closeFd(err_pipe[1]);
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        std::cerr << "[Proc] fork failed: " << ::strerror(errno) << "\n";
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(err_pipe[0]); closeFd(err_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }

    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);

    drainPipes(out_pipe[0], err_pipe[0], out.out, out.err);

    closeFd(out_pipe[0]);
    closeFd(err_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            std::cerr << "[Proc] waitpid failed: " << ::strerror(errno) << "\n";
            return false;
        }
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
        // execvp failure in the child surfaces as 127
        out.launched = (out.exit_code != 127);
    } else {
        out.launched = true;
        out.exit_code = -1;
    }

    return out.launched && out.exit_code == 0;
}

bool Exists(const std::string& program) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = ::getenv("PATH");
    if (!path_env) return false;

    std::string path(path_env);
    size_t begin = 0;
    while (begin <= path.size()) {
        size_t end = path.find(':', begin);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(begin, end - begin);
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + program;
        if (::access(candidate.c_str(), X_OK) == 0) return true;
        begin = end + 1;
    }
    return false;
}

} // namespace Proc
