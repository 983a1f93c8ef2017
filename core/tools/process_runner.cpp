#include "tools/process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wrc {

namespace {

std::runtime_error systemError(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv) const {
    if (argv.empty()) {
        throw std::runtime_error("empty command line");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0) {
        throw systemError("pipe failed");
    }
    if (::pipe(err_pipe) != 0) {
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        throw systemError("pipe failed");
    }

    // Built before fork so the child only calls async-signal-safe functions.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        closeFd(err_pipe[0]);
        closeFd(err_pipe[1]);
        throw systemError("fork failed for " + argv[0]);
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);

    ProcessResult result;
    pollfd fds[2] = {
        {out_pipe[0], POLLIN, 0},
        {err_pipe[0], POLLIN, 0}
    };
    std::string* sinks[2] = {&result.output, &result.errors};
    int open_streams = 2;
    char buffer[4096];

    while (open_streams > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;  // poll ignores negative descriptors
                open_streams--;
            }
        }
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) ::close(fd.fd);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw systemError("waitpid failed for " + argv[0]);
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

} // namespace wrc
