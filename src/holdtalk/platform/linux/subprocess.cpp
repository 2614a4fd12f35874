#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

static std::unexpected<Error> errno_error(const char* what) {
    return make_error(ErrorKind::Output, std::format("{} failed: {}", what, std::strerror(errno)));
}

Result<void> run_process(const std::vector<std::string>& argv, const std::string* input) {
    if (argv.empty()) {
        return make_error(ErrorKind::Output, "empty command");
    }

    std::vector<char*> args;
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (input && ::pipe2(pipefd, O_CLOEXEC) < 0) {
        return errno_error("pipe()");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno_error("fork()");
        if (input) {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        return err;
    }

    if (pid == 0) {
        if (input) {
            ::dup2(pipefd[0], STDIN_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    if (input) {
        ::close(pipefd[0]);
        size_t total_written = 0;
        while (total_written < input->size()) {
            ssize_t n = ::write(pipefd[1], input->data() + total_written, input->size() - total_written);
            if (n < 0) {
                if (errno == EINTR) continue;
                auto err = errno_error("write()");
                ::close(pipefd[1]);
                ::waitpid(pid, nullptr, 0);
                return err;
            }
            total_written += static_cast<size_t>(n);
        }
        ::close(pipefd[1]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return errno_error("waitpid()");
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return make_error(ErrorKind::Output, argv[0] + " not found");
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return make_error(ErrorKind::Output,
                          std::format("{} exited with code {}", argv[0], WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return make_error(ErrorKind::Output,
                          std::format("{} killed by signal {}", argv[0], WTERMSIG(status)));
    }

    return {};
}
