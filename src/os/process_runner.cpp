#include "os/process_runner.h"
#include "logger.h"
#include "utils.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace voice_os {

namespace {

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

/// Both ends close-on-exec: children forked concurrently from other
/// threads must not inherit a write end and keep it open past our close().
int open_cloexec_pipe(int fds[2]) {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC);
#else
    if (pipe(fds) == -1) return -1;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}

/// fork + execvp with stdin from a pipe and stdout/stderr to /dev/null.
Result<pid_t> start_child(const std::vector<std::string>& argv, const std::string& stdin_text) {
    if (argv.empty()) {
        return make_error(ErrorType::InvalidState, "Empty command line");
    }

    int stdin_pipe[2];
    if (open_cloexec_pipe(stdin_pipe) == -1) {
        return make_io_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return make_error(ErrorType::ResourceError, std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (stdin_pipe[0] == STDIN_FILENO) {
            fcntl(STDIN_FILENO, F_SETFD, 0);
        } else {
            dup2(stdin_pipe[0], STDIN_FILENO);
            close(stdin_pipe[0]);
        }
        close(stdin_pipe[1]);

        int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        execvp(args[0], args.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    if (!stdin_text.empty()) {
        // SIGPIPE would kill us if the child exits without reading
        signal(SIGPIPE, SIG_IGN);
        size_t written = 0;
        while (written < stdin_text.size()) {
            ssize_t n = write(stdin_pipe[1], stdin_text.data() + written, stdin_text.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            written += static_cast<size_t>(n);
        }
    }
    close(stdin_pipe[1]);
    return pid;
}

int reap(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) return -1;
    }
    return decode_status(status);
}

} // anonymous namespace

std::vector<std::string> expand_argv(const std::vector<std::string>& argv_template,
                                     const std::string& key,
                                     const std::string& value) {
    std::vector<std::string> argv;
    argv.reserve(argv_template.size());
    const std::string placeholder = "{" + key + "}";
    for (const auto& arg : argv_template) {
        argv.push_back(utils::replace_all(arg, placeholder, value));
    }
    return argv;
}

Result<int> run_process(const std::vector<std::string>& argv, const std::string& stdin_text) {
    auto started = start_child(argv, stdin_text);
    if (started.is_error()) {
        return started.error();
    }
    int code = reap(started.value());
    if (code < 0) {
        return make_io_error("waitpid failed for " + argv[0]);
    }
    return code;
}

ChildProcess::~ChildProcess() {
    terminate();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept : pid_(other.pid_) {
    other.pid_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        terminate();
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

Result<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                         const std::string& stdin_text) {
    auto started = start_child(argv, stdin_text);
    if (started.is_error()) {
        return started.error();
    }
    return ChildProcess(started.value());
}

bool ChildProcess::running() {
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    pid_ = -1;
    return false;
}

void ChildProcess::terminate() {
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    reap(pid_);
    pid_ = -1;
}

int ChildProcess::wait() {
    if (pid_ <= 0) return -1;
    int code = reap(pid_);
    pid_ = -1;
    return code;
}

} // namespace voice_os
