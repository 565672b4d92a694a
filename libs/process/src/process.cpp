#include "thicket/process.h"

#include "cli_logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace thicket::process {

std::string command_line(const std::string& program, const std::vector<std::string>& args) {
    std::string cmdline = program;
    for (const auto& a : args) cmdline += " " + a;
    return cmdline;
}

Child::~Child() {
    stop();
}

bool Child::launch(const std::string& program, const std::vector<std::string>& args) {
    stop(); // Clean up any previous child

    LOGD("exec:", command_line(program, args));

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0) return false;

    // Build argv before forking so the child only calls async-signal-safe functions.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        // Child: stdout into the pipe, stderr left alone
        dup2(pipefd[1], STDOUT_FILENO);
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(pipefd[1]);
    pid_ = pid;
    out_fd_ = pipefd[0];
    return true;
}

bool Child::running() const {
    return pid_ > 0;
}

Result Child::wait() {
    Result result;
    if (pid_ <= 0) return result;

    char buf[4096];
    for (;;) {
        ssize_t n = read(out_fd_, buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close_pipe();

    int wstatus = 0;
    pid_t r = 0;
    do {
        r = waitpid(pid_, &wstatus, 0);
    } while (r < 0 && errno == EINTR);
    pid_ = 0;

    result.status = (r > 0 && WIFEXITED(wstatus)) ? WEXITSTATUS(wstatus) : -1;
    return result;
}

void Child::stop() {
    close_pipe();
    if (pid_ > 0) {
        kill(pid_, SIGTERM);
        while (waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {}
        pid_ = 0;
    }
}

void Child::close_pipe() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

Result run(const std::string& program, const std::vector<std::string>& args) {
    Child child;
    if (!child.launch(program, args))
        throw std::runtime_error("starting " + program + ": " + std::strerror(errno));
    return child.wait();
}

} // namespace thicket::process
