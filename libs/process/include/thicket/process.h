#pragma once

#include <string>
#include <vector>

namespace thicket::process {

// Result of a finished child: exit status (-1 if it did not exit normally)
// and everything it wrote to stdout.
struct Result {
    int status = -1;
    std::string output;
};

// Child is a subprocess whose stdout is captured through a pipe. stderr is
// inherited so diagnostics reach the terminal directly. The output is only
// collected by wait(); a child that fills the pipe blocks until then.
class Child {
public:
    Child() = default;
    ~Child();

    Child(const Child&) = delete;
    Child& operator=(const Child&) = delete;

    // launch starts program (looked up in PATH) with args. Returns false if
    // the pipe or the fork could not be created. A program that cannot be
    // executed shows up as exit status 127 from wait().
    bool launch(const std::string& program, const std::vector<std::string>& args);

    // Returns true if a child was launched and has not been waited for.
    bool running() const;

    // wait reads stdout until EOF, then blocks until the child exits.
    Result wait();

    // Send a termination signal and reap. Safe to call if not running.
    void stop();

private:
    void close_pipe();

    int pid_ = 0;
    int out_fd_ = -1;
};

// run launches program and waits for it. Throws std::runtime_error if the
// child could not be started.
Result run(const std::string& program, const std::vector<std::string>& args);

// command_line joins program and args for log messages.
std::string command_line(const std::string& program, const std::vector<std::string>& args);

} // namespace thicket::process
