#pragma once

/**
 * @file process_runner.h
 * @brief fork/exec helpers for OS actions and the speech process
 */

#include "errors.h"
#include <string>
#include <vector>
#include <sys/types.h>

namespace voice_os {

/**
 * Expand an argv template: every "{key}" inside each element is replaced by value.
 */
std::vector<std::string> expand_argv(const std::vector<std::string>& argv_template,
                                     const std::string& key,
                                     const std::string& value);

/**
 * Run argv to completion (PATH lookup, stdout/stderr discarded).
 * @param stdin_text Written to the child's stdin, then stdin is closed
 * @return Exit status; 127 when the program could not be executed,
 *         128 + signal when the child was killed. Error if fork/pipe failed.
 */
Result<int> run_process(const std::vector<std::string>& argv, const std::string& stdin_text = "");

/**
 * @brief A child process that runs in the background until it exits or is terminated
 *
 * Owning handle: the destructor terminates and reaps the child.
 */
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    /**
     * Start argv in the background.
     * @param stdin_text Written to stdin before it is closed (may be empty)
     */
    static Result<ChildProcess> spawn(const std::vector<std::string>& argv,
                                      const std::string& stdin_text = "");

    /// True while the child has not been reaped
    bool running();

    /// SIGTERM and reap. No-op when nothing is running.
    void terminate();

    /// Block until the child exits; returns its exit status (-1 if none)
    int wait();

    pid_t pid() const { return pid_; }

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    pid_t pid_ = -1;
};

} // namespace voice_os
