///////////////////////////////////////////////////////////////////////////////
// child_process.h -- Delegated subprocess handle and shell output capture
//
// The media pipelines (ffmpeg on the host, ffplay on the viewer) run as
// child processes.  ChildProcess owns one of them: it launches with
// fork/execvp, reports exec failures synchronously, polls for exit without
// blocking and stops with SIGTERM -> grace period -> SIGKILL.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace lp {

class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Launch argv[0] (looked up on PATH) with the given arguments.
    /// Returns false if fork fails or the program cannot be executed.
    bool start(const std::vector<std::string>& argv);

    /// Non-blocking exit check.  Returns true once the child has exited and
    /// been reaped; \p exit_code is the exit status, or -signal if it died
    /// from a signal.
    bool poll(int& exit_code);

    /// True while a launched child has not been reaped.
    bool running() const { return pid_ > 0; }

    /// Send SIGTERM without waiting.
    void terminate();

    /// SIGTERM, wait up to \p grace_ms, then SIGKILL and reap.
    /// Returns true if the child had to be killed.
    bool stop(uint32_t grace_ms);

    pid_t pid() const { return pid_; }
    const std::vector<std::string>& argv() const { return argv_; }

private:
    pid_t                    pid_ = -1;
    std::vector<std::string> argv_;
};

/// Run \p command through the shell and collect its stdout.  Returns false
/// if the command could not be started or exited non-zero.
bool captureCommandOutput(const std::string& command, std::string& output);

/// Quote \p arg for safe use in a /bin/sh command line.
std::string shellQuote(const std::string& arg);

} // namespace lp
