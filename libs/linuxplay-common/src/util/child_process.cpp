///////////////////////////////////////////////////////////////////////////////
// child_process.cpp -- fork/exec supervision helpers
///////////////////////////////////////////////////////////////////////////////

#include "lp/util/child_process.h"
#include "lp/common.h"

#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace lp {

namespace {

int decodeStatus(int status) {
    if (WIFEXITED(status))   return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

} // anonymous namespace

ChildProcess::~ChildProcess() {
    if (pid_ > 0) stop(0);
}

bool ChildProcess::start(const std::vector<std::string>& argv) {
    if (pid_ > 0) {
        LP_LOG(WARN, "ChildProcess: already running (pid %d)", static_cast<int>(pid_));
        return false;
    }
    if (argv.empty()) {
        LP_LOG(ERR, "ChildProcess: empty command line");
        return false;
    }

    // Build the exec vector before fork so the child only calls
    // async-signal-safe functions.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    // Close-on-exec pipe: the child writes errno only if execvp fails.
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        LP_LOG(ERR, "ChildProcess: pipe2 failed: %s", std::strerror(errno));
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        LP_LOG(ERR, "ChildProcess: fork failed: %s", std::strerror(errno));
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return false;
    }

    if (pid == 0) {
        ::close(err_pipe[0]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t ignored = ::write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    ::close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        ::waitpid(pid, nullptr, 0);
        LP_LOG(ERR, "ChildProcess: cannot execute '%s': %s",
               argv[0].c_str(), std::strerror(child_errno));
        return false;
    }

    pid_  = pid;
    argv_ = argv;
    LP_LOG(DEBUG, "ChildProcess: started '%s' (pid %d)", argv[0].c_str(), static_cast<int>(pid));
    return true;
}

bool ChildProcess::poll(int& exit_code) {
    if (pid_ <= 0) return false;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return false;
    if (r < 0) {
        // ECHILD: someone else reaped it.  Treat as an abnormal exit.
        LP_LOG(WARN, "ChildProcess: waitpid(%d) failed: %s",
               static_cast<int>(pid_), std::strerror(errno));
        exit_code = -1;
    } else {
        exit_code = decodeStatus(status);
    }
    pid_ = -1;
    return true;
}

void ChildProcess::terminate() {
    if (pid_ > 0) ::kill(pid_, SIGTERM);
}

bool ChildProcess::stop(uint32_t grace_ms) {
    if (pid_ <= 0) return false;

    const pid_t pid = pid_;
    ::kill(pid, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(grace_ms);
    int exit_code = 0;
    do {
        if (poll(exit_code)) {
            LP_LOG(DEBUG, "ChildProcess: pid %d exited (%d) after SIGTERM",
                   static_cast<int>(pid), exit_code);
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    } while (std::chrono::steady_clock::now() < deadline);

    LP_LOG(WARN, "ChildProcess: pid %d ignored SIGTERM for %ums, sending SIGKILL",
           static_cast<int>(pid), grace_ms);
    ::kill(pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
    pid_ = -1;
    return true;
}

bool captureCommandOutput(const std::string& command, std::string& output) {
    output.clear();

    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        LP_LOG(DEBUG, "popen('%s') failed: %s", command.c_str(), std::strerror(errno));
        return false;
    }

    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        output.append(buf, n);
    }

    int status = ::pclose(pipe);
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else           out += c;
    }
    out += "'";
    return out;
}

} // namespace lp
