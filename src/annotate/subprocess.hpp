#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

#include "util/cancellation.hpp"

namespace panannot {

struct ProcessResult {
    bool started = false;
    bool cancelled = false;
    int exit_code = -1;     // valid when the child exited normally
    int term_signal = 0;    // non-zero when the child was killed by a signal
    std::string error;

    bool success() const {
        return started && !cancelled && term_signal == 0 && exit_code == 0;
    }
};

// RAII handle on one external process. The child runs in its own process
// group with stdin from /dev/null and stdout/stderr appended to a log file.
// A child still running when the handle is destroyed is terminated and
// reaped.
class Subprocess {
public:
    Subprocess() = default;
    ~Subprocess();
    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Launch argv (argv[0] resolved through PATH). Fails if the program
    // cannot be executed at all.
    bool start(const std::vector<std::string>& argv,
               const std::string& log_path,
               const std::string& working_dir,
               std::string& error_msg);

    // Block until the child exits. If token is set while waiting, the child
    // is terminated and the result is marked cancelled.
    ProcessResult wait(const CancellationToken* token);

    bool running() const { return pid_ > 0; }

    // SIGTERM to the process group, SIGKILL after a grace period, then reap.
    void terminate();

private:
    pid_t pid_ = -1;
};

// RAII scratch directory. Created on construction (stale content from an
// earlier run is removed first) and removed with its content on every exit
// path.
class ScopedTempDir {
public:
    ScopedTempDir() = default;
    explicit ScopedTempDir(const std::string& path);
    ~ScopedTempDir();
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

    bool created() const { return created_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool created_ = false;

    void release();
};

// True if program is an executable path, or found as one in $PATH.
bool find_executable(const std::string& program, std::string& resolved);

} // namespace panannot
