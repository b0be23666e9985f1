#include "annotate/subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/config.hpp"
#include "util/file_utils.hpp"

namespace panannot {

Subprocess::~Subprocess() {
    if (running()) terminate();
}

bool Subprocess::start(const std::vector<std::string>& argv,
                       const std::string& log_path,
                       const std::string& working_dir,
                       std::string& error_msg) {
    if (argv.empty()) {
        error_msg = "empty command line";
        return false;
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    // Reports an exec failure back to the parent; closed on successful exec.
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        error_msg = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error_msg = std::string("fork failed: ") + std::strerror(errno);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return false;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::close(err_pipe[0]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        int log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (log_fd >= 0) {
            ::dup2(log_fd, STDOUT_FILENO);
            ::dup2(log_fd, STDERR_FILENO);
            ::close(log_fd);
        }
        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            int e = errno;
            ssize_t w = ::write(err_pipe[1], &e, sizeof(e));
            (void)w;
            ::_exit(127);
        }
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t w = ::write(err_pipe[1], &e, sizeof(e));
        (void)w;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        error_msg = "cannot execute " + argv[0] + ": " + std::strerror(child_errno);
        return false;
    }

    pid_ = pid;
    return true;
}

static void fill_exit_status(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
}

ProcessResult Subprocess::wait(const CancellationToken* token) {
    ProcessResult result;
    if (!running()) {
        result.error = "process not started";
        return result;
    }
    result.started = true;

    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            fill_exit_status(status, result);
            pid_ = -1;
            return result;
        }
        if (r < 0 && errno != EINTR) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            pid_ = -1;
            return result;
        }
        if (token && token->requested()) {
            terminate();
            result.cancelled = true;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(PROCESS_POLL_MS));
    }
}

void Subprocess::terminate() {
    if (!running()) return;

    ::kill(-pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(TERMINATE_GRACE_MS);
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || (r < 0 && errno != EINTR)) {
            pid_ = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(PROCESS_POLL_MS));
    }

    ::kill(-pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
}

// ---------------------------------------------------------------------------
// ScopedTempDir
// ---------------------------------------------------------------------------

ScopedTempDir::ScopedTempDir(const std::string& path) : path_(path) {
    remove_recursive(path_);
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    created_ = !ec && dir_exists(path_);
}

ScopedTempDir::~ScopedTempDir() {
    release();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
    : path_(std::move(other.path_)), created_(other.created_) {
    other.created_ = false;
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        created_ = other.created_;
        other.created_ = false;
    }
    return *this;
}

void ScopedTempDir::release() {
    if (created_) {
        remove_recursive(path_);
        created_ = false;
    }
}

// ---------------------------------------------------------------------------

static bool is_executable_file(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

bool find_executable(const std::string& program, std::string& resolved) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos) {
        if (!is_executable_file(program)) return false;
        resolved = program;
        return true;
    }

    const char* env_path = std::getenv("PATH");
    if (!env_path) return false;
    std::string path_list(env_path);
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t end = path_list.find(':', start);
        if (end == std::string::npos) end = path_list.size();
        std::string dir = path_list.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        if (is_executable_file(candidate)) {
            resolved = candidate;
            return true;
        }
        start = end + 1;
    }
    return false;
}

} // namespace panannot
