#pragma once

#include <cstdarg>
#include <cstdio>
#include <memory>
#include <string>

namespace panannot {

// Leveled logger writing to stderr, optionally mirrored to a log file.
// Each message is formatted into one buffer and emitted with a single
// stdio call, so lines from worker threads do not interleave.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, bool quiet = false)
        : level_(level), quiet_(quiet) {}

    // Quiet: nothing on stderr; the log file (if any) still receives messages.
    bool quiet() const { return quiet_; }

    // Mirror messages to path (truncated). Copies of this logger share the file.
    bool open_file(const std::string& path) {
        std::FILE* fp = std::fopen(path.c_str(), "w");
        if (!fp) return false;
        file_.reset(fp, [](std::FILE* f) { std::fclose(f); });
        return true;
    }

    void error(const char* fmt, ...) const {
        if (level_ < kError) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    bool quiet_;
    std::shared_ptr<std::FILE> file_;

    void log_impl(const char* tag, const char* fmt, va_list ap) const {
        char body[2048];
        std::vsnprintf(body, sizeof(body), fmt, ap);
        char line[2100];
        std::snprintf(line, sizeof(line), "[%s] %s\n", tag, body);
        if (!quiet_) std::fputs(line, stderr);
        if (file_) {
            std::fputs(line, file_.get());
            std::fflush(file_.get());
        }
    }
};

} // namespace panannot
