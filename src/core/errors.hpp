#pragma once

#include <cstdint>
#include <string>

namespace panannot {

// Failure classes of the annotate stage.
//   kConfig, kUnsupportedOption: fatal, raised before any per-genome work.
//   kValidationRejection, kEngine: per-genome, recorded in the run summary.
//   kCancelled: run level, completed work is kept.
enum class ErrorKind : uint8_t {
    kNone = 0,
    kConfig,
    kValidationRejection,
    kEngine,
    kUnsupportedOption,
    kCancelled,
};

const char* error_kind_name(ErrorKind kind);

struct StageError {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;

    bool failed() const { return kind != ErrorKind::kNone; }

    void set(ErrorKind k, const std::string& msg) {
        kind = k;
        message = msg;
    }

    void clear() {
        kind = ErrorKind::kNone;
        message.clear();
    }
};

} // namespace panannot
