#include "core/types.hpp"

#include <cctype>

#include "core/config.hpp"

namespace panannot {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:                return "none";
        case ErrorKind::kConfig:              return "ConfigError";
        case ErrorKind::kValidationRejection: return "ValidationRejection";
        case ErrorKind::kEngine:              return "EngineError";
        case ErrorKind::kUnsupportedOption:   return "UnsupportedOption";
        case ErrorKind::kCancelled:           return "Cancelled";
    }
    return "unknown";
}

const char* backend_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::kProkka:   return "prokka";
        case BackendKind::kProdigal: return "prodigal";
    }
    return "unknown";
}

bool parse_backend_name(const std::string& str, BackendKind& out) {
    if (str == "prokka")   { out = BackendKind::kProkka;   return true; }
    if (str == "prodigal") { out = BackendKind::kProdigal; return true; }
    return false;
}

static const RejectReason kAllReasons[] = {
    RejectReason::kTooManyContigs, RejectReason::kL90TooHigh,
    RejectReason::kEmptySequence, RejectReason::kDuplicateIdentifier,
    RejectReason::kUnreadable,
};

const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
        case RejectReason::kNone:                return "none";
        case RejectReason::kTooManyContigs:      return "too-many-contigs";
        case RejectReason::kL90TooHigh:          return "l90-too-high";
        case RejectReason::kEmptySequence:       return "empty-sequence";
        case RejectReason::kDuplicateIdentifier: return "duplicate-identifier";
        case RejectReason::kUnreadable:          return "unreadable";
    }
    return "unknown";
}

bool parse_reject_reason(const std::string& str, RejectReason& out) {
    for (RejectReason r : kAllReasons) {
        if (str == reject_reason_name(r)) {
            out = r;
            return true;
        }
    }
    return false;
}

const char* annotation_status_name(AnnotationStatus status) {
    switch (status) {
        case AnnotationStatus::kOk:        return "ok";
        case AnnotationStatus::kFailed:    return "failed";
        case AnnotationStatus::kCancelled: return "cancelled";
        case AnnotationStatus::kSkipped:   return "skipped";
    }
    return "unknown";
}

bool parse_annotation_status(const std::string& str, AnnotationStatus& out) {
    if (str == "ok")        { out = AnnotationStatus::kOk;        return true; }
    if (str == "failed")    { out = AnnotationStatus::kFailed;    return true; }
    if (str == "cancelled") { out = AnnotationStatus::kCancelled; return true; }
    if (str == "skipped")   { out = AnnotationStatus::kSkipped;   return true; }
    return false;
}

const char* run_status_name(RunStatus status) {
    return status == RunStatus::kCancelled ? "cancelled" : "done";
}

bool is_valid_name_prefix(const std::string& prefix) {
    if (prefix.size() != static_cast<size_t>(PREFIX_LENGTH)) return false;
    for (unsigned char c : prefix) {
        if (!std::isalnum(c)) return false;
    }
    return true;
}

bool is_valid_name_date(const std::string& date) {
    if (date.size() != static_cast<size_t>(DATE_LENGTH)) return false;
    for (unsigned char c : date) {
        if (c == '.' || std::isspace(c)) return false;
    }
    return true;
}

} // namespace panannot
