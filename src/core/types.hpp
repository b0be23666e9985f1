#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace panannot {

enum class BackendKind : uint8_t { kProkka, kProdigal };

// Closed set of reasons a genome is kept out of annotation.
enum class RejectReason : uint8_t {
    kNone = 0,
    kTooManyContigs,
    kL90TooHigh,
    kEmptySequence,
    kDuplicateIdentifier,
    kUnreadable,
};

enum class AnnotationStatus : uint8_t { kOk, kFailed, kCancelled, kSkipped };

enum class RunStatus : uint8_t { kDone, kCancelled };

const char* backend_name(BackendKind kind);
bool parse_backend_name(const std::string& str, BackendKind& out);

const char* reject_reason_name(RejectReason reason);
bool parse_reject_reason(const std::string& str, RejectReason& out);

const char* annotation_status_name(AnnotationStatus status);
bool parse_annotation_status(const std::string& str, AnnotationStatus& out);

const char* run_status_name(RunStatus status);

// Name parts: a prefix is PREFIX_LENGTH alphanumeric characters; a date is
// DATE_LENGTH characters without '.' or whitespace.
bool is_valid_name_prefix(const std::string& prefix);
bool is_valid_name_date(const std::string& date);

struct QualityMetrics {
    uint64_t genome_size = 0;
    uint32_t nb_contigs = 0;
    uint32_t l90 = 0;
};

// One genome as listed in the list file. Built by GenomeLoader, never
// modified afterwards.
struct GenomeRecord {
    std::string identifier;             // first file on the list line, or orig_name
    std::vector<std::string> paths;     // resolved FASTA files, in list order
    uint64_t total_length = 0;
    std::vector<uint64_t> contig_lengths; // file order, after N splitting
    bool readable = true;
    std::string load_error;
    std::string prefix_override;        // "" = use run prefix
    std::string date_override;          // "" = use run date
    uint32_t list_index = 0;            // 0-based line order among genomes
    bool has_known_metrics = false;     // metrics read from an info file
    QualityMetrics known_metrics;
};

struct AcceptanceDecision {
    bool accepted = false;
    RejectReason reason = RejectReason::kNone;
    QualityMetrics metrics;
};

struct SystematicName {
    std::string group;      // effective prefix; ordinals count per prefix
    uint32_t ordinal = 0;   // 1-based within group
    std::string text;       // "<prefix>[.<date>].<zero-padded ordinal>"
};

struct AnnotationResult {
    std::string name;
    std::string identifier;
    BackendKind backend = BackendKind::kProkka;
    std::string output_dir;
    AnnotationStatus status = AnnotationStatus::kFailed;
    ErrorKind error = ErrorKind::kNone;
    std::string reason;
    std::vector<std::string> warnings;
    uint32_t gene_count = 0;
    bool reused = false;
    QualityMetrics metrics;
};

struct RejectedGenome {
    std::string identifier;
    RejectReason reason = RejectReason::kNone;
    QualityMetrics metrics;
    std::string detail;
    uint32_t list_index = 0;
};

// Aggregate handed to downstream stages. Results are keyed by systematic
// name so aggregation does not depend on completion order.
struct RunSummary {
    RunStatus status = RunStatus::kDone;
    std::map<std::string, AnnotationResult> results;
    std::vector<RejectedGenome> rejected;   // list order

    size_t accepted_count() const { return results.size(); }
    size_t rejected_count() const { return rejected.size(); }
    size_t count_status(AnnotationStatus s) const {
        size_t n = 0;
        for (const auto& [name, r] : results)
            if (r.status == s) n++;
        return n;
    }
};

} // namespace panannot
