#pragma once

#include <cstddef>

namespace panannot {

// Quality gate limits
inline constexpr int MAX_NBCONT_LIMIT = 9999;   // --nbcont must be below 10000

// Sequence preprocessing
inline constexpr int DEFAULT_CUT_N = 5;         // split contigs at runs of >= 5 'N'

// Systematic names
inline constexpr int PREFIX_LENGTH = 4;          // e.g. ESCO, EXAM
inline constexpr int DATE_LENGTH = 4;            // MMYY
inline constexpr int CONTIG_INDEX_WIDTH = 4;     // <NAME>.0001
inline constexpr int GENE_INDEX_WIDTH = 5;       // <NAME>_00001
inline constexpr const char* QC_ONLY_PREFIX = "NONE";

// Engine process control
inline constexpr int PROCESS_POLL_MS = 100;
inline constexpr int TERMINATE_GRACE_MS = 3000;
inline constexpr size_t MAX_ENGINE_WARNINGS = 20;

// Exit codes
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_CONFIG_ERROR = 1;
inline constexpr int EXIT_CANCELLED = 130;

} // namespace panannot
