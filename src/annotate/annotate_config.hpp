#pragma once

#include <string>

#include "annotate/backend.hpp"
#include "annotate/name_assigner.hpp"
#include "annotate/quality_filter.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "util/cli_parser.hpp"

namespace panannot {

struct AnnotateConfig {
    std::string genome_dir;         // -d
    std::string results_dir;        // -r
    std::string list_file;          // -l
    std::string tmp_dir;            // --tmp, default <results>/tmp_files
    std::string info_file;          // --info: precomputed metrics, "" = analyse genomes
    NamingPolicy naming;            // -n, --date, --order, --name-width
    QualityThresholds thresholds;   // --nbcont, --l90, --strict-thresholds
    BackendKind backend = BackendKind::kProkka;
    BackendOptions backend_options;
    int cut_n = DEFAULT_CUT_N;
    int threads = 1;                // resolved worker count
    bool qc_only = false;           // -Q
};

// Fill config from "panannot annotate" arguments. Fails with
// ErrorKind::kConfig on a missing or malformed value.
bool parse_annotate_config(const CliParser& cli, AnnotateConfig& config,
                           StageError& err);

// Check values and, unless QC-only, that the selected engine is installed.
// --small without --prodigal is ErrorKind::kUnsupportedOption. Sequences of
// an info file are used as is, so --info excludes a non-default --cutN.
bool validate_annotate_config(const AnnotateConfig& config, StageError& err);

// Basename of the list file without extension; names the summary files.
std::string list_name(const AnnotateConfig& config);

} // namespace panannot
