#pragma once

#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/types.hpp"

namespace panannot {

// Engine tuning shared by both backends. Which fields apply depends on the
// backend; validate_backend_options() rejects the combinations that do not.
struct BackendOptions {
    bool small = false;     // Prodigal metagenomic mode (-p meta)
    int cpus = 1;           // threads given to each Prokka run
    std::string prokka_bin = "prokka";
    std::string prodigal_bin = "prodigal";
    bool force = false;     // rebuild results even if a valid one exists
};

// One engine run: its command line and where its outputs land.
struct EngineInvocation {
    BackendKind kind = BackendKind::kProkka;
    std::string work_dir;
    std::string input_fasta;
    std::string log_path;
    std::vector<std::string> argv;
    std::string gff_path;       // gene calls (Prokka)
    std::string faa_path;       // proteins; gene calls for Prodigal
    std::string ffn_path;
};

// Fails with ErrorKind::kUnsupportedOption when an option is requested for
// an engine that has no equivalent.
bool validate_backend_options(BackendKind kind, const BackendOptions& opts,
                              StageError& err);

const std::string& engine_executable(BackendKind kind, const BackendOptions& opts);

// Build the command line running `kind` on <work_dir>/<name>.fna.
bool build_invocation(BackendKind kind, const std::string& name,
                      const std::string& work_dir, const BackendOptions& opts,
                      EngineInvocation& out, StageError& err);

// Engine options that change gene calls. Part of the result fingerprint.
std::string engine_option_signature(BackendKind kind, const BackendOptions& opts);

// "<tmp>/<name>-prokkaRes"
std::string engine_work_dir(const std::string& tmp_dir, const std::string& name,
                            BackendKind kind);

} // namespace panannot
