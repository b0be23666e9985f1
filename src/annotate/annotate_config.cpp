#include "annotate/annotate_config.hpp"

#include "annotate/subprocess.hpp"
#include "core/version.hpp"
#include "util/common_init.hpp"
#include "util/file_utils.hpp"

namespace panannot {

static bool require_string(const CliParser& cli, const std::string& key,
                           std::string& out, StageError& err) {
    if (!cli.has(key) || cli.get_string(key).empty()) {
        err.set(ErrorKind::kConfig, key + " is required");
        return false;
    }
    out = cli.get_string(key);
    return true;
}

static bool optional_int(const CliParser& cli, const std::string& key,
                         int& out, StageError& err) {
    if (!cli.has(key)) return true;
    std::string msg;
    if (!cli.parse_int(key, out, msg)) {
        err.set(ErrorKind::kConfig, msg);
        return false;
    }
    return true;
}

bool parse_annotate_config(const CliParser& cli, AnnotateConfig& config,
                           StageError& err) {
    config = AnnotateConfig{};
    config.qc_only = cli.has("-Q");

    if (!require_string(cli, "-d", config.genome_dir, err)) return false;
    if (!require_string(cli, "-r", config.results_dir, err)) return false;
    if (!require_string(cli, "-l", config.list_file, err)) return false;

    if (cli.has("-n")) {
        config.naming.prefix = cli.get_string("-n");
    } else if (config.qc_only) {
        config.naming.prefix = QC_ONLY_PREFIX;
    } else {
        err.set(ErrorKind::kConfig, "-n is required (unless -Q is given)");
        return false;
    }
    config.naming.date = cli.get_string("--date");

    std::string msg;
    int l90 = 0;
    int nbcont = 0;
    if (!cli.parse_int("--l90", l90, msg) || !cli.parse_int("--nbcont", nbcont, msg)) {
        err.set(ErrorKind::kConfig, msg);
        return false;
    }
    if (l90 < 0) {
        err.set(ErrorKind::kConfig, "--l90 must be >= 0");
        return false;
    }
    if (nbcont < 0 || nbcont > MAX_NBCONT_LIMIT) {
        err.set(ErrorKind::kConfig, "--nbcont must be between 0 and " +
                                    std::to_string(MAX_NBCONT_LIMIT));
        return false;
    }
    config.thresholds.max_l90 = static_cast<uint32_t>(l90);
    config.thresholds.max_contigs = static_cast<uint32_t>(nbcont);
    config.thresholds.inclusive = !cli.has("--strict-thresholds");

    std::string order = cli.get_string("--order", "list");
    if (order == "list") {
        config.naming.order = NamingOrder::kListOrder;
    } else if (order == "quality") {
        config.naming.order = NamingOrder::kQuality;
    } else {
        err.set(ErrorKind::kConfig, "--order must be 'list' or 'quality', got '" + order + "'");
        return false;
    }
    if (!optional_int(cli, "--name-width", config.naming.min_width, err)) return false;
    if (!optional_int(cli, "--cutN", config.cut_n, err)) return false;

    config.backend = cli.has("--prodigal") ? BackendKind::kProdigal : BackendKind::kProkka;
    config.backend_options.small = cli.has("--small");
    config.backend_options.force = cli.has("-F") || cli.has("--force");
    if (!optional_int(cli, "--cpus", config.backend_options.cpus, err)) return false;
    config.backend_options.prokka_bin = cli.get_string("--prokka-bin", "prokka");
    config.backend_options.prodigal_bin = cli.get_string("--prodigal-bin", "prodigal");

    int threads = 0;
    if (!optional_int(cli, "--threads", threads, err)) return false;
    config.threads = resolve_threads(threads);

    config.tmp_dir = cli.get_string("--tmp", config.results_dir + "/tmp_files");
    config.info_file = cli.get_string("--info");
    return true;
}

bool validate_annotate_config(const AnnotateConfig& config, StageError& err) {
    if (!validate_backend_options(config.backend, config.backend_options, err))
        return false;

    if (!is_valid_name_prefix(config.naming.prefix)) {
        err.set(ErrorKind::kConfig, "-n must be " + std::to_string(PREFIX_LENGTH) +
                                    " alphanumeric characters, got '" +
                                    config.naming.prefix + "'");
        return false;
    }
    if (!config.naming.date.empty() && !is_valid_name_date(config.naming.date)) {
        err.set(ErrorKind::kConfig, "--date must be " + std::to_string(DATE_LENGTH) +
                                    " characters without '.' or spaces, got '" +
                                    config.naming.date + "'");
        return false;
    }
    if (config.naming.min_width < 0) {
        err.set(ErrorKind::kConfig, "--name-width must be >= 0");
        return false;
    }
    if (config.cut_n < 0) {
        err.set(ErrorKind::kConfig, "--cutN must be >= 0");
        return false;
    }
    if (config.threads < 1) {
        err.set(ErrorKind::kConfig, "--threads must be >= 1");
        return false;
    }
    if (!dir_exists(config.genome_dir)) {
        err.set(ErrorKind::kConfig, "genome directory not found: " + config.genome_dir);
        return false;
    }
    if (!file_exists(config.list_file)) {
        err.set(ErrorKind::kConfig, "list file not found: " + config.list_file);
        return false;
    }
    if (!config.info_file.empty()) {
        if (config.cut_n != DEFAULT_CUT_N) {
            err.set(ErrorKind::kConfig,
                    "--cutN cannot be used with --info: sequences listed in an "
                    "info file are used as is");
            return false;
        }
        if (!file_exists(config.info_file)) {
            err.set(ErrorKind::kConfig, "info file not found: " + config.info_file);
            return false;
        }
    }

    if (!config.qc_only) {
        std::string resolved;
        const std::string& exe = engine_executable(config.backend, config.backend_options);
        if (!find_executable(exe, resolved)) {
            err.set(ErrorKind::kConfig, std::string(backend_name(config.backend)) +
                                        " executable not found: " + exe);
            return false;
        }
    }
    return true;
}

std::string list_name(const AnnotateConfig& config) {
    return file_stem(config.list_file);
}

} // namespace panannot
