#include "annotate/annotate_config.hpp"
#include "annotate/run_coordinator.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "core/version.hpp"
#include "util/cancellation.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <set>
#include <string>

using namespace panannot;

static CancellationToken g_cancel;

static void signal_handler(int /*sig*/) {
    g_cancel.request();
}

static const std::set<std::string> kFlags = {
    "--prodigal", "--small", "-F", "--force", "-Q", "--strict-thresholds",
    "-v", "--verbose", "-q", "--quiet", "-h", "--help", "--version",
};

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s annotate [options]\n"
        "\n"
        "Quality-filter draft genomes, give them systematic names and annotate\n"
        "them with Prokka or Prodigal.\n"
        "\n"
        "Required:\n"
        "  -d <dir>                 Directory containing the genome sequences\n"
        "  -r <dir>                 Results directory\n"
        "  -l <file>                List of genomes (one per line, relative to -d)\n"
        "                           Optional per-genome ':: PREFIX[.DATE]' suffix\n"
        "  -n <prefix>              Name prefix, %d alphanumeric characters\n"
        "                           (optional with -Q, default: %s)\n"
        "  --l90 <int>              Maximum L90 of an accepted genome\n"
        "  --nbcont <int>           Maximum number of contigs (0-%d)\n"
        "\n"
        "Options:\n"
        "  --prodigal               Annotate with Prodigal instead of Prokka\n"
        "  --small                  Prodigal metagenomic mode (-p meta), for small\n"
        "                           genomes; requires --prodigal\n"
        "  --date <str>             %d-character date field of the names (e.g. 0519)\n"
        "  --cutN <int>             Split contigs at runs of >= N 'N' (default: %d, 0 = off)\n"
        "  --info <file>            Take size, contig count and L90 from this file\n"
        "                           (columns orig_name, gsize, nb_conts, L90) instead\n"
        "                           of analysing the genomes; sequences are used as is\n"
        "  --threads <int>          Genomes annotated in parallel (default: all cores)\n"
        "  --cpus <int>             Threads given to each Prokka run (default: 1)\n"
        "  --tmp <dir>              Engine work directory (default: <results>/tmp_files)\n"
        "  -F, --force              Rebuild existing results\n"
        "  -Q                       Quality control only, no annotation\n"
        "  --order <list|quality>   Ordinal order within a prefix (default: list)\n"
        "  --name-width <int>       Minimum width of the ordinal (default: 0)\n"
        "  --strict-thresholds      Reject genomes equal to --l90 / --nbcont\n"
        "  --prokka-bin <path>      Prokka executable (default: prokka)\n"
        "  --prodigal-bin <path>    Prodigal executable (default: prodigal)\n"
        "  -v, --verbose            Verbose logging\n"
        "  -q, --quiet              No console output (log file is still written)\n"
        "  -h, --help               Show this help\n"
        "  --version                Show version\n"
        "\n"
        "Exit status: %d = run completed, %d = configuration error, %d = cancelled\n",
        prog, PREFIX_LENGTH, QC_ONLY_PREFIX, MAX_NBCONT_LIMIT, DATE_LENGTH,
        DEFAULT_CUT_N, EXIT_OK, EXIT_CONFIG_ERROR, EXIT_CANCELLED);
}

static int run_annotate(const CliParser& cli) {
    Logger logger = make_logger(cli);

    AnnotateConfig config;
    StageError err;
    if (!parse_annotate_config(cli, config, err) ||
        !validate_annotate_config(config, err)) {
        logger.error("%s: %s", error_kind_name(err.kind), err.message.c_str());
        return EXIT_CONFIG_ERROR;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.results_dir, ec);
    if (ec) {
        logger.error("%s: cannot create %s: %s", error_kind_name(ErrorKind::kConfig),
                     config.results_dir.c_str(), ec.message().c_str());
        return EXIT_CONFIG_ERROR;
    }
    std::string log_path = config.results_dir + "/panannot-annotate_" +
                           list_name(config) + ".log";
    if (!logger.open_file(log_path)) {
        logger.warn("cannot open log file %s", log_path.c_str());
    }

    logger.info("panannot %s annotate", PANANNOT_VERSION);
    logger.info("Genomes: %s, results: %s", config.genome_dir.c_str(),
                config.results_dir.c_str());
    logger.info("Thresholds: L90 %s %u, contigs %s %u",
                config.thresholds.inclusive ? "<=" : "<", config.thresholds.max_l90,
                config.thresholds.inclusive ? "<=" : "<", config.thresholds.max_contigs);
    if (!config.qc_only) {
        logger.info("Engine: %s%s", backend_name(config.backend),
                    config.backend_options.small ? " (small genomes)" : "");
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    RunCoordinator coordinator(config, logger, &g_cancel);
    RunSummary summary;
    if (!coordinator.run(summary, err)) {
        logger.error("%s: %s", error_kind_name(err.kind), err.message.c_str());
        return EXIT_CONFIG_ERROR;
    }

    if (summary.status == RunStatus::kCancelled) {
        logger.warn("Run cancelled; completed results were kept");
        return EXIT_CANCELLED;
    }
    return EXIT_OK;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv, kFlags);

    if (check_version(cli, "panannot")) return EXIT_OK;

    const auto& pos = cli.positional();
    if (cli.has("-h") || cli.has("--help")) {
        print_usage(cli.program().c_str());
        return EXIT_OK;
    }
    if (pos.empty()) {
        print_usage(cli.program().c_str());
        return EXIT_CONFIG_ERROR;
    }
    if (pos[0] != "annotate") {
        std::fprintf(stderr, "Error: unknown command '%s'\n", pos[0].c_str());
        print_usage(cli.program().c_str());
        return EXIT_CONFIG_ERROR;
    }
    if (pos.size() > 1) {
        std::fprintf(stderr, "Error: unexpected argument '%s'\n", pos[1].c_str());
        return EXIT_CONFIG_ERROR;
    }
    return run_annotate(cli);
}
