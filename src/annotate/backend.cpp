#include "annotate/backend.hpp"

namespace panannot {

bool validate_backend_options(BackendKind kind, const BackendOptions& opts,
                              StageError& err) {
    switch (kind) {
    case BackendKind::kProkka:
        if (opts.small) {
            err.set(ErrorKind::kUnsupportedOption,
                    "--small is only available with --prodigal");
            return false;
        }
        if (opts.cpus < 1) {
            err.set(ErrorKind::kConfig, "--cpus must be >= 1");
            return false;
        }
        return true;
    case BackendKind::kProdigal:
        return true;
    }
    err.set(ErrorKind::kConfig, "unknown backend");
    return false;
}

const std::string& engine_executable(BackendKind kind, const BackendOptions& opts) {
    switch (kind) {
    case BackendKind::kProdigal:
        return opts.prodigal_bin;
    case BackendKind::kProkka:
    default:
        return opts.prokka_bin;
    }
}

bool build_invocation(BackendKind kind, const std::string& name,
                      const std::string& work_dir, const BackendOptions& opts,
                      EngineInvocation& out, StageError& err) {
    if (!validate_backend_options(kind, opts, err)) return false;

    out = EngineInvocation{};
    out.kind = kind;
    out.work_dir = work_dir;
    out.input_fasta = work_dir + "/" + name + ".fna";
    out.log_path = work_dir + "/" + name + "-" + backend_name(kind) + ".log";

    const std::string& exe = engine_executable(kind, opts);
    switch (kind) {
    case BackendKind::kProkka: {
        std::string outdir = work_dir + "/out";
        out.gff_path = outdir + "/" + name + ".gff";
        out.faa_path = outdir + "/" + name + ".faa";
        out.ffn_path = outdir + "/" + name + ".ffn";
        out.argv = {exe,
                    "--outdir", outdir,
                    "--prefix", name,
                    "--locustag", name,
                    "--cpus", std::to_string(opts.cpus),
                    "--centre", "prokka",
                    "--force",
                    out.input_fasta};
        break;
    }
    case BackendKind::kProdigal:
        out.gff_path = work_dir + "/" + name + ".gff";
        out.faa_path = work_dir + "/" + name + ".faa";
        out.ffn_path = work_dir + "/" + name + ".ffn";
        out.argv = {exe,
                    "-i", out.input_fasta,
                    "-a", out.faa_path,
                    "-d", out.ffn_path,
                    "-f", "gff",
                    "-o", out.gff_path,
                    "-q"};
        if (opts.small) {
            out.argv.push_back("-p");
            out.argv.push_back("meta");
        }
        break;
    }
    return true;
}

std::string engine_option_signature(BackendKind kind, const BackendOptions& opts) {
    std::string sig = backend_name(kind);
    switch (kind) {
    case BackendKind::kProkka:
        sig += " --centre prokka";
        break;
    case BackendKind::kProdigal:
        if (opts.small) sig += " -p meta";
        break;
    }
    return sig;
}

std::string engine_work_dir(const std::string& tmp_dir, const std::string& name,
                            BackendKind kind) {
    return tmp_dir + "/" + name + "-" + backend_name(kind) + "Res";
}

} // namespace panannot
