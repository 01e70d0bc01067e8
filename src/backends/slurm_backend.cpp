#include "slurm_backend.hpp"
#include <sstream>

SlurmBackend::SlurmBackend(BackendConfig config, SlurmOptions options)
    : Backend(BackendKind::Slurm, SLURM_OPTIONS_ID,
              {"sbatch", "scancel", "squeue", "sacct"}, std::move(config)),
      options_(std::move(options)) {}

int SlurmBackend::sync_options(const Backend& other) {
    const auto& o = static_cast<const SlurmBackend&>(other);
    return merge_config(options_, o.options_);
}

std::vector<std::string> SlurmBackend::submit_args() const {
    std::vector<std::string> args;
    auto add = [&](const char* flag, const std::string& value) {
        if (!value.empty()) args.push_back(std::string(flag) + "=" + value);
    };

    add("--job-name", name());
    add("--partition", options_.partition);
    add("--clusters", options_.clusters);
    add("--qos", options_.qos);
    add("--exclude", options_.exclude);
    add("--time", options_.time);
    add("--mem", options_.mem);
    add("--export", options_.export_env);

    // run_args are passed through verbatim, split on whitespace
    std::istringstream iss(run_args());
    std::string tok;
    while (iss >> tok) args.push_back(tok);

    if (!run_script().empty()) args.push_back(run_script());
    return args;
}

void SlurmBackend::describe_options(std::vector<std::pair<std::string, std::string>>& rows) const {
    rows.emplace_back("partition", options_.partition);
    rows.emplace_back("clusters", options_.clusters);
    rows.emplace_back("qos", options_.qos);
    rows.emplace_back("exclude", options_.exclude);
    rows.emplace_back("time", options_.time);
    rows.emplace_back("mem", options_.mem);
    rows.emplace_back("export", options_.export_env);
}
