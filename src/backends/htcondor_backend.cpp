#include "htcondor_backend.hpp"
#include <fmt/format.h>

HTCondorBackend::HTCondorBackend(BackendConfig config, HTCondorOptions options)
    : Backend(BackendKind::HTCondor, "",
              {"condor_submit", "condor_rm", "condor_q", "condor_history"}, std::move(config)),
      options_(std::move(options)) {}

int HTCondorBackend::sync_options(const Backend& other) {
    const auto& o = static_cast<const HTCondorBackend&>(other);
    return merge_config(options_, o.options_);
}

std::string HTCondorBackend::submit_description() const {
    std::string out;
    out += fmt::format("universe = {}\n", options_.universe.empty() ? "vanilla" : options_.universe);
    out += fmt::format("executable = {}\n", run_script());
    if (!run_args().empty()) out += fmt::format("arguments = {}\n", run_args());
    if (!options_.requirements.empty()) out += fmt::format("requirements = {}\n", options_.requirements);
    if (!options_.request_memory.empty()) out += fmt::format("request_memory = {}\n", options_.request_memory);
    out += fmt::format("output = {}.out\n", name());
    out += fmt::format("error = {}.err\n", name());
    out += fmt::format("log = {}.log\n", name());
    out += "queue\n";
    return out;
}

void HTCondorBackend::describe_options(std::vector<std::pair<std::string, std::string>>& rows) const {
    rows.emplace_back("universe", options_.universe);
    rows.emplace_back("requirements", options_.requirements);
    rows.emplace_back("request_memory", options_.request_memory);
}
