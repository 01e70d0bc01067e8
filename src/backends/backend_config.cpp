#include "backend_config.hpp"
#include <algorithm>
#include <cctype>

const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::Base:     return "BASE";
        case BackendKind::Slurm:    return "SLURM";
        case BackendKind::HTCondor: return "HTCONDOR";
        case BackendKind::Local:    return "LOCAL";
    }
    return "UNKNOWN";
}

std::optional<BackendKind> parse_backend_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "base") return BackendKind::Base;
    if (lower == "slurm") return BackendKind::Slurm;
    if (lower == "htcondor" || lower == "condor") return BackendKind::HTCondor;
    if (lower == "local") return BackendKind::Local;
    return std::nullopt;
}

int merge_config(BackendConfig& mine, const BackendConfig& theirs) {
    int n = 0;
    n += prefer_set(mine.name, theirs.name);
    n += prefer_set(mine.run_script, theirs.run_script);
    n += prefer_set(mine.run_args, theirs.run_args);
    return n;
}

int merge_config(SlurmOptions& mine, const SlurmOptions& theirs) {
    int n = 0;
    n += prefer_set(mine.partition, theirs.partition);
    n += prefer_set(mine.clusters, theirs.clusters);
    n += prefer_set(mine.qos, theirs.qos);
    n += prefer_set(mine.exclude, theirs.exclude);
    n += prefer_set(mine.time, theirs.time);
    n += prefer_set(mine.mem, theirs.mem);
    n += prefer_set(mine.export_env, theirs.export_env);
    return n;
}

int merge_config(HTCondorOptions& mine, const HTCondorOptions& theirs) {
    int n = 0;
    n += prefer_set(mine.universe, theirs.universe);
    n += prefer_set(mine.requirements, theirs.requirements);
    n += prefer_set(mine.request_memory, theirs.request_memory);
    return n;
}
