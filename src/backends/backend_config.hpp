#pragma once

#include <string>
#include <vector>
#include <optional>

enum class BackendKind {
    Base,
    Slurm,
    HTCondor,
    Local,
};

const char* backend_kind_name(BackendKind kind);

// Accepts "base", "slurm", "htcondor" (or "condor"), "local". Case-insensitive.
std::optional<BackendKind> parse_backend_kind(const std::string& name);

// Fields shared by every backend kind. All of them take part in sync().
struct BackendConfig {
    std::string name;          // output script filename
    std::string run_script;    // script text, template path, or prepared script path
    std::string run_args;      // opaque, backend-specific
};

// sbatch options (empty = let the cluster decide)
struct SlurmOptions {
    std::string partition;
    std::string clusters;
    std::string qos;
    std::string exclude;
    std::string time;
    std::string mem;
    std::string export_env;
};

struct HTCondorOptions {
    std::string universe;
    std::string requirements;
    std::string request_memory;
};

// ── Prefer-set merge ────────────────────────────────────────
// A field counts as unset when it holds its type's empty value.

inline bool is_unset(const std::string& v) { return v.empty(); }
inline bool is_unset(int v) { return v == 0; }
inline bool is_unset(bool v) { return !v; }
template <typename T>
bool is_unset(const std::vector<T>& v) { return v.empty(); }
template <typename T>
bool is_unset(const std::optional<T>& v) { return !v.has_value(); }

// Fill `mine` from `theirs` only if `mine` is unset. Returns true if `mine` changed.
template <typename T>
bool prefer_set(T& mine, const T& theirs) {
    if (!is_unset(mine) || is_unset(theirs)) return false;
    mine = theirs;
    return true;
}

// Per-struct merges; each returns the number of fields filled in.
int merge_config(BackendConfig& mine, const BackendConfig& theirs);
int merge_config(SlurmOptions& mine, const SlurmOptions& theirs);
int merge_config(HTCondorOptions& mine, const HTCondorOptions& theirs);
