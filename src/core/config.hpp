#pragma once

#include <string>
#include <optional>
#include <map>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"
#include <backends/backend_factory.hpp>

namespace fs = std::filesystem;

fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
bool project_config_exists(const fs::path& dir = fs::current_path());

struct PrinterConfig {
    int verbosity = BASE_VERBOSITY;
    ReportMode mode = ReportMode::Line;
    int poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
};

class Config {
public:
    // Load global config (per-kind backend defaults, printer, mode)
    static Result<Config> load_global(const fs::path& path = get_global_config_path());

    // Load project config from <dir>/batchy.yaml (the job's backend, script dir, image)
    static Result<Config> load_project(const fs::path& dir = fs::current_path());

    // Load both and combine (project overrides global where both are set)
    static Result<Config> load(const fs::path& project_dir = fs::current_path(),
                               const fs::path& global_path = get_global_config_path());

    ExecutionMode mode() const { return mode_; }
    const PrinterConfig& printer() const { return printer_; }
    const fs::path& script_dir() const { return script_dir_; }
    const std::optional<std::string>& container_image() const { return container_image_; }
    const std::string& container_runtime() const { return container_runtime_; }
    const std::optional<BackendSpec>& backend() const { return backend_; }
    const fs::path& project_dir() const { return project_dir_; }

    // Defaults for a backend kind, nullptr if none are configured
    const BackendSpec* defaults_for(BackendKind kind) const;

    Config() = default;

private:
    ExecutionMode mode_ = ExecutionMode::Normal;
    PrinterConfig printer_;
    fs::path script_dir_ = DEFAULT_SCRIPT_DIR;
    std::optional<std::string> container_image_;
    std::string container_runtime_;
    std::map<BackendKind, BackendSpec> backend_defaults_;
    std::optional<BackendSpec> backend_;
    fs::path project_dir_;
};
