#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / ".batchy";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "batchy.yaml";
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

static ExecutionMode parse_mode(const YAML::Node& node) {
    std::string mode = lowercase(node.as<std::string>("normal"));
    if (mode == "test") return ExecutionMode::Test;
    if (mode != "normal") {
        throw std::runtime_error(fmt::format("unknown mode '{}' (expected normal or test)", mode));
    }
    return ExecutionMode::Normal;
}

// Keys present in `node` override `printer`; absent keys keep its values.
static PrinterConfig parse_printer_config(const YAML::Node& node, PrinterConfig printer = {}) {
    if (node["verbosity"]) printer.verbosity = node["verbosity"].as<int>();
    if (node["poll_interval_ms"]) printer.poll_interval_ms = node["poll_interval_ms"].as<int>();
    if (!node["mode"]) return printer;

    std::string mode = lowercase(node["mode"].as<std::string>());
    if (mode == "bars" || mode == "bar") {
        printer.mode = ReportMode::Bars;
    } else if (mode == "manual") {
        printer.mode = ReportMode::ManualLine;
    } else if (mode == "line") {
        printer.mode = ReportMode::Line;
    } else {
        throw std::runtime_error(fmt::format("unknown printer mode '{}'", mode));
    }
    return printer;
}

// Backend block: shared fields plus the options of its kind.
// Keys for other kinds are ignored.
static BackendSpec parse_backend_spec(const YAML::Node& node, BackendKind kind) {
    BackendSpec spec;
    spec.kind = kind;
    spec.config.name = node["name"].as<std::string>("");
    spec.config.run_script = node["run_script"].as<std::string>("");
    spec.config.run_args = node["run_args"].as<std::string>("");
    spec.container_runtime = node["container_runtime"].as<std::string>("");

    if (kind == BackendKind::Slurm) {
        spec.slurm.partition = node["partition"].as<std::string>("");
        spec.slurm.clusters = node["clusters"].as<std::string>("");
        spec.slurm.qos = node["qos"].as<std::string>("");
        spec.slurm.exclude = node["exclude"].as<std::string>("");
        spec.slurm.time = node["time"].as<std::string>("");
        spec.slurm.mem = node["mem"].as<std::string>("");
        spec.slurm.export_env = node["export"].as<std::string>("");
    } else if (kind == BackendKind::HTCondor) {
        spec.htcondor.universe = node["universe"].as<std::string>("");
        spec.htcondor.requirements = node["requirements"].as<std::string>("");
        spec.htcondor.request_memory = node["request_memory"].as<std::string>("");
    }
    return spec;
}

static BackendKind require_kind(const std::string& name) {
    auto kind = parse_backend_kind(name);
    if (!kind) {
        throw std::runtime_error(fmt::format("unknown backend type '{}'", name));
    }
    return *kind;
}

// Project keys override whatever is already in `config`.
static void apply_project_keys(const YAML::Node& root, PrinterConfig& printer,
                               ExecutionMode& mode, fs::path& script_dir,
                               std::optional<std::string>& image, std::string& runtime,
                               std::optional<BackendSpec>& backend) {
    if (root["mode"]) mode = parse_mode(root["mode"]);
    if (root["printer"] && root["printer"].IsMap()) printer = parse_printer_config(root["printer"], printer);
    if (root["script_dir"]) script_dir = root["script_dir"].as<std::string>();
    if (root["container_image"]) image = root["container_image"].as<std::string>();
    if (root["container_runtime"]) runtime = root["container_runtime"].as<std::string>();

    if (root["backend"] && root["backend"].IsMap()) {
        const auto& node = root["backend"];
        BackendKind kind = require_kind(node["type"].as<std::string>("base"));
        backend = parse_backend_spec(node, kind);
    }
}

const BackendSpec* Config::defaults_for(BackendKind kind) const {
    auto it = backend_defaults_.find(kind);
    return it == backend_defaults_.end() ? nullptr : &it->second;
}

Result<Config> Config::load_global(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Global config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.mode_ = parse_mode(root["mode"]);
        config.printer_ = parse_printer_config(root["printer"] ? root["printer"] : YAML::Node());
        config.container_runtime_ = root["container_runtime"].as<std::string>("");

        if (root["backends"] && root["backends"].IsMap()) {
            for (const auto& kv : root["backends"]) {
                BackendKind kind = require_kind(kv.first.as<std::string>());
                config.backend_defaults_[kind] = parse_backend_spec(kv.second, kind);
            }
        }

        config.project_dir_ = fs::current_path();
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse global config: ") + e.what());
    }
}

Result<Config> Config::load_project(const fs::path& dir) {
    if (!project_config_exists(dir)) {
        return Result<Config>::Err("Project config not found at " + get_project_config_path(dir).string());
    }

    try {
        YAML::Node root = YAML::LoadFile(get_project_config_path(dir).string());

        Config config;
        apply_project_keys(root, config.printer_, config.mode_, config.script_dir_,
                           config.container_image_, config.container_runtime_, config.backend_);
        config.project_dir_ = dir;
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse project config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& project_dir, const fs::path& global_path) {
    // Global config is optional here; built-in defaults apply without it
    Config config;
    if (fs::exists(global_path)) {
        auto global_result = load_global(global_path);
        if (global_result.is_err()) {
            return global_result;
        }
        config = global_result.value;
    }
    config.project_dir_ = project_dir;

    if (project_config_exists(project_dir)) {
        try {
            YAML::Node root = YAML::LoadFile(get_project_config_path(project_dir).string());
            apply_project_keys(root, config.printer_, config.mode_, config.script_dir_,
                               config.container_image_, config.container_runtime_, config.backend_);
        } catch (const std::exception& e) {
            return Result<Config>::Err(std::string("Failed to parse project config: ") + e.what());
        }
    }

    // Relative script dirs are relative to the project
    if (config.script_dir_.is_relative()) {
        config.script_dir_ = project_dir / config.script_dir_;
    }

    // A global runtime applies unless the backend names its own
    if (config.backend_ && config.backend_->container_runtime.empty()) {
        config.backend_->container_runtime = config.container_runtime_;
    }

    return Result<Config>::Ok(config);
}
