#include "backend.hpp"
#include "script_guard.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

Backend::Backend(BackendConfig config)
    : Backend(BackendKind::Base, "", {}, std::move(config)) {}

Backend::Backend(BackendKind kind, std::string options_identifier,
                 std::vector<std::string> commands, BackendConfig config)
    : kind_(kind),
      options_identifier_(std::move(options_identifier)),
      commands_(std::move(commands)),
      config_(std::move(config)) {}

void Backend::set_run_script(const std::string& script) {
    config_.run_script = script;
    script_state_ = ScriptState::Unprepared;
}

// ── sync ─────────────────────────────────────────────────────

Result<void> Backend::sync(const Backend* other) {
    if (!other) return Result<void>::Ok();

    if (other->kind() != kind_) {
        std::string msg = fmt::format(
            "BackendMismatch: ({}) backend kind {} does not match kind {} of sync object",
            config_.name, backend_kind_name(kind_), backend_kind_name(other->kind()));
        batchy_log(msg);
        return Result<void>::Err(msg);
    }

    int filled = merge_config(config_, other->config_);
    filled += sync_options(*other);
    batchy_log(fmt::format("({}) synchronised {} option(s) from {}",
                           config_.name, filled, other->name()));
    return Result<void>::Ok();
}

int Backend::sync_options(const Backend&) {
    return 0;
}

// ── Script preparation ───────────────────────────────────────

Result<std::string> Backend::inline_template(const fs::path& template_path,
                                             const fs::path& out_path) const {
    std::error_code ec;
    if (!fs::equivalent(template_path, out_path, ec)) {
        fs::copy_file(template_path, out_path, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Result<std::string>::Err(fmt::format(
                "({}) failed to copy run script template {} to {}: {}",
                config_.name, template_path.string(), out_path.string(), ec.message()));
        }
    }

    std::ifstream in(out_path);
    if (!in) {
        return Result<std::string>::Err(fmt::format(
            "({}) cannot read run script {}", config_.name, out_path.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

Result<std::string> Backend::prepare_script(const fs::path& output_dir,
                                            const std::optional<std::string>& container_image) {
    if (script_state_ == ScriptState::Prepared) {
        return Result<std::string>::Err(fmt::format(
            "({}) run script already prepared at {}; set new script text first",
            config_.name, config_.run_script));
    }
    if (config_.name.empty()) {
        return Result<std::string>::Err("Backend has no name; cannot name the run script");
    }

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return Result<std::string>::Err(fmt::format(
            "Failed to create script directory {}: {}", output_dir.string(), ec.message()));
    }
    fs::path out_path = output_dir / config_.name;

    // An existing file is a template to inline; anything else is literal text
    std::string text = config_.run_script;
    if (!text.empty() && text.find('\n') == std::string::npos &&
        fs::is_regular_file(text, ec)) {
        auto inlined = inline_template(text, out_path);
        if (inlined.is_err()) {
            batchy_log(inlined.error);
            return inlined;
        }
        text = inlined.value;
    }

    if (!starts_with(text, "#!")) {
        text = std::string(DEFAULT_SHEBANG) + "\n" + text;
    }

    if (container_image) {
        text = inject_isolation_guard(text, options_identifier_,
                                      isolation_guard(*container_image, container_runtime_));
    }

    {
        std::ofstream out(out_path, std::ios::trunc);
        if (!out) {
            return Result<std::string>::Err(fmt::format(
                "({}) cannot open {} for writing", config_.name, out_path.string()));
        }
        out << text;
        if (!out) {
            return Result<std::string>::Err(fmt::format(
                "({}) failed to write {}", config_.name, out_path.string()));
        }
    }

    fs::permissions(out_path, fs::perms::owner_exec, fs::perm_options::add, ec);
    if (ec) {
        batchy_log(fmt::format("({}) could not mark {} executable: {}",
                               config_.name, out_path.string(), ec.message()));
    }

    config_.run_script = out_path.string();
    script_state_ = ScriptState::Prepared;
    batchy_log(fmt::format("({}) run script written to {}", config_.name, config_.run_script));
    return Result<std::string>::Ok(config_.run_script);
}

// ── Required commands ────────────────────────────────────────

bool Backend::command_exists(const std::string& command) {
    return platform::run_quiet("which", {command}) == 0;
}

void Backend::check_required_commands(RunContext& ctx) const {
    if (ctx.test_mode()) return;

    for (const auto& command : commands_) {
        if (command_exists(command)) continue;

        batchy_log(fmt::format("{} command not found: \"{}\"", backend_kind_name(kind_), command));
        if (ctx.decide && ctx.decide("Switch to test mode (batch submission will not work)")) {
            ctx.mode = ExecutionMode::Test;
            batchy_log("Switched to test mode");
            return;
        }
        throw MissingCommandError(fmt::format(
            "{} command not found: \"{}\"", backend_kind_name(kind_), command));
    }
}

// ── describe ─────────────────────────────────────────────────

void Backend::describe_options(std::vector<std::pair<std::string, std::string>>&) const {}

std::string Backend::describe() const {
    std::vector<std::pair<std::string, std::string>> rows = {
        {"name", config_.name},
        {"backend", backend_kind_name(kind_)},
        {"run_script", config_.run_script},
        {"run_args", config_.run_args},
    };
    describe_options(rows);

    std::string out;
    for (const auto& [key, value] : rows) {
        if (!out.empty()) out += "\n";
        out += fmt::format("{}: {}", key, value);
    }
    return out;
}
