#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "backend_config.hpp"

namespace fs = std::filesystem;

// Raised when a required scheduler command is missing and the user declined
// to fall back to test mode. Nothing must be submitted after this.
class MissingCommandError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// run_script holds literal text (or a template path) while Unprepared and the
// written script path once Prepared.
enum class ScriptState {
    Unprepared,
    Prepared,
};

class Backend {
public:
    explicit Backend(BackendConfig config = {});
    virtual ~Backend() = default;

    Backend(const Backend&) = default;
    Backend& operator=(const Backend&) = default;

    BackendKind kind() const { return kind_; }
    const BackendConfig& config() const { return config_; }
    const std::string& name() const { return config_.name; }
    const std::string& run_script() const { return config_.run_script; }
    const std::string& run_args() const { return config_.run_args; }
    const std::string& options_identifier() const { return options_identifier_; }
    const std::vector<std::string>& required_commands() const { return commands_; }
    ScriptState script_state() const { return script_state_; }
    const std::string& container_runtime() const { return container_runtime_; }

    void set_name(const std::string& name) { config_.name = name; }
    void set_run_args(const std::string& args) { config_.run_args = args; }
    void set_container_runtime(const std::string& runtime) { container_runtime_ = runtime; }

    // New literal script text (or template path). Resets the script to Unprepared.
    void set_run_script(const std::string& script);

    // Fill unset fields from `other` (a defaults/template backend of the same kind).
    // Set fields are never overwritten. nullptr is a no-op.
    // A kind mismatch is logged and returned as an error; nothing changes.
    Result<void> sync(const Backend* other);

    // Resolve, finalize and write the run script to <output_dir>/<name>.
    // Returns the written path, which also becomes run_script().
    // Fails if the script is already Prepared.
    Result<std::string> prepare_script(const fs::path& output_dir,
                                       const std::optional<std::string>& container_image = std::nullopt);

    // Verify required commands resolve on PATH. Skipped in test mode.
    // On a missing command the user may switch ctx to test mode; otherwise
    // MissingCommandError is thrown.
    void check_required_commands(RunContext& ctx) const;

    // Multi-line "key: value" dump of all fields
    std::string describe() const;

    // Scheduler operations. The base backend does nothing.
    virtual int submit() { return 0; }
    virtual int cancel() { return 0; }
    virtual int status() { return 0; }
    virtual int exitcode() { return 0; }

    // True if `command` resolves as an executable (probe only, never run).
    static bool command_exists(const std::string& command);

protected:
    Backend(BackendKind kind, std::string options_identifier,
            std::vector<std::string> commands, BackendConfig config);

    // Kind-specific option merge; `other` has the same kind as *this.
    virtual int sync_options(const Backend& other);

    // Kind-specific rows appended to describe()
    virtual void describe_options(std::vector<std::pair<std::string, std::string>>& rows) const;

private:
    // Copy a template file to `out_path` and return its contents.
    Result<std::string> inline_template(const fs::path& template_path,
                                        const fs::path& out_path) const;

    BackendKind kind_ = BackendKind::Base;
    std::string options_identifier_;
    std::vector<std::string> commands_;
    BackendConfig config_;
    ScriptState script_state_ = ScriptState::Unprepared;
    std::string container_runtime_ = DEFAULT_CONTAINER_RUNTIME;
};
