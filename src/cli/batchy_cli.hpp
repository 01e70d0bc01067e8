#pragma once

#include <string>
#include <memory>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <backends/backend.hpp>

class BatchyCLI {
public:
    explicit BatchyCLI(std::filesystem::path project_dir = std::filesystem::current_path());

    // Sync the project backend with its defaults, write the run script and
    // verify the scheduler tools. `image` overrides the configured container image.
    int run_prepare(const std::optional<std::string>& image = std::nullopt);

    // Only verify the scheduler tools of the project backend.
    int run_check();

    // Print the synced backend configuration.
    int run_describe();

    // Report progress of the jobs listed in a status file until none is pending.
    int run_watch(const std::filesystem::path& job_file);

private:
    bool require_config();
    std::unique_ptr<Backend> build_backend();

    std::filesystem::path project_dir_;
    std::optional<Config> config_;
    RunContext ctx_;
};
