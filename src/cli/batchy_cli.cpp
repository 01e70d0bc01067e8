#include "batchy_cli.hpp"
#include "theme.hpp"
#include "prompt.hpp"
#include "progress_reporter.hpp"
#include <backends/backend_factory.hpp>
#include <backends/slurm_backend.hpp>
#include <backends/htcondor_backend.hpp>
#include <jobs/job_collection.hpp>
#include <jobs/job_file.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

BatchyCLI::BatchyCLI(fs::path project_dir)
    : project_dir_(std::move(project_dir)) {
    ctx_.decide = prompt_decision;
}

bool BatchyCLI::require_config() {
    if (config_) return true;

    auto result = Config::load(project_dir_);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config_ = result.value;
    ctx_.mode = config_->mode();
    return true;
}

std::unique_ptr<Backend> BatchyCLI::build_backend() {
    if (!config_->backend()) {
        std::cout << theme::fail("No backend: section in " + get_project_config_path(project_dir_).string());
        return nullptr;
    }

    const BackendSpec& spec = *config_->backend();
    auto backend = make_backend(spec);

    // Per-kind defaults fill whatever the project left unset
    if (const BackendSpec* defaults = config_->defaults_for(spec.kind)) {
        auto templ = make_backend(*defaults);
        auto synced = backend->sync(templ.get());
        if (synced.is_err()) {
            std::cout << theme::fail(synced.error);
        }
    }
    return backend;
}

int BatchyCLI::run_prepare(const std::optional<std::string>& image) {
    if (!require_config()) return 1;
    auto backend = build_backend();
    if (!backend) return 1;

    std::optional<std::string> container_image = image ? image : config_->container_image();
    auto written = backend->prepare_script(config_->script_dir(), container_image);
    if (written.is_err()) {
        std::cout << theme::fail(written.error);
        return 1;
    }
    std::cout << theme::ok("Run script written to " + written.value);
    if (container_image) {
        std::cout << theme::info(fmt::format("Runs inside {} ({})", *container_image,
                                             backend->container_runtime()));
    }

    if (auto* condor = dynamic_cast<HTCondorBackend*>(backend.get())) {
        fs::path sub = fs::path(written.value).string() + ".sub";
        std::ofstream out(sub);
        if (!out) {
            std::cout << theme::fail("Cannot write submit description " + sub.string());
            return 1;
        }
        out << condor->submit_description();
        std::cout << theme::ok("Submit description written to " + sub.string());
    }

    backend->check_required_commands(ctx_);
    if (ctx_.test_mode()) {
        std::cout << theme::info("Test mode: batch submission disabled");
    }

    if (auto* slurm = dynamic_cast<SlurmBackend*>(backend.get())) {
        std::cout << theme::step("sbatch " + join(slurm->submit_args(), " "));
    }
    return 0;
}

int BatchyCLI::run_check() {
    if (!require_config()) return 1;
    auto backend = build_backend();
    if (!backend) return 1;

    backend->check_required_commands(ctx_);
    if (ctx_.test_mode()) {
        std::cout << theme::info("Test mode: required commands not checked");
    } else {
        std::cout << theme::ok(fmt::format("{} commands found", backend_kind_name(backend->kind())));
    }
    return 0;
}

int BatchyCLI::run_describe() {
    if (!require_config()) return 1;
    auto backend = build_backend();
    if (!backend) return 1;

    std::cout << theme::section("Backend");
    std::istringstream rows(backend->describe());
    std::string row;
    while (std::getline(rows, row)) {
        auto colon = row.find(": ");
        if (colon == std::string::npos) continue;
        std::string value = row.substr(colon + 2);
        std::cout << theme::kv(row.substr(0, colon), value.empty() ? theme::dim("-") : value);
    }
    std::cout << "\n";
    return 0;
}

// All jobs reached a final state
static bool all_finished(const JobCollection& jobs) {
    return jobs.count_status(JobStatus::Configured) == 0 &&
           jobs.count_status(JobStatus::Running) == 0;
}

int BatchyCLI::run_watch(const fs::path& job_file) {
    if (!require_config()) return 1;

    auto loaded = load_job_file(job_file);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return 1;
    }

    JobCollection jobs;
    for (auto& job : loaded.value) {
        auto added = jobs.add(std::move(job));
        if (added.is_err()) {
            std::cout << theme::fail(added.error);
            return 1;
        }
    }

    const auto& printer = config_->printer();
    ProgressReporter reporter(jobs, printer.mode, printer.verbosity);
    reporter.start();

    while (!all_finished(jobs)) {
        if (printer.mode == ReportMode::ManualLine) {
            std::string ignored;
            if (!std::getline(std::cin, ignored)) break;
        } else {
            platform::sleep_ms(printer.poll_interval_ms);
        }

        auto refreshed = refresh_statuses(jobs, job_file);
        if (refreshed.is_err()) {
            // File may be mid-rewrite; keep the last known statuses
            batchy_log("watch: " + refreshed.error);
        }
        reporter.update();
    }

    reporter.stop();
    return jobs.count_status(JobStatus::Failed) + jobs.count_status(JobStatus::Cancelled) > 0 ? 2 : 0;
}
