#include "job_file.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

static Job parse_job(const YAML::Node& node) {
    Job job;
    job.name = node["name"].as<std::string>("");
    if (job.name.empty()) {
        throw std::runtime_error("job entry without a name");
    }

    std::string status = node["status"].as<std::string>("configured");
    auto parsed = parse_job_status(status);
    if (!parsed) {
        throw std::runtime_error(fmt::format("job '{}': unknown status '{}'", job.name, status));
    }
    job.status = *parsed;

    std::string type = node["type"].as<std::string>("batch");
    if (type == "local") {
        job.type = JobType::Local;
    } else if (type == "batch") {
        job.type = JobType::Batch;
    } else {
        throw std::runtime_error(fmt::format("job '{}': unknown type '{}'", job.name, type));
    }

    auto tags = node["tags"];
    if (tags) {
        if (tags.IsScalar()) {
            job.tags.insert(tags.as<std::string>());
        } else if (tags.IsSequence()) {
            for (const auto& t : tags) job.tags.insert(t.as<std::string>());
        }
    }
    return job;
}

Result<std::vector<Job>> load_job_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<std::vector<Job>>::Err("Job file not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        std::vector<Job> jobs;
        if (root["jobs"] && root["jobs"].IsSequence()) {
            for (const auto& node : root["jobs"]) {
                jobs.push_back(parse_job(node));
            }
        }
        return Result<std::vector<Job>>::Ok(std::move(jobs));
    } catch (const std::exception& e) {
        return Result<std::vector<Job>>::Err(std::string("Failed to parse job file: ") + e.what());
    }
}

Result<int> refresh_statuses(JobCollection& jobs, const fs::path& path) {
    auto loaded = load_job_file(path);
    if (loaded.is_err()) {
        return Result<int>::Err(loaded.error);
    }

    int changed = 0;
    for (const auto& job : loaded.value) {
        const Job* known = jobs.find(job.name);
        if (!known || known->status == job.status) continue;
        auto r = jobs.set_status(job.name, job.status);
        if (r.is_err()) return Result<int>::Err(r.error);
        changed++;
    }
    return Result<int>::Ok(changed);
}
