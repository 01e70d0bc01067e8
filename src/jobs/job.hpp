#pragma once

#include <string>
#include <set>
#include <optional>

enum class JobStatus {
    Configured,
    Running,
    Success,
    Failed,
    Cancelled,
};

enum class JobType {
    Local,
    Batch,
};

const char* job_status_name(JobStatus status);
std::optional<JobStatus> parse_job_status(const std::string& name);

struct Job {
    std::string name;
    JobStatus status = JobStatus::Configured;
    JobType type = JobType::Batch;
    std::set<std::string> tags;

    bool is_local() const { return type == JobType::Local; }
    // Cancelled jobs count as failed in summaries
    bool is_failed() const { return status == JobStatus::Failed || status == JobStatus::Cancelled; }
};
