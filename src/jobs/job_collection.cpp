#include "job_collection.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Configured: return "CONFIGURED";
        case JobStatus::Running:    return "RUNNING";
        case JobStatus::Success:    return "SUCCESS";
        case JobStatus::Failed:     return "FAILED";
        case JobStatus::Cancelled:  return "CANCELLED";
    }
    return "UNKNOWN";
}

std::optional<JobStatus> parse_job_status(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    for (auto s : {JobStatus::Configured, JobStatus::Running, JobStatus::Success,
                   JobStatus::Failed, JobStatus::Cancelled}) {
        if (upper == job_status_name(s)) return s;
    }
    return std::nullopt;
}

Result<void> JobCollection::add(Job job) {
    if (job.name.empty()) {
        return Result<void>::Err("Job has no name");
    }
    if (jobs_.count(job.name)) {
        return Result<void>::Err(fmt::format("Job '{}' already exists", job.name));
    }

    by_status_[job.status].insert(job.name);
    for (const auto& tag : job.tags) by_tag_[tag].insert(job.name);
    if (job.is_local()) local_.insert(job.name);

    order_.push_back(job.name);
    std::string name = job.name;
    jobs_.emplace(std::move(name), std::move(job));
    return Result<void>::Ok();
}

Result<void> JobCollection::set_status(const std::string& name, JobStatus status) {
    auto it = jobs_.find(name);
    if (it == jobs_.end()) {
        return Result<void>::Err(fmt::format("No job named '{}'", name));
    }

    Job& job = it->second;
    if (job.status == status) return Result<void>::Ok();

    by_status_[job.status].erase(name);
    job.status = status;
    by_status_[status].insert(name);
    return Result<void>::Ok();
}

const Job* JobCollection::find(const std::string& name) const {
    auto it = jobs_.find(name);
    return it == jobs_.end() ? nullptr : &it->second;
}

std::vector<const Job*> JobCollection::jobs() const {
    std::vector<const Job*> out;
    out.reserve(order_.size());
    for (const auto& name : order_) out.push_back(&jobs_.at(name));
    return out;
}

size_t JobCollection::count_status(JobStatus status) const {
    auto it = by_status_.find(status);
    return it == by_status_.end() ? 0 : it->second.size();
}

size_t JobCollection::count_tag(const std::string& tag) const {
    auto it = by_tag_.find(tag);
    return it == by_tag_.end() ? 0 : it->second.size();
}

std::vector<std::string> JobCollection::tags() const {
    std::vector<std::string> out;
    for (const auto& [tag, names] : by_tag_) {
        if (!names.empty()) out.push_back(tag);
    }
    return out;
}

std::vector<const Job*> JobCollection::filter(const JobQuery& query) const {
    std::vector<const Job*> out;
    for (const auto& name : order_) {
        const Job& job = jobs_.at(name);
        if (!query.states.empty() && !query.states.count(job.status)) continue;
        bool has_tags = std::all_of(query.tags.begin(), query.tags.end(),
                                    [&](const std::string& t) { return job.tags.count(t) > 0; });
        if (!has_tags) continue;
        out.push_back(&job);
    }
    return out;
}

size_t JobCollection::count(const JobQuery& query) const {
    if (query.tags.empty()) {
        if (query.states.empty()) return size();
        size_t n = 0;
        for (auto status : query.states) n += count_status(status);
        return n;
    }

    // Walk the smallest tag index, check the rest per job
    const std::set<std::string>* smallest = nullptr;
    for (const auto& tag : query.tags) {
        auto it = by_tag_.find(tag);
        if (it == by_tag_.end()) return 0;
        if (!smallest || it->second.size() < smallest->size()) smallest = &it->second;
    }

    size_t n = 0;
    for (const auto& name : *smallest) {
        const Job& job = jobs_.at(name);
        if (!query.states.empty() && !query.states.count(job.status)) continue;
        bool has_tags = std::all_of(query.tags.begin(), query.tags.end(),
                                    [&](const std::string& t) { return job.tags.count(t) > 0; });
        if (has_tags) n++;
    }
    return n;
}
