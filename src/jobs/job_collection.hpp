#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <core/types.hpp>
#include "job.hpp"

// Filter for JobCollection::filter(). Empty sets match everything.
struct JobQuery {
    std::set<std::string> tags;     // job must carry all of these
    std::set<JobStatus> states;     // job status must be one of these
};

// Jobs in insertion order, with status, tag and local indices kept in step
// so that counts only visit the jobs of the smallest matching index. Not thread-safe.
class JobCollection {
public:
    Result<void> add(Job job);
    Result<void> set_status(const std::string& name, JobStatus status);

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }
    const Job* find(const std::string& name) const;

    // Jobs in insertion order
    std::vector<const Job*> jobs() const;

    size_t count_status(JobStatus status) const;
    size_t count_tag(const std::string& tag) const;
    size_t local_count() const { return local_.size(); }

    // Tags in sorted order
    std::vector<std::string> tags() const;

    std::vector<const Job*> filter(const JobQuery& query) const;
    size_t count(const JobQuery& query) const;

private:
    std::vector<std::string> order_;
    std::map<std::string, Job> jobs_;
    std::map<JobStatus, std::set<std::string>> by_status_;
    std::map<std::string, std::set<std::string>> by_tag_;
    std::set<std::string> local_;
};
