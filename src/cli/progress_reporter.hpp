#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <chrono>
#include <iostream>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <jobs/job_collection.hpp>
#include "progress_bar.hpp"

// Reports progress of a job collection whose statuses change elsewhere.
// The caller drives it: start(), update() on every poll, stop() at the end.
//
// Bar counts never go backwards. A job that is retried after finishing
// leaves its bar where it was; only the postfix counts drop.
class ProgressReporter {
public:
    ProgressReporter(const JobCollection& jobs,
                     ReportMode mode = ReportMode::Line,
                     int verbosity = BASE_VERBOSITY,
                     std::ostream& out = std::cout);

    void start();
    void update();
    void stop();

    // Final summary, computed fresh from the collection
    std::string summary_string() const;
    void print_summary();

    // Single-line status used by the line modes (no '\r')
    std::string status_line() const;

    ReportMode mode() const { return mode_; }
    int verbosity() const { return verbosity_; }
    const std::vector<std::string>& tracked_tags() const { return tags_; }
    const std::vector<std::pair<std::string, ProgressBar>>& bars() const { return bars_; }

    // Displayed count of a bar ("all" or a tag); 0 if there is no such bar.
    size_t displayed(const std::string& bucket) const;

    // Set by stop()
    std::optional<double> elapsed_seconds() const { return elapsed_; }

private:
    struct BucketCounts {
        size_t success = 0;
        size_t failed = 0;
    };

    BucketCounts counts_for(const std::string& bucket) const;
    void setup_bars();
    void update_bars();
    void draw_bars();
    void print_line();

    const JobCollection& jobs_;
    ReportMode mode_;
    int verbosity_;
    std::ostream& out_;

    std::chrono::steady_clock::time_point start_time_;
    bool started_ = false;
    std::optional<double> elapsed_;

    // Tags tracked since start(); bars_[0] is "all", then one per tag
    std::vector<std::string> tags_;
    std::vector<std::pair<std::string, ProgressBar>> bars_;
    bool bars_drawn_ = false;
};
