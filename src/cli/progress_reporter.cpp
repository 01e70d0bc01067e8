#include "progress_reporter.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

static const char* ALL_BUCKET = "all";

ProgressReporter::ProgressReporter(const JobCollection& jobs, ReportMode mode,
                                   int verbosity, std::ostream& out)
    : jobs_(jobs), mode_(mode), verbosity_(verbosity), out_(out) {}

// ── Counting ─────────────────────────────────────────────────

ProgressReporter::BucketCounts ProgressReporter::counts_for(const std::string& bucket) const {
    BucketCounts c;
    if (bucket == ALL_BUCKET) {
        c.success = jobs_.count_status(JobStatus::Success);
        c.failed = jobs_.count_status(JobStatus::Failed);
    } else {
        c.success = jobs_.count({{bucket}, {JobStatus::Success}});
        c.failed = jobs_.count({{bucket}, {JobStatus::Failed}});
    }
    return c;
}

// ── Bars ─────────────────────────────────────────────────────

void ProgressReporter::setup_bars() {
    bars_.clear();
    bars_drawn_ = false;
    bars_.emplace_back(ALL_BUCKET, ProgressBar(ALL_BUCKET, jobs_.size()));

    tags_.clear();
    for (const auto& tag : jobs_.tags()) {
        if (tag == ALL_BUCKET) continue;  // reserved for the aggregate bar
        tags_.push_back(tag);
        bars_.emplace_back(tag, ProgressBar(tag, jobs_.count_tag(tag)));
    }
}

void ProgressReporter::update_bars() {
    for (auto& [bucket, bar] : bars_) {
        auto c = counts_for(bucket);
        size_t done = c.success + c.failed;
        // Retried jobs can make this negative; the bar never moves back
        if (done > bar.n()) bar.update(done - bar.n());
        bar.set_postfix(fmt::format("SUCCESS={}, FAILED={}", c.success, c.failed));
    }
    draw_bars();
}

void ProgressReporter::draw_bars() {
    if (bars_.empty()) return;
    std::string buf;
    // Move back to the first bar and redraw the whole block
    if (bars_drawn_) buf += fmt::format("\033[{}A", bars_.size());
    for (const auto& entry : bars_) {
        buf += "\r\033[K" + entry.second.render() + "\n";
    }
    out_ << buf << std::flush;
    bars_drawn_ = true;
}

size_t ProgressReporter::displayed(const std::string& bucket) const {
    for (const auto& [name, bar] : bars_) {
        if (name == bucket) return bar.n();
    }
    return 0;
}

// ── Status line ──────────────────────────────────────────────

std::string ProgressReporter::status_line() const {
    std::string line = "Jobs ";
    if (verbosity_ > BASE_VERBOSITY) {
        size_t n_running = jobs_.count_status(JobStatus::Running);
        size_t n_local = 0;
        for (const Job* job : jobs_.filter({{}, {JobStatus::Running}})) {
            if (job->is_local()) n_local++;
        }
        line += fmt::format("running (batch/local/all): ({}/{}/{}); ",
                            n_running - n_local, n_local, n_running);
    }
    line += fmt::format("(success/fail/all): ({}/{}/{})",
                        jobs_.count_status(JobStatus::Success),
                        jobs_.count_status(JobStatus::Failed),
                        jobs_.size());
    return line;
}

void ProgressReporter::print_line() {
    std::string line = status_line();
    if (mode_ == ReportMode::ManualLine) line += MANUAL_MODE_HINT;
    out_ << "\r" << line << std::flush;
}

// ── Lifecycle ────────────────────────────────────────────────

void ProgressReporter::start() {
    start_time_ = std::chrono::steady_clock::now();
    started_ = true;
    elapsed_.reset();

    if (mode_ != ReportMode::Bars) {
        print_line();
        return;
    }

    setup_bars();
    // Jobs that finished before we started (resumed runs)
    for (auto& [bucket, bar] : bars_) {
        bar.update(counts_for(bucket).success);
    }
    draw_bars();
}

void ProgressReporter::update() {
    if (mode_ == ReportMode::Bars) {
        update_bars();
    } else {
        print_line();
    }
}

void ProgressReporter::stop() {
    update();

    if (started_) {
        elapsed_ = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time_).count();
    }

    if (mode_ == ReportMode::Bars) {
        for (auto& entry : bars_) entry.second.close();
    }
    out_ << "\n";
    print_summary();
}

// ── Summary ──────────────────────────────────────────────────

std::string ProgressReporter::summary_string() const {
    struct Row {
        const char* label;
        size_t batch = 0;
        size_t local = 0;
    };
    Row all{"Jobs processed "};
    Row success{"     successful "};
    Row fail{"     failed "};

    std::vector<std::string> failed_names;
    for (const Job* job : jobs_.jobs()) {
        bool local = job->is_local();
        (local ? all.local : all.batch)++;

        if (job->status == JobStatus::Success) {
            (local ? success.local : success.batch)++;
        } else if (job->is_failed()) {
            (local ? fail.local : fail.batch)++;
            failed_names.push_back(job->name);
        }
    }

    std::string out;
    auto add_row = [&](const Row& r) {
        out += fmt::format("{}(batch/local/all): ({}/{}/{})\n",
                           r.label, r.batch, r.local, r.batch + r.local);
    };
    add_row(all);
    add_row(success);
    if (!failed_names.empty()) add_row(fail);

    if (verbosity_ > BASE_VERBOSITY && !failed_names.empty()) {
        out += fmt::format("Failed jobs: {}\n", join(failed_names, " "));
    }
    if (elapsed_) {
        out += fmt::format("Time spent: {:.1f} s", *elapsed_);
    }
    return out;
}

void ProgressReporter::print_summary() {
    out_ << "\r" << summary_string() << "\n" << std::flush;
}
