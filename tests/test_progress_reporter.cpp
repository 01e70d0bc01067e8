#include <gtest/gtest.h>
#include <cli/progress_reporter.hpp>
#include <cli/progress_bar.hpp>
#include <sstream>

static Job make_job(const std::string& name, JobStatus status,
                    std::set<std::string> tags = {}, JobType type = JobType::Batch) {
    Job job;
    job.name = name;
    job.status = status;
    job.tags = std::move(tags);
    job.type = type;
    return job;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ── ProgressBar ─────────────────────────────────────────────

TEST(ProgressBar, RendersCountsAndPostfix) {
    ProgressBar bar("fit", 4, 8);
    bar.update(2);
    bar.set_postfix("SUCCESS=2, FAILED=0");
    std::string text = bar.render();
    EXPECT_TRUE(contains(text, "fit:  50%|"));
    EXPECT_TRUE(contains(text, "| 2/4 [SUCCESS=2, FAILED=0]"));
}

TEST(ProgressBar, ClampedToTotal) {
    ProgressBar bar("all", 3);
    bar.update(10);
    EXPECT_EQ(bar.n(), 3u);
}

TEST(ProgressBar, EmptyTotal) {
    ProgressBar bar("all", 0);
    EXPECT_TRUE(contains(bar.render(), "0/0"));
}

// ── Line modes ──────────────────────────────────────────────

TEST(ProgressReporter, LineShowsSuccessFailAll) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Success));
    jobs.add(make_job("b", JobStatus::Failed));
    jobs.add(make_job("c", JobStatus::Running));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Line, 1, out);
    reporter.start();

    EXPECT_EQ(out.str(), "\rJobs (success/fail/all): (1/1/3)");
}

TEST(ProgressReporter, VerboseLineBreaksDownRunning) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Running));
    jobs.add(make_job("b", JobStatus::Running, {}, JobType::Local));
    jobs.add(make_job("c", JobStatus::Running));
    jobs.add(make_job("d", JobStatus::Success, {}, JobType::Local));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Line, 2, out);
    EXPECT_EQ(reporter.status_line(),
              "Jobs running (batch/local/all): (2/1/3); (success/fail/all): (1/0/4)");
}

TEST(ProgressReporter, ManualModeAddsHint) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Running));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::ManualLine, 1, out);
    reporter.update();
    EXPECT_TRUE(contains(out.str(), "press enter to update status"));
}

TEST(ProgressReporter, LineRewritesInPlace) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Running));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Line, 1, out);
    reporter.start();
    jobs.set_status("a", JobStatus::Success);
    reporter.update();

    EXPECT_EQ(out.str(),
              "\rJobs (success/fail/all): (0/0/1)"
              "\rJobs (success/fail/all): (1/0/1)");
}

// ── Bars ────────────────────────────────────────────────────

TEST(ProgressReporter, BarPerTagPlusAll) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Running, {"fit"}));
    jobs.add(make_job("b", JobStatus::Running, {"fit", "plot"}));
    jobs.add(make_job("c", JobStatus::Running));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Bars, 1, out);
    reporter.start();

    const auto& bars = reporter.bars();
    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].first, "all");
    EXPECT_EQ(bars[0].second.total(), 3u);
    EXPECT_EQ(bars[1].first, "fit");
    EXPECT_EQ(bars[1].second.total(), 2u);
    EXPECT_EQ(bars[2].first, "plot");
    EXPECT_EQ(bars[2].second.total(), 1u);
}

TEST(ProgressReporter, TagNamedAllIsNotDuplicated) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Running, {"all", "fit"}));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Bars, 1, out);
    reporter.start();

    std::vector<std::string> expected = {"fit"};
    EXPECT_EQ(reporter.tracked_tags(), expected);
    EXPECT_EQ(reporter.bars().size(), 2u);
}

TEST(ProgressReporter, StartFastForwardsFinishedJobs) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Success, {"fit"}));
    jobs.add(make_job("b", JobStatus::Success));
    jobs.add(make_job("c", JobStatus::Running, {"fit"}));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Bars, 1, out);
    reporter.start();

    EXPECT_EQ(reporter.displayed("all"), 2u);
    EXPECT_EQ(reporter.displayed("fit"), 1u);
    EXPECT_EQ(reporter.displayed("unknown"), 0u);
}

TEST(ProgressReporter, BarsNeverGoBackwards) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Running, {"fit"}));
    jobs.add(make_job("b", JobStatus::Running, {"fit"}));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Bars, 1, out);
    reporter.start();

    jobs.set_status("a", JobStatus::Failed);
    jobs.set_status("b", JobStatus::Success);
    reporter.update();
    EXPECT_EQ(reporter.displayed("all"), 2u);
    EXPECT_EQ(reporter.displayed("fit"), 2u);

    // "a" is retried: the bar stays, only the postfix drops
    jobs.set_status("a", JobStatus::Running);
    reporter.update();
    EXPECT_EQ(reporter.displayed("all"), 2u);
    EXPECT_TRUE(contains(reporter.bars()[0].second.render(), "SUCCESS=1, FAILED=0"));
}

TEST(ProgressReporter, BarsRedrawInPlace) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Running, {"fit"}));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Bars, 1, out);
    reporter.start();
    EXPECT_FALSE(contains(out.str(), "\033[2A"));
    reporter.update();
    EXPECT_TRUE(contains(out.str(), "\033[2A"));
}

// ── Summary ─────────────────────────────────────────────────

TEST(ProgressReporter, SummaryCountsBatchAndLocal) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Success));
    jobs.add(make_job("b", JobStatus::Success, {}, JobType::Local));
    jobs.add(make_job("c", JobStatus::Failed));
    jobs.add(make_job("d", JobStatus::Cancelled, {}, JobType::Local));
    jobs.add(make_job("e", JobStatus::Running));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Line, 1, out);
    EXPECT_EQ(reporter.summary_string(),
              "Jobs processed (batch/local/all): (3/2/5)\n"
              "     successful (batch/local/all): (1/1/2)\n"
              "     failed (batch/local/all): (1/1/2)\n");
}

TEST(ProgressReporter, SummaryOmitsFailedRowWhenNoneFailed) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Success));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Line, 2, out);
    std::string summary = reporter.summary_string();
    EXPECT_FALSE(contains(summary, "failed"));
    EXPECT_FALSE(contains(summary, "Failed jobs"));
}

TEST(ProgressReporter, VerboseSummaryListsFailedJobs) {
    JobCollection jobs;
    jobs.add(make_job("fit_1", JobStatus::Failed));
    jobs.add(make_job("fit_2", JobStatus::Success));
    jobs.add(make_job("fit_3", JobStatus::Cancelled));

    std::ostringstream out;
    ProgressReporter quiet(jobs, ReportMode::Line, 1, out);
    EXPECT_FALSE(contains(quiet.summary_string(), "Failed jobs"));

    ProgressReporter verbose(jobs, ReportMode::Line, 2, out);
    EXPECT_TRUE(contains(verbose.summary_string(), "Failed jobs: fit_1 fit_3\n"));
}

TEST(ProgressReporter, EmptyCollection) {
    JobCollection jobs;
    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Bars, 1, out);
    reporter.start();
    reporter.stop();

    EXPECT_TRUE(contains(out.str(), "Jobs processed (batch/local/all): (0/0/0)"));
    EXPECT_TRUE(contains(out.str(), "Time spent: "));
}

TEST(ProgressReporter, StopRecordsElapsedTime) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Success));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Line, 1, out);
    EXPECT_FALSE(reporter.elapsed_seconds().has_value());
    EXPECT_FALSE(contains(reporter.summary_string(), "Time spent"));

    reporter.start();
    reporter.stop();
    ASSERT_TRUE(reporter.elapsed_seconds().has_value());
    EXPECT_GE(*reporter.elapsed_seconds(), 0.0);
    EXPECT_TRUE(contains(out.str(), "Time spent: "));
    EXPECT_EQ(out.str().back(), '\n');
}

TEST(ProgressReporter, StopWithoutStartHasNoTime) {
    JobCollection jobs;
    jobs.add(make_job("a", JobStatus::Success));

    std::ostringstream out;
    ProgressReporter reporter(jobs, ReportMode::Line, 1, out);
    reporter.stop();
    EXPECT_FALSE(reporter.elapsed_seconds().has_value());
    EXPECT_TRUE(contains(out.str(), "Jobs processed"));
}
