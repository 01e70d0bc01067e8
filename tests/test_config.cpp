#include <gtest/gtest.h>
#include <core/config.hpp>
#include <jobs/job_file.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path global_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "batchy_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        global_path = test_dir / "global.yaml";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_global(const std::string& content) {
        std::ofstream(global_path) << content;
    }

    void write_project(const std::string& content) {
        std::ofstream(test_dir / "batchy.yaml") << content;
    }
};

TEST_F(ConfigTest, DefaultsWithoutFiles) {
    auto r = Config::load(test_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& cfg = r.value;
    EXPECT_TRUE(cfg.mode() == ExecutionMode::Normal);
    EXPECT_TRUE(cfg.printer().mode == ReportMode::Line);
    EXPECT_EQ(cfg.printer().verbosity, 1);
    EXPECT_EQ(cfg.script_dir().string(), (test_dir / "scripts").string());
    EXPECT_FALSE(cfg.container_image().has_value());
    EXPECT_FALSE(cfg.backend().has_value());
}

TEST_F(ConfigTest, GlobalBackendDefaults) {
    write_global(R"(
mode: test
printer:
  verbosity: 2
  mode: bars
backends:
  slurm:
    run_args: "--nice"
    partition: batch
    mem: 4G
  local:
    run_script: "echo local"
)");
    auto r = Config::load_global(global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& cfg = r.value;
    EXPECT_TRUE(cfg.mode() == ExecutionMode::Test);
    EXPECT_TRUE(cfg.printer().mode == ReportMode::Bars);
    EXPECT_EQ(cfg.printer().verbosity, 2);

    const BackendSpec* slurm = cfg.defaults_for(BackendKind::Slurm);
    ASSERT_NE(slurm, nullptr);
    EXPECT_EQ(slurm->config.run_args, "--nice");
    EXPECT_EQ(slurm->slurm.partition, "batch");
    EXPECT_EQ(slurm->slurm.mem, "4G");

    ASSERT_NE(cfg.defaults_for(BackendKind::Local), nullptr);
    EXPECT_EQ(cfg.defaults_for(BackendKind::HTCondor), nullptr);
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    write_global("mode: test\ncontainer_runtime: apptainer\nprinter:\n  mode: bars\n");
    write_project(R"(
mode: normal
script_dir: out/scripts
container_image: /images/analysis.sif
printer:
  mode: manual
backend:
  type: slurm
  name: fit_1
  run_script: run.sh
  time: "2:00:00"
)");
    auto r = Config::load(test_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& cfg = r.value;
    EXPECT_TRUE(cfg.mode() == ExecutionMode::Normal);
    EXPECT_TRUE(cfg.printer().mode == ReportMode::ManualLine);
    EXPECT_EQ(cfg.script_dir().string(), (test_dir / "out/scripts").string());
    EXPECT_EQ(cfg.container_image().value(), "/images/analysis.sif");

    ASSERT_TRUE(cfg.backend().has_value());
    const auto& spec = *cfg.backend();
    EXPECT_TRUE(spec.kind == BackendKind::Slurm);
    EXPECT_EQ(spec.config.name, "fit_1");
    EXPECT_EQ(spec.config.run_script, "run.sh");
    EXPECT_EQ(spec.slurm.time, "2:00:00");
    EXPECT_EQ(spec.container_runtime, "apptainer");
}

TEST_F(ConfigTest, ProjectPrinterKeysMergeWithGlobal) {
    write_global("printer:\n  mode: bars\n  poll_interval_ms: 250\n");
    write_project("printer:\n  verbosity: 2\n");
    auto r = Config::load(test_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& printer = r.value.printer();
    EXPECT_TRUE(printer.mode == ReportMode::Bars);
    EXPECT_EQ(printer.poll_interval_ms, 250);
    EXPECT_EQ(printer.verbosity, 2);
}

TEST_F(ConfigTest, UnknownPrinterModeFails) {
    write_project("printer:\n  mode: fancy\n");
    auto r = Config::load(test_dir, global_path);
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("fancy"), std::string::npos);
}

TEST_F(ConfigTest, SyncedBackendFromConfig) {
    write_global("backends:\n  slurm:\n    partition: batch\n    run_args: --nice\n");
    write_project("backend:\n  type: slurm\n  name: fit_1\n  partition: gpu\n");
    auto r = Config::load(test_dir, global_path);
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto backend = make_backend(*r.value.backend());
    auto defaults = make_backend(*r.value.defaults_for(BackendKind::Slurm));
    ASSERT_TRUE(backend->sync(defaults.get()).is_ok());

    std::string dump = backend->describe();
    EXPECT_NE(dump.find("partition: gpu"), std::string::npos);
    EXPECT_NE(dump.find("run_args: --nice"), std::string::npos);
    EXPECT_NE(dump.find("name: fit_1"), std::string::npos);
}

TEST_F(ConfigTest, UnknownBackendTypeFails) {
    write_project("backend:\n  type: pbs\n");
    auto r = Config::load(test_dir, global_path);
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("pbs"), std::string::npos);
}

TEST_F(ConfigTest, BadYamlFails) {
    write_global("printer: [unclosed\n");
    auto r = Config::load_global(global_path);
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConfigTest, MissingGlobalIsError) {
    auto r = Config::load_global(test_dir / "nope.yaml");
    EXPECT_TRUE(r.is_err());
}

// ── Job status file ─────────────────────────────────────────

TEST_F(ConfigTest, JobFile) {
    fs::path jobs_path = test_dir / "jobs.yaml";
    std::ofstream(jobs_path) << R"(
jobs:
  - name: a
    status: running
    tags: [fit, mc16a]
  - name: b
    type: local
    status: success
    tags: fit
)";
    auto r = load_job_file(jobs_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_TRUE(r.value[0].status == JobStatus::Running);
    EXPECT_EQ(r.value[0].tags.size(), 2u);
    EXPECT_TRUE(r.value[1].is_local());
    EXPECT_EQ(r.value[1].tags.count("fit"), 1u);
}

TEST_F(ConfigTest, RefreshStatuses) {
    fs::path jobs_path = test_dir / "jobs.yaml";
    std::ofstream(jobs_path) << "jobs:\n  - name: a\n    status: running\n";

    JobCollection jobs;
    auto loaded = load_job_file(jobs_path);
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(jobs.add(loaded.value[0]).is_ok());

    std::ofstream(jobs_path) << "jobs:\n  - name: a\n    status: failed\n  - name: z\n    status: success\n";
    auto r = refresh_statuses(jobs, jobs_path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 1);
    EXPECT_EQ(jobs.count_status(JobStatus::Failed), 1u);
    EXPECT_EQ(jobs.size(), 1u);
}

TEST_F(ConfigTest, JobFileUnknownStatus) {
    fs::path jobs_path = test_dir / "jobs.yaml";
    std::ofstream(jobs_path) << "jobs:\n  - name: a\n    status: exploded\n";
    EXPECT_TRUE(load_job_file(jobs_path).is_err());
}
