#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <managers/worker.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>

TEST(Config, Defaults) {
    auto r = Config::from_string("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.resources(), ResourceRequest());
    EXPECT_EQ(c.scheduler().submit, "qsub");
    EXPECT_EQ(c.scheduler().status, "qstat");
    EXPECT_EQ(c.scheduler().accounting, "qacct");
    EXPECT_EQ(c.scheduler().del, "qdel");
    EXPECT_EQ(c.worker().max_attempts, 3);
    EXPECT_EQ(c.worker().conda_env, "snakemake");
    EXPECT_FALSE(c.worker().keep_tmp);
    EXPECT_FALSE(c.worker().tmp_dir.empty());
    EXPECT_EQ(c.worker().poll.initial_delay_ms, 2000);
    EXPECT_DOUBLE_EQ(c.worker().poll.growth, 1.2);
    EXPECT_EQ(c.worker().poll.max_delay_ms, 60000);
    EXPECT_EQ(c.worker().poll.timeout_s, 0);
    EXPECT_EQ(c.jobs(), 1);
    EXPECT_FALSE(c.verbose());
}

TEST(Config, FullDocument) {
    auto r = Config::from_string(R"(
tmp_dir: /scratch/me/sgerun
keep_tmp: true
max_attempts: 5
conda_env: analysis
executor: /opt/sgerun/bin/sgerun
verbose: true
jobs: 16
resources:
  threads: 4
  time: 7200
  mem: 12g
  gpu: 1
  parallel_env: smp
poll:
  initial_delay_ms: 500
  growth: 1.5
  max_delay_ms: 10000
  timeout_s: 3600
scheduler:
  submit: /sge/bin/qsub
  delete: /sge/bin/qdel
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.worker().tmp_dir, "/scratch/me/sgerun");
    EXPECT_TRUE(c.worker().keep_tmp);
    EXPECT_EQ(c.worker().max_attempts, 5);
    EXPECT_EQ(c.worker().conda_env, "analysis");
    EXPECT_EQ(c.worker().executor, "/opt/sgerun/bin/sgerun");
    EXPECT_TRUE(c.verbose());
    EXPECT_EQ(c.jobs(), 16);

    EXPECT_EQ(c.resources(), ResourceRequest(4, "02:00:00", "12G", true, "smp"));

    EXPECT_EQ(c.worker().poll.initial_delay_ms, 500);
    EXPECT_DOUBLE_EQ(c.worker().poll.growth, 1.5);
    EXPECT_EQ(c.worker().poll.max_delay_ms, 10000);
    EXPECT_EQ(c.worker().poll.timeout_s, 3600);

    EXPECT_EQ(c.scheduler().submit, "/sge/bin/qsub");
    EXPECT_EQ(c.scheduler().status, "qstat");
    EXPECT_EQ(c.scheduler().del, "/sge/bin/qdel");
}

TEST(Config, OverlayKeepsEarlierKeys) {
    auto r = Config::from_string("max_attempts: 4\nresources:\n  mem: 8\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    Config c = r.value;

    YAML::Node cli;
    cli["resources"]["threads"] = 2;
    cli["jobs"] = "3";
    c.overlay(cli);

    EXPECT_EQ(c.worker().max_attempts, 4);
    EXPECT_EQ(c.resources().mem(), "8G");
    EXPECT_EQ(c.resources().threads(), 2);
    EXPECT_EQ(c.jobs(), 3);
}

TEST(Config, GpuFlagForms) {
    EXPECT_FALSE(Config::from_string("resources:\n  gpu: 0\n").value.resources().gpu());
    EXPECT_TRUE(Config::from_string("resources:\n  gpu: true\n").value.resources().gpu());
}

TEST(Config, RejectsInvalidValues) {
    EXPECT_TRUE(Config::from_string("max_attempts: 0\n").is_err());
    EXPECT_TRUE(Config::from_string("jobs: 0\n").is_err());
    EXPECT_TRUE(Config::from_string("jobs: many\n").is_err());
    EXPECT_TRUE(Config::from_string("poll:\n  growth: 0.5\n").is_err());
    EXPECT_TRUE(Config::from_string("poll:\n  max_delay_ms: -1\n").is_err());
    EXPECT_TRUE(Config::from_string("resources:\n  mem: lots\n").is_err());
    EXPECT_TRUE(Config::from_string("resources:\n  time: 1:00\n").is_err());
    EXPECT_TRUE(Config::from_string("resources:\n  threads: 0\n").is_err());
    EXPECT_TRUE(Config::from_string("- just\n- a list\n").is_err());
}

TEST(Config, MalformedYaml) {
    auto r = Config::from_string("resources: [unclosed\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse config"), std::string::npos);
}

TEST(Config, OverlayThrowsConfigError) {
    Config a;
    EXPECT_THROW(a.overlay(YAML::Load("max_attempts: -1")), ConfigError);
    Config b;
    EXPECT_THROW(b.overlay(YAML::Load("resources:\n  mem: 0")), InvalidResourceSpec);
}

TEST(Config, LoadFromFile) {
    auto path = platform::temp_dir() / ("sgerun-config-" + platform::random_hex(8) + ".yaml");
    ASSERT_TRUE(write_file(path, "jobs: 7\nconda_env: ''\n"));

    auto r = Config::load(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.jobs(), 7);
    EXPECT_TRUE(r.value.worker().conda_env.empty());
}

TEST(Config, LoadMissingFile) {
    auto r = Config::load(platform::temp_dir() / "sgerun-no-such-config.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Config file not found"), std::string::npos);
}

TEST(Config, WorkerOptionsFromConfig) {
    auto r = Config::from_string("tmp_dir: /scratch/x\nkeep_tmp: true\npoll:\n  timeout_s: 30\n");
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto o = WorkerOptions::from_config(r.value);
    EXPECT_EQ(o.base_dir, std::filesystem::path("/scratch/x"));
    EXPECT_TRUE(o.keep_workspace);
    EXPECT_EQ(o.poll.timeout_s, 30);
    EXPECT_EQ(o.cancel, nullptr);
}
