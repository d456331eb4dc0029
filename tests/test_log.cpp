#include <gtest/gtest.h>
#include "fake_scheduler.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/worker.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <regex>

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved = sgerun_log_path();
        path = platform::temp_dir() / ("sgerun-log-test-" + platform::random_hex(8) + ".log");
        set_log_path(path.string());
    }

    void TearDown() override {
        set_log_path(saved);
        set_log_verbose(false);
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::string text() const { return read_file(path).value_or(""); }

    std::filesystem::path path;
    std::string saved;
};

// ── Lines ───────────────────────────────────────────────────

TEST_F(LogTest, LogAppendsTimestampedLine) {
    sgerun_log("first");
    sgerun_log("second");
    std::regex line(R"(\[\d{2}:\d{2}:\d{2}\.\d{3}\] first\n\[\d{2}:\d{2}:\d{2}\.\d{3}\] second\n)");
    EXPECT_TRUE(std::regex_match(text(), line)) << text();
}

TEST_F(LogTest, WarnIsMarkedAndEchoed) {
    testing::internal::CaptureStderr();
    sgerun_warn("disk full");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(text().find("] WARNING: disk full\n"), std::string::npos);
    EXPECT_NE(err.find("WARNING: disk full"), std::string::npos);
}

TEST_F(LogTest, QuietLogDoesNotEcho) {
    testing::internal::CaptureStderr();
    sgerun_log("quiet");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST_F(LogTest, VerboseLogEchoes) {
    set_log_verbose(true);
    EXPECT_TRUE(log_verbose());
    testing::internal::CaptureStderr();
    sgerun_log("loud");
    EXPECT_NE(testing::internal::GetCapturedStderr().find("] loud"), std::string::npos);
}

TEST_F(LogTest, SetLogPathOverrides) {
    EXPECT_EQ(sgerun_log_path(), path.string());
    sgerun_log("here");
    EXPECT_NE(text().find("] here"), std::string::npos);

    // Empty path keeps the current one
    set_log_path("");
    EXPECT_EQ(sgerun_log_path(), path.string());
}

TEST_F(LogTest, CommandOutputIsTruncated) {
    CommandResult r;
    r.exit_code = 0;
    r.stdout_data = std::string(LOG_OUTPUT_TRUNCATE + 100, 'a');
    r.stderr_data = "oops";
    sgerun_log_command("qstat", "qstat", {"-u", "me"}, r);

    std::string t = text();
    EXPECT_NE(t.find("] qstat CMD: qstat -u me\n"), std::string::npos);
    EXPECT_NE(t.find(fmt::format("] qstat exit=0 stdout({})={}...\n", LOG_OUTPUT_TRUNCATE + 100,
                                 std::string(LOG_OUTPUT_TRUNCATE, 'a'))),
              std::string::npos);
    EXPECT_NE(t.find("] qstat stderr=oops\n"), std::string::npos);
}

TEST_F(LogTest, CommandWithoutStderrLogsTwoLines) {
    CommandResult r;
    r.exit_code = 1;
    r.stdout_data = "short";
    sgerun_log_command("qsub", "qsub", {}, r);

    std::string t = text();
    EXPECT_NE(t.find("] qsub exit=1 stdout(5)=short\n"), std::string::npos);
    EXPECT_EQ(t.find("stderr="), std::string::npos);
}

// ── Job log dump ────────────────────────────────────────────

TEST_F(LogTest, FailedJobDumpsFramedLogs) {
    FakeScheduler scheduler;
    ScriptTaskSerializer serializer({"/usr/local/bin/sgerun", "", ""});
    WorkerOptions options;
    options.base_dir = platform::temp_dir() / ("sgerun-log-worker-" + platform::random_hex(8));
    options.poll.initial_delay_ms = 1;
    options.poll.max_delay_ms = 1;
    options.poll.unknown_pause_ms = 0;
    options.cleanup_retry_delay_ms = 0;

    {
        Worker worker(scheduler, serializer, options);
        auto outcome = worker.run(TaskDescriptor::make("fail", YAML::Node("boom")), ResourceRequest(), 1);
        ASSERT_FALSE(outcome.ok());
    }
    std::error_code ec;
    std::filesystem::remove_all(options.base_dir, ec);

    std::string t = text();
    std::size_t pos = 0;
    for (const char* piece : {"] #------ stdout.txt ------#\n", "] running fail\n",
                              "] #------ stderr.txt ------#\n", "fail: boom",
                              "] #------------------------#\n"}) {
        std::size_t at = t.find(piece, pos);
        ASSERT_NE(at, std::string::npos) << piece << "\n" << t;
        pos = at;
    }
}
