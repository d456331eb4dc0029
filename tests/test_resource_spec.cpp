#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <core/resource_spec.hpp>
#include <core/time_utils.hpp>

// ── normalize_time ──────────────────────────────────────────

TEST(ResourceSpec, NormalizeTime_Seconds) {
    EXPECT_EQ(normalize_time("59"), "00:00:59");
    EXPECT_EQ(normalize_time("3600"), "01:00:00");
    EXPECT_EQ(normalize_time("3661"), "01:01:01");
    EXPECT_EQ(normalize_time("0"), "00:00:00");
}

TEST(ResourceSpec, NormalizeTime_IntegerOverload) {
    EXPECT_EQ(normalize_time(7200LL), "02:00:00");
    EXPECT_THROW(normalize_time(-1LL), InvalidResourceSpec);
}

TEST(ResourceSpec, NormalizeTime_AlreadyFormatted) {
    EXPECT_EQ(normalize_time("00:59:00"), "00:59:00");
    EXPECT_EQ(normalize_time("99:59:59"), "99:59:59");
}

TEST(ResourceSpec, NormalizeTime_TrimsWhitespace) {
    EXPECT_EQ(normalize_time("  120 "), "00:02:00");
}

TEST(ResourceSpec, NormalizeTime_Idempotent) {
    for (const char* in : {"1", "3599", "86399", "12:34:56"}) {
        std::string once = normalize_time(in);
        EXPECT_EQ(normalize_time(once), once) << in;
    }
}

TEST(ResourceSpec, NormalizeTime_RoundTripsSeconds) {
    for (long long s : {0LL, 1LL, 59LL, 60LL, 3599LL, 3600LL, 86400LL, 359999LL}) {
        auto back = parse_hms(normalize_time(s));
        ASSERT_TRUE(back.has_value()) << s;
        EXPECT_EQ(*back, s);
    }
}

TEST(ResourceSpec, NormalizeTime_RejectsHundredHours) {
    // 100:00:00 no longer fits the two-digit hour field
    EXPECT_THROW(normalize_time("360000"), InvalidResourceSpec);
    EXPECT_THROW(normalize_time("100:00:00"), InvalidResourceSpec);
}

TEST(ResourceSpec, NormalizeTime_RejectsMalformed) {
    EXPECT_THROW(normalize_time(""), InvalidResourceSpec);
    EXPECT_THROW(normalize_time("abc"), InvalidResourceSpec);
    EXPECT_THROW(normalize_time("-5"), InvalidResourceSpec);
    EXPECT_THROW(normalize_time("1:00:00"), InvalidResourceSpec);
    EXPECT_THROW(normalize_time("00:60:00"), InvalidResourceSpec);
    EXPECT_THROW(normalize_time("00:00:60"), InvalidResourceSpec);
    EXPECT_THROW(normalize_time("01:00"), InvalidResourceSpec);
}

// ── normalize_memory ────────────────────────────────────────

TEST(ResourceSpec, NormalizeMemory_Plain) {
    EXPECT_EQ(normalize_memory("6"), "6G");
    EXPECT_EQ(normalize_memory("128"), "128G");
}

TEST(ResourceSpec, NormalizeMemory_Suffixes) {
    EXPECT_EQ(normalize_memory("6G"), "6G");
    EXPECT_EQ(normalize_memory("6g"), "6G");
    // The integer is always re-emitted in G
    EXPECT_EQ(normalize_memory("512M"), "512G");
    EXPECT_EQ(normalize_memory("512m"), "512G");
}

TEST(ResourceSpec, NormalizeMemory_Idempotent) {
    EXPECT_EQ(normalize_memory(normalize_memory("16g")), "16G");
}

TEST(ResourceSpec, NormalizeMemory_Rejects) {
    EXPECT_THROW(normalize_memory(""), InvalidResourceSpec);
    EXPECT_THROW(normalize_memory("G"), InvalidResourceSpec);
    EXPECT_THROW(normalize_memory("lots"), InvalidResourceSpec);
    EXPECT_THROW(normalize_memory("1.5G"), InvalidResourceSpec);
    EXPECT_THROW(normalize_memory("0"), InvalidResourceSpec);
    EXPECT_THROW(normalize_memory("-4G"), InvalidResourceSpec);
}

// ── ResourceRequest ─────────────────────────────────────────

TEST(ResourceSpec, Request_Defaults) {
    ResourceRequest r;
    EXPECT_EQ(r.threads(), 1);
    EXPECT_EQ(r.time(), "00:59:00");
    EXPECT_EQ(r.mem(), "6G");
    EXPECT_FALSE(r.gpu());
    EXPECT_EQ(r.parallel_env(), "parallel");
}

TEST(ResourceSpec, Request_NormalizesFields) {
    ResourceRequest r(4, "7200", "8g", true, "smp");
    EXPECT_EQ(r.time(), "02:00:00");
    EXPECT_EQ(r.mem(), "8G");
}

TEST(ResourceSpec, Request_RejectsBadValues) {
    EXPECT_THROW(ResourceRequest(0, "60", "1", false, "smp"), InvalidResourceSpec);
    EXPECT_THROW(ResourceRequest(-2, "60", "1", false, "smp"), InvalidResourceSpec);
    EXPECT_THROW(ResourceRequest(1, "60", "1", false, ""), InvalidResourceSpec);
    EXPECT_THROW(ResourceRequest(1, "60", "1", false, "two words"), InvalidResourceSpec);
    EXPECT_THROW(ResourceRequest(1, "soon", "1", false, "smp"), InvalidResourceSpec);
    EXPECT_THROW(ResourceRequest(1, "60", "0", false, "smp"), InvalidResourceSpec);
}

TEST(ResourceSpec, Request_WithCopies) {
    ResourceRequest base(2, "60", "4", false, "smp");
    auto more = base.with_mem("10").with_time("120").with_threads(8);
    EXPECT_EQ(more.mem(), "10G");
    EXPECT_EQ(more.time(), "00:02:00");
    EXPECT_EQ(more.threads(), 8);
    // base unchanged
    EXPECT_EQ(base.mem(), "4G");
    EXPECT_NE(base, more);
    EXPECT_EQ(base, ResourceRequest(2, "00:01:00", "4G", false, "smp"));
}

TEST(ResourceSpec, SgeFlags) {
    ResourceRequest r(4, "7200", "8", true, "smp");
    std::vector<std::string> expected = {
        "-pe", "smp", "4",
        "-l", "h_vmem=8G",
        "-l", "h_rt=02:00:00",
        "-l", "gpu=1",
    };
    EXPECT_EQ(sge_resource_flags(r), expected);

    auto flags = sge_resource_flags(ResourceRequest());
    EXPECT_EQ(flags.back(), "gpu=0");
}

// ── Escalation ──────────────────────────────────────────────

TEST(ResourceSpec, ScaleMemoryPerAttempt) {
    ResourceRequest base;  // 6G
    auto policy = scale_memory_per_attempt(4);
    EXPECT_EQ(policy(1, base).mem(), "6G");
    EXPECT_EQ(policy(2, base).mem(), "10G");
    EXPECT_EQ(policy(3, base).mem(), "14G");
    EXPECT_EQ(policy(3, base).time(), base.time());
}

TEST(ResourceSpec, ScaleTimePerAttempt) {
    ResourceRequest base;  // 00:59:00
    auto policy = scale_time_per_attempt(600);
    EXPECT_EQ(policy(1, base).time(), "00:59:00");
    EXPECT_EQ(policy(2, base).time(), "01:09:00");
    EXPECT_EQ(policy(2, base).mem(), base.mem());
}

TEST(ResourceSpec, ScaleTimePastLimitThrows) {
    ResourceRequest base(1, "99:00:00", "1", false, "smp");
    auto policy = scale_time_per_attempt(7200);
    EXPECT_THROW(policy(2, base), InvalidResourceSpec);
}
