#include <gtest/gtest.h>
#include "sandbox/limit_policy.h"
#include "config/engine_properties.h"

using namespace proctor;
using namespace proctor::sandbox;

TEST(LimitPolicyTest, Defaults) {
    LimitPolicy policy;

    EXPECT_EQ(policy.timeout(), std::chrono::seconds(10));
    EXPECT_EQ(policy.memoryLimit(), "128m");
    EXPECT_EQ(policy.memoryBytes(), 128LL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(policy.cpuQuota(), 0.8);
}

TEST(LimitPolicyTest, CpuQuotaOverFixedPeriod) {
    LimitPolicy policy;

    EXPECT_EQ(policy.cpuPeriodMicros(), 100000);
    EXPECT_EQ(policy.cpuQuotaMicros(), 80000);
    EXPECT_EQ(policy.cpusArgument(), "0.8");

    LimitPolicy twoCores(std::chrono::seconds(5), "1g", 2.0);
    EXPECT_EQ(twoCores.cpuQuotaMicros(), 200000);
    EXPECT_EQ(twoCores.cpusArgument(), "2");
}

TEST(LimitPolicyTest, ParseMemoryLimitUnits) {
    EXPECT_EQ(LimitPolicy::parseMemoryLimit("512"), 512);
    EXPECT_EQ(LimitPolicy::parseMemoryLimit("512b"), 512);
    EXPECT_EQ(LimitPolicy::parseMemoryLimit("64k"), 64 * 1024);
    EXPECT_EQ(LimitPolicy::parseMemoryLimit("128M"), 128LL * 1024 * 1024);
    EXPECT_EQ(LimitPolicy::parseMemoryLimit("2g"), 2LL * 1024 * 1024 * 1024);
}

TEST(LimitPolicyTest, ParseMemoryLimitRejectsMalformed) {
    EXPECT_THROW(LimitPolicy::parseMemoryLimit(""), std::invalid_argument);
    EXPECT_THROW(LimitPolicy::parseMemoryLimit("m"), std::invalid_argument);
    EXPECT_THROW(LimitPolicy::parseMemoryLimit("12x"), std::invalid_argument);
    EXPECT_THROW(LimitPolicy::parseMemoryLimit("12mb"), std::invalid_argument);
    EXPECT_THROW(LimitPolicy::parseMemoryLimit("0m"), std::invalid_argument);
    EXPECT_THROW(LimitPolicy::parseMemoryLimit("-5m"), std::invalid_argument);
}

TEST(LimitPolicyTest, ParseMemoryLimitRejectsOverflow) {
    EXPECT_THROW(LimitPolicy::parseMemoryLimit("99999999999999999999999"), std::invalid_argument);
    EXPECT_THROW(LimitPolicy::parseMemoryLimit("9999999999999g"), std::invalid_argument);
    EXPECT_EQ(LimitPolicy::parseMemoryLimit("8g"), 8LL * 1024 * 1024 * 1024);
}

TEST(LimitPolicyTest, ConstructorRejectsNonPositiveLimits) {
    EXPECT_THROW(LimitPolicy(std::chrono::seconds(0), "128m", 0.8), std::invalid_argument);
    EXPECT_THROW(LimitPolicy(std::chrono::seconds(10), "128m", 0.0), std::invalid_argument);
    EXPECT_THROW(LimitPolicy(std::chrono::seconds(10), "lots", 0.8), std::invalid_argument);
}

TEST(LimitPolicyTest, FromProperties) {
    EngineProperties props;
    props.setTimeoutSeconds(3);
    props.setMemoryLimit("256m");
    props.setCpuLimit(1.5);

    LimitPolicy policy = LimitPolicy::fromProperties(props);
    EXPECT_EQ(policy.timeout(), std::chrono::seconds(3));
    EXPECT_EQ(policy.memoryBytes(), 256LL * 1024 * 1024);
    EXPECT_EQ(policy.cpuQuotaMicros(), 150000);
}
