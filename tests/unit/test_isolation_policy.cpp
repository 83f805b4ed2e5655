#include <cstdint>
#include <gtest/gtest.h>
#include "core/config/isolation_config.hpp"
#include "policy/isolation_policy.hpp"

namespace {

using snipvisor::core::config::IsolationConfig;
using snipvisor::core::config::IsolationTier;
using snipvisor::core::config::kUnboundedExecutions;
using snipvisor::core::config::preset;
using snipvisor::policy::IsolationPolicy;

IsolationConfig with_limits(std::uint64_t max_executions, std::uint64_t gc_every) {
    IsolationConfig config;
    config.max_executions_before_restart = max_executions;
    config.forced_gc_every_n = gc_every;
    return config;
}

TEST(IsolationPolicyTest, CountZeroNeverActs) {
    const IsolationPolicy policy(with_limits(1, 1));
    const auto decision = policy.evaluate(0);
    EXPECT_FALSE(decision.should_restart);
    EXPECT_FALSE(decision.should_force_gc);
}

TEST(IsolationPolicyTest, RestartsOnMultiplesOfLimit) {
    const IsolationPolicy policy(with_limits(3, 0));
    EXPECT_FALSE(policy.evaluate(1).should_restart);
    EXPECT_FALSE(policy.evaluate(2).should_restart);
    EXPECT_TRUE(policy.evaluate(3).should_restart);
    EXPECT_FALSE(policy.evaluate(4).should_restart);
    EXPECT_TRUE(policy.evaluate(6).should_restart);
}

TEST(IsolationPolicyTest, EphemeralRestartsEveryCall) {
    const IsolationPolicy policy(preset(IsolationTier::Ephemeral));
    for (std::uint64_t count = 1; count <= 5; ++count) {
        EXPECT_TRUE(policy.evaluate(count).should_restart) << "count " << count;
        EXPECT_FALSE(policy.evaluate(count).should_force_gc) << "count " << count;
    }
}

TEST(IsolationPolicyTest, UnboundedNeverRestarts) {
    const IsolationPolicy policy(with_limits(kUnboundedExecutions, 0));
    EXPECT_FALSE(policy.evaluate(1).should_restart);
    EXPECT_FALSE(policy.evaluate(1000000).should_restart);
}

TEST(IsolationPolicyTest, ForcesGcOnMultiplesOfInterval) {
    const IsolationPolicy policy(with_limits(1000, 100));
    EXPECT_FALSE(policy.evaluate(99).should_force_gc);
    EXPECT_TRUE(policy.evaluate(100).should_force_gc);
    EXPECT_FALSE(policy.evaluate(101).should_force_gc);
    EXPECT_TRUE(policy.evaluate(200).should_force_gc);
}

TEST(IsolationPolicyTest, GcIntervalZeroDisablesGc) {
    const IsolationPolicy policy(with_limits(1000, 0));
    EXPECT_FALSE(policy.evaluate(100).should_force_gc);
}

TEST(IsolationPolicyTest, RestartAndGcCanCoincide) {
    const IsolationPolicy policy(with_limits(10, 5));
    const auto decision = policy.evaluate(10);
    EXPECT_TRUE(decision.should_restart);
    EXPECT_TRUE(decision.should_force_gc);
}

}  // namespace
