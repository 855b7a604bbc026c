// block_resolver_test.cpp: timestamp -> block bisection on a uniform chain.

#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <string>

#include "block_resolver.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace clmm;
using clmm_test::FakeChain;

namespace {

constexpr int64_t GENESIS = 1600000000;  // 2020-09-13T12:26:40Z
constexpr int64_t BLOCK_TIME = 2;
constexpr uint64_t LATEST = 1000000;

// First block whose timestamp is >= ts.
uint64_t first_block_at_or_after(int64_t ts) {
    if (ts <= GENESIS) return 0;
    return static_cast<uint64_t>((ts - GENESIS + BLOCK_TIME - 1) / BLOCK_TIME);
}

BlockSearchOptions exact() {
    BlockSearchOptions opts;
    opts.tolerance_seconds = 0;
    return opts;
}

}  // anonymous namespace

TEST(BlockResolver, RandomTargetsResolveToFirstBlockAtOrAfter) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<int64_t> dist(GENESIS, chain.ts_of(LATEST) - 1);

    for (int i = 0; i < 200; ++i) {
        const int64_t target = dist(rng);
        const uint64_t block = resolver.resolve(target, exact());
        EXPECT_EQ(block, first_block_at_or_after(target)) << "target=" << target;
        EXPECT_GE(chain.ts_of(block), target);
        if (block > 0) EXPECT_LT(chain.ts_of(block - 1), target);
        EXPECT_LE(resolver.last_probe_count(), 21);
    }
}

TEST(BlockResolver, BlockTimeHintGivesSameAnswer) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    BlockSearchOptions opts = exact();
    opts.approx_block_time = 2.0;
    std::mt19937_64 rng(7);
    std::uniform_int_distribution<int64_t> dist(GENESIS, chain.ts_of(LATEST) - 1);

    for (int i = 0; i < 150; ++i) {
        const int64_t target = dist(rng);
        EXPECT_EQ(resolver.resolve(target, opts), first_block_at_or_after(target)) << "target=" << target;
    }
}

TEST(BlockResolver, TargetBeforeGenesisResolvesToZero) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    EXPECT_EQ(resolver.resolve(GENESIS - 1000, exact()), 0u);
}

TEST(BlockResolver, NearLatestShortCircuits) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    BlockSearchOptions opts;
    opts.tolerance_seconds = 5;
    EXPECT_EQ(resolver.resolve(chain.ts_of(LATEST) - 4, opts), LATEST);
    EXPECT_EQ(resolver.last_probe_count(), 0);
    EXPECT_EQ(chain.timestamp_reads, 0);
}

TEST(BlockResolver, ToleranceAcceptsNearbyBlock) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    BlockSearchOptions opts;
    opts.tolerance_seconds = 5;
    const int64_t target = GENESIS + 123457;
    const uint64_t block = resolver.resolve(target, opts);
    const int64_t err = chain.ts_of(block) - target;
    EXPECT_LE(err < 0 ? -err : err, 5);
}

TEST(BlockResolver, FutureTargetRejected) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    EXPECT_THROW(resolver.resolve(chain.ts_of(LATEST) + 1), FutureTarget);
    // FutureTarget is a kind of invalid input.
    EXPECT_THROW(resolver.resolve(chain.ts_of(LATEST) + 3600), InvalidInput);
}

TEST(BlockResolver, ExhaustedProbeBudgetIsNoConvergence) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    BlockSearchOptions opts = exact();
    opts.max_tries = 0;
    EXPECT_THROW(resolver.resolve(GENESIS + 500001, opts), NoConvergence);

    opts.max_tries = 3;
    EXPECT_THROW(resolver.resolve(GENESIS + 500001, opts), NoConvergence);
    EXPECT_EQ(resolver.last_probe_count(), 3);
}

TEST(BlockResolver, CalendarTargets) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    EXPECT_EQ(resolver.resolve(std::string("2020-09-13T12:26:50Z"), exact()), 5u);
    EXPECT_EQ(resolver.resolve(std::string("2020-09-13T14:26:50+02:00"), exact()), 5u);
    EXPECT_THROW(resolver.resolve(std::string("2020-09-13T12:26:50"), exact()), InvalidInput);
    EXPECT_THROW(resolver.resolve(std::string("not a time"), exact()), InvalidInput);
}

TEST(BlockResolver, VerboseTracesEachProbe) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain, true);
    testing::internal::CaptureStdout();
    const uint64_t block = resolver.resolve(GENESIS + 500001, exact());
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(block, first_block_at_or_after(GENESIS + 500001));
    EXPECT_NE(out.find("probe 1: block "), std::string::npos);
    EXPECT_NE(out.find("probe " + std::to_string(resolver.last_probe_count()) + ":"), std::string::npos);

    BlockResolver quiet(chain);
    testing::internal::CaptureStdout();
    quiet.resolve(GENESIS + 500001, exact());
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());
}

TEST(BlockResolver, UpstreamFailurePropagates) {
    FakeChain chain(GENESIS, BLOCK_TIME, LATEST);
    BlockResolver resolver(chain);
    chain.fail_all(true);
    EXPECT_THROW(resolver.resolve(GENESIS + 100), UpstreamUnavailable);
}
