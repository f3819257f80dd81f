#include <catch2/catch_test_macros.hpp>

#include <s3pull/transfer/transfer.hpp>

#include <atomic>
#include <chrono>

using namespace s3pull::transfer;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {

milliseconds elapsedSince(steady_clock::time_point start) {
    return std::chrono::duration_cast<milliseconds>(steady_clock::now() - start);
}

} // namespace

TEST_CASE("RateLimiter: zero rate never blocks", "[transfer][ratelimit]") {
    auto limiter = makeRateLimiter();
    limiter->setLimits(RateLimit{0, 1.0});

    const auto start = steady_clock::now();
    for (int i = 0; i < 1000; ++i)
        limiter->acquire(1 << 20, {});
    CHECK(elapsedSince(start) < milliseconds(500));
}

TEST_CASE("RateLimiter: throughput is held to the configured rate", "[transfer][ratelimit]") {
    auto limiter = makeRateLimiter();
    // 100 KB/s with a 0.1 s burst allowance
    limiter->setLimits(RateLimit{100'000, 0.1});

    const auto start = steady_clock::now();
    limiter->acquire(10'000, {}); // initial burst
    limiter->acquire(20'000, {}); // waits for a full bucket, then overdraws
    limiter->acquire(1, {});      // pays back the overdraft
    CHECK(elapsedSince(start) >= milliseconds(150));
}

TEST_CASE("RateLimiter: cancellation ends the wait", "[transfer][ratelimit][cancel]") {
    auto limiter = makeRateLimiter();
    limiter->setLimits(RateLimit{1, 1.0});
    limiter->acquire(1, {});

    std::atomic<int> polls{0};
    const ShouldCancel cancel = [&polls] { return ++polls > 2; };
    const auto start = steady_clock::now();
    limiter->acquire(1000, cancel);
    CHECK(elapsedSince(start) < milliseconds(900));
    CHECK(polls.load() > 2);
}
