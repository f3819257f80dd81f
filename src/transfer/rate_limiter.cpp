/*
 * s3pull/src/transfer/rate_limiter.cpp
 *
 * Token-bucket RateLimiter
 * - One bucket shared by every worker; 0 bytes/s means unlimited
 * - Capacity is rate * burstSeconds, tokens are doubles so fractional refills accumulate
 * - Requests larger than the capacity are admitted once the bucket is full and drive the
 *   balance negative, which delays the next caller accordingly
 * - acquire() returns early when shouldCancel() turns true
 */

#include <s3pull/transfer/transfer.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace s3pull::transfer {

namespace {

using clock_t = std::chrono::steady_clock;

class TokenBucketLimiter final : public IRateLimiter {
public:
    TokenBucketLimiter() = default;
    ~TokenBucketLimiter() override = default;

    void setLimits(const RateLimit& limit) override {
        std::lock_guard<std::mutex> lk(mutex_);
        rate_bps_ = static_cast<double>(limit.bytesPerSecond);
        const double burst = limit.burstSeconds > 0.0 ? limit.burstSeconds : 1.0;
        capacity_ = rate_bps_ * burst;
        tokens_ = capacity_;
        last_refill_ = clock_t::now();
    }

    void acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) override {
        if (bytes == 0)
            return;

        const double want = static_cast<double>(bytes);
        while (true) {
            if (shouldCancel && shouldCancel())
                return;

            double wait_seconds = 0.0;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (rate_bps_ <= 0.0)
                    return;

                refill(clock_t::now());
                // Oversized requests only need a full bucket
                const double need = std::min(want, capacity_);
                if (tokens_ >= need) {
                    tokens_ -= want;
                    return;
                }
                wait_seconds = (need - tokens_) / rate_bps_;
            }

            // Sleep in slices so cancellation stays responsive
            constexpr auto kMaxSlice = std::chrono::milliseconds(50);
            auto sleep_for = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::duration<double>(wait_seconds));
            if (sleep_for.count() <= 0) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::min(sleep_for, std::chrono::milliseconds(kMaxSlice)));
            }
        }
    }

private:
    void refill(clock_t::time_point now) {
        const auto dt = std::chrono::duration<double>(now - last_refill_).count();
        if (dt <= 0.0)
            return;
        tokens_ = std::min(capacity_, tokens_ + rate_bps_ * dt);
        last_refill_ = now;
    }

    std::mutex mutex_;
    double rate_bps_{0.0};
    double capacity_{0.0};
    double tokens_{0.0};
    clock_t::time_point last_refill_{clock_t::now()};
};

} // namespace

std::unique_ptr<IRateLimiter> makeRateLimiter() {
    return std::make_unique<TokenBucketLimiter>();
}

} // namespace s3pull::transfer
