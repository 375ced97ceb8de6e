#include <chregistry/resilience/retry.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace chregistry::resilience {

RetryPolicy::RetryPolicy(RetryOptions opts) : opts_(opts) {
    opts_.max_attempts = std::max(opts_.max_attempts, 1);
    opts_.multiplier = std::max(opts_.multiplier, 1.0);
    opts_.jitter_ratio = std::clamp(opts_.jitter_ratio, 0.0, 1.0);
    if (opts_.base_backoff.count() < 0) {
        opts_.base_backoff = std::chrono::milliseconds(0);
    }
    opts_.max_backoff = std::max(opts_.max_backoff, opts_.base_backoff);
}

RetryPolicy RetryPolicy::Fixed(int max_attempts, std::chrono::milliseconds pause) {
    RetryOptions opts;
    opts.max_attempts = max_attempts;
    opts.base_backoff = pause;
    opts.max_backoff = pause;
    opts.multiplier = 1.0;
    opts.jitter_ratio = 0.0;
    return RetryPolicy(opts);
}

std::chrono::milliseconds RetryPolicy::BackoffBeforeAttempt(int attempt) const {
    if (attempt <= 1) {
        return std::chrono::milliseconds(0);
    }

    // base * multiplier^(attempt-2), capped
    double factor = std::pow(opts_.multiplier, static_cast<double>(attempt - 2));
    auto raw = static_cast<long long>(static_cast<double>(opts_.base_backoff.count()) * factor);
    raw = std::min<long long>(raw, opts_.max_backoff.count());

    if (opts_.jitter_ratio == 0.0) {
        return std::chrono::milliseconds(raw);
    }

    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dist(-opts_.jitter_ratio, opts_.jitter_ratio);
    auto jittered = static_cast<long long>(static_cast<double>(raw) * (1.0 + dist(gen)));
    jittered = std::clamp<long long>(jittered, 0, opts_.max_backoff.count());
    return std::chrono::milliseconds(jittered);
}

} // namespace chregistry::resilience
