#pragma once

#include <chrono>

namespace chregistry::resilience {

struct RetryOptions {
    int max_attempts = 3;
    std::chrono::milliseconds base_backoff{1000};
    std::chrono::milliseconds max_backoff{1000};
    double multiplier = 1.0;   // 1.0 keeps the pause fixed at base_backoff
    double jitter_ratio = 0.0; // [0,1]
};

class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions opts);

    // max_attempts tries with the same pause between each.
    static RetryPolicy Fixed(int max_attempts, std::chrono::milliseconds pause);

    int max_attempts() const { return opts_.max_attempts; }

    // attempt: 1..max_attempts, returns sleep duration before the attempt (attempt=1 returns 0)
    std::chrono::milliseconds BackoffBeforeAttempt(int attempt) const;

private:
    RetryOptions opts_;
};

} // namespace chregistry::resilience
