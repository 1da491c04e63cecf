#pragma once

#include "core/generation/generation_client.h"

#include <functional>

namespace dw {

struct Settings;

struct RetryPolicy {
    int maxAttempts = 3;
    int initialBackoffMs = 1000;
    int maxBackoffMs = 8000;
    int timeoutMs = 60000;
};

// GenerationRunner -- bounded retry around a GenerationClient.
//
// RateLimit and Timeout failures are retried up to maxAttempts in total,
// sleeping initialBackoffMs * 2^(n-1) (capped at maxBackoffMs) after
// attempt n. Service failures are returned at once.
class GenerationRunner {
public:
    using SleepFn = std::function<void(int ms)>;

    GenerationRunner(GenerationClient& client, RetryPolicy policy, SleepFn sleep = {});

    static RetryPolicy policyFromSettings(const Settings& settings);

    // Delay after failed attempt n (1-based).
    int backoffMs(int attempt) const;

    GenerationResponse run(const QString& prompt);

    // Attempts used by the last run().
    int lastAttempts() const { return m_lastAttempts; }

private:
    GenerationClient& m_client;
    RetryPolicy m_policy;
    SleepFn m_sleep;
    int m_lastAttempts = 0;
};

} // namespace dw
