#include "core/generation/generation_runner.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <QThread>

#include <algorithm>
#include <cstdint>

namespace dw {

GenerationRunner::GenerationRunner(GenerationClient& client, RetryPolicy policy, SleepFn sleep)
    : m_client(client)
    , m_policy(policy)
    , m_sleep(std::move(sleep))
{
    if (!m_sleep) {
        m_sleep = [](int ms) { QThread::msleep(static_cast<unsigned long>(ms)); };
    }
}

RetryPolicy GenerationRunner::policyFromSettings(const Settings& settings)
{
    RetryPolicy policy;
    policy.maxAttempts = std::max(settings.generationMaxAttempts, 1);
    policy.initialBackoffMs = std::max(settings.initialBackoffMs, 0);
    policy.maxBackoffMs = std::max(settings.maxBackoffMs, policy.initialBackoffMs);
    policy.timeoutMs = settings.generationTimeoutMs;
    return policy;
}

int GenerationRunner::backoffMs(int attempt) const
{
    int64_t delay = m_policy.initialBackoffMs;
    for (int i = 1; i < attempt && delay < m_policy.maxBackoffMs; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<int64_t>(delay, m_policy.maxBackoffMs));
}

GenerationResponse GenerationRunner::run(const QString& prompt)
{
    const int maxAttempts = std::max(m_policy.maxAttempts, 1);
    GenerationResponse response;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        m_lastAttempts = attempt;
        response = m_client.generate(prompt, m_policy.timeoutMs);
        if (response.ok()) {
            if (attempt > 1) {
                LOG_INFO(dwGeneration, "Generation succeeded on attempt %d", attempt);
            }
            return response;
        }

        const GenerationFailure& failure = *response.failure;
        if (!failure.isRetryable()) {
            LOG_WARN(dwGeneration, "Generation failed (%s, HTTP %d): %s",
                     qUtf8Printable(generationFailureKindToString(failure.kind)),
                     failure.httpStatus, qUtf8Printable(failure.message));
            return response;
        }
        if (attempt == maxAttempts) {
            break;
        }

        const int delay = backoffMs(attempt);
        LOG_WARN(dwGeneration, "Generation attempt %d/%d failed (%s); retrying in %d ms",
                 attempt, maxAttempts,
                 qUtf8Printable(generationFailureKindToString(failure.kind)), delay);
        m_sleep(delay);
    }

    LOG_WARN(dwGeneration, "Generation gave up after %d attempts", maxAttempts);
    return response;
}

} // namespace dw
