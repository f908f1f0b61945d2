#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include "assemblytypes.h"

#include <functional>

/**
 * @brief Explicit retry policy for calls that talk to the outside world
 *
 * Applied at the call site. The deterministic pipeline stages are never
 * wrapped in it.
 */
struct RetryPolicy
{
    int maxAttempts = 3;
    int initialDelayMs = 1000;
    double backoffFactor = 2.0;

    // Empty = every error is retryable
    std::function<bool(const AssemblyError &)> isRetryable;
    // Called before sleeping; attempt is 1-based
    std::function<void(int attempt, const AssemblyError &error, int delayMs)> onRetry;
    // Empty = QThread::msleep
    std::function<void(int delayMs)> sleep;
};

void sleepFor(const std::function<void(int)> &sleep, int delayMs);

/**
 * @brief Runs @p attempt until it succeeds, the error is not retryable, or
 * maxAttempts is reached. @p attempt has the signature bool(AssemblyError*).
 * On failure @p error holds the last attempt's error.
 */
template <typename Attempt>
bool withRetry(const RetryPolicy &policy, Attempt attempt, AssemblyError *error, int *attemptsUsed = nullptr)
{
    const int maxAttempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;
    double delayMs = policy.initialDelayMs;

    for (int i = 1; i <= maxAttempts; ++i) {
        AssemblyError attemptError;
        if (attemptsUsed) {
            *attemptsUsed = i;
        }
        if (attempt(&attemptError)) {
            return true;
        }

        const bool retryable = !policy.isRetryable || policy.isRetryable(attemptError);
        if (!retryable || i == maxAttempts) {
            if (error) {
                *error = attemptError;
            }
            return false;
        }

        if (policy.onRetry) {
            policy.onRetry(i, attemptError, static_cast<int>(delayMs));
        }
        sleepFor(policy.sleep, static_cast<int>(delayMs));
        delayMs *= policy.backoffFactor;
    }
    return false;
}

/**
 * @brief Polls @p ready every @p intervalMs until it returns true or
 * @p timeoutMs of wall-clock time has passed (Timeout error).
 */
bool pollUntil(const std::function<bool()> &ready, int intervalMs, int timeoutMs, const QString &what,
               AssemblyError *error, const std::function<void(int)> &sleep = std::function<void(int)>());

#endif // RETRYPOLICY_H
