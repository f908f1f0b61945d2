/**
 * @file retrypolicy_test.cpp
 * @brief Unit tests for withRetry and pollUntil
 */

#include <QtTest/QtTest>

#include "retrypolicy.h"

class RetryPolicyTest : public QObject
{
    Q_OBJECT

private slots:
    void testWithRetry_succeedsFirstTime();
    void testWithRetry_succeedsAfterFailuresWithBackoff();
    void testWithRetry_exhaustsAttempts();
    void testWithRetry_nonRetryableStopsImmediately();
    void testPollUntil_readyImmediately();
    void testPollUntil_becomesReady();
    void testPollUntil_timesOut();

private:
    static RetryPolicy fastPolicy(QList<int>* delays);
};

RetryPolicy RetryPolicyTest::fastPolicy(QList<int>* delays)
{
    RetryPolicy policy;
    policy.maxAttempts = 3;
    policy.initialDelayMs = 10;
    policy.backoffFactor = 2.0;
    policy.sleep = [delays](int ms) { delays->append(ms); };
    return policy;
}

void RetryPolicyTest::testWithRetry_succeedsFirstTime()
{
    QList<int> delays;
    int attempts = 0;
    AssemblyError error;
    QVERIFY(withRetry(fastPolicy(&delays), [](AssemblyError*) { return true; }, &error, &attempts));
    QCOMPARE(attempts, 1);
    QVERIFY(delays.isEmpty());
}

void RetryPolicyTest::testWithRetry_succeedsAfterFailuresWithBackoff()
{
    QList<int> delays;
    QList<int> retried;
    RetryPolicy policy = fastPolicy(&delays);
    policy.onRetry = [&retried](int attempt, const AssemblyError&, int) { retried.append(attempt); };

    int calls = 0;
    int attempts = 0;
    const bool ok = withRetry(policy, [&calls](AssemblyError* e)
    {
        ++calls;
        if (calls < 3)
        {
            return fail(e, AssemblyError::Kind::ProbeFailed, "not yet");
        }
        return true;
    }, nullptr, &attempts);

    QVERIFY(ok);
    QCOMPARE(attempts, 3);
    QCOMPARE(delays, QList<int>({10, 20}));
    QCOMPARE(retried, QList<int>({1, 2}));
}

void RetryPolicyTest::testWithRetry_exhaustsAttempts()
{
    QList<int> delays;
    int calls = 0;
    AssemblyError error;
    const bool ok = withRetry(fastPolicy(&delays), [&calls](AssemblyError* e)
    {
        ++calls;
        return fail(e, AssemblyError::Kind::ProbeFailed, QString("attempt %1").arg(calls));
    }, &error);

    QVERIFY(!ok);
    QCOMPARE(calls, 3);
    QCOMPARE(error.kind, AssemblyError::Kind::ProbeFailed);
    QCOMPARE(error.message, QString("attempt 3"));
    // No sleep after the last attempt
    QCOMPARE(delays.size(), 2);
}

void RetryPolicyTest::testWithRetry_nonRetryableStopsImmediately()
{
    QList<int> delays;
    RetryPolicy policy = fastPolicy(&delays);
    policy.isRetryable = [](const AssemblyError& e) { return e.kind == AssemblyError::Kind::ProbeFailed; };

    int calls = 0;
    AssemblyError error;
    QVERIFY(!withRetry(policy, [&calls](AssemblyError* e)
    {
        ++calls;
        return fail(e, AssemblyError::Kind::InvalidInput, "bad input");
    }, &error));
    QCOMPARE(calls, 1);
    QCOMPARE(error.kind, AssemblyError::Kind::InvalidInput);
    QVERIFY(delays.isEmpty());
}

void RetryPolicyTest::testPollUntil_readyImmediately()
{
    AssemblyError error;
    QVERIFY(pollUntil([]() { return true; }, 1000, 0, "nothing", &error));
}

void RetryPolicyTest::testPollUntil_becomesReady()
{
    int polls = 0;
    AssemblyError error;
    QVERIFY(pollUntil([&polls]() { return ++polls >= 3; }, 1, 5000, "third poll", &error));
    QCOMPARE(polls, 3);
}

void RetryPolicyTest::testPollUntil_timesOut()
{
    QElapsedTimer timer;
    timer.start();
    AssemblyError error;
    QVERIFY(!pollUntil([]() { return false; }, 5, 50, "never", &error));
    QCOMPARE(error.kind, AssemblyError::Kind::Timeout);
    QVERIFY(error.message.contains("never"));
    QVERIFY(timer.elapsed() >= 50);
}

QTEST_MAIN(RetryPolicyTest)
#include "retrypolicy_test.moc"
