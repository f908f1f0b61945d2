#include "retrypolicy.h"

#include <QElapsedTimer>
#include <QThread>

void sleepFor(const std::function<void(int)> &sleep, int delayMs)
{
    if (delayMs <= 0) {
        return;
    }
    if (sleep) {
        sleep(delayMs);
    } else {
        QThread::msleep(static_cast<unsigned long>(delayMs));
    }
}

bool pollUntil(const std::function<bool()> &ready, int intervalMs, int timeoutMs, const QString &what,
               AssemblyError *error, const std::function<void(int)> &sleep)
{
    QElapsedTimer timer;
    timer.start();

    while (true) {
        if (ready()) {
            return true;
        }
        if (timer.elapsed() >= timeoutMs) {
            return fail(error, AssemblyError::Kind::Timeout,
                        QString("Timed out after %1 ms waiting for %2").arg(timeoutMs).arg(what));
        }
        sleepFor(sleep, intervalMs);
    }
}
