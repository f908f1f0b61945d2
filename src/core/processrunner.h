#ifndef PROCESSRUNNER_H
#define PROCESSRUNNER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <functional>

struct ProcessResult
{
    bool started = false;
    bool crashed = false;
    int exitCode = -1;
    QByteArray standardOutput;
    QString standardError;

    bool succeeded() const { return started && !crashed && exitCode == 0; }
};

/**
 * @brief Blocking invocation of an external tool (ffmpeg, ffprobe)
 *
 * The calling thread is suspended until the process exits. Implementations
 * never enforce a timeout. Tests substitute a fake runner.
 */
class ProcessRunner
{
public:
    using OutputCallback = std::function<void(const QString &chunk)>;

    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const QString &program, const QStringList &arguments,
                              const OutputCallback &onOutput = OutputCallback()) = 0;
};

#endif // PROCESSRUNNER_H
