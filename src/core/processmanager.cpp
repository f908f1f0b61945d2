#include "processmanager.h"

#include <QFileInfo>
#include <QStringDecoder>

ProcessManager::ProcessManager(QObject* parent) : QObject{parent}
{
}

ProcessManager::~ProcessManager()
{
}

ProcessResult ProcessManager::run(const QString& program, const QStringList& arguments, const OutputCallback& onOutput)
{
    emit processOutput(QString("Starting (blocking): %1 %2").arg(program, arguments.join(" ")));

    ProcessResult result;
    QProcess process;
    process.start(program, arguments);

    if (!process.waitForStarted(-1))
    {
        result.standardError = process.errorString();
        emit processError("Failed to start process: " + process.errorString());
        return result;
    }
    result.started = true;

    // Stateful, so a UTF-8 sequence split between two reads is kept whole
    QStringDecoder stdoutDecoder(QStringDecoder::Utf8);
    QStringDecoder stderrDecoder(QStringDecoder::Utf8);

    auto drain = [&]()
    {
        QByteArray out = process.readAllStandardOutput();
        if (!out.isEmpty())
        {
            result.standardOutput.append(out);
            const QString chunk = stdoutDecoder.decode(out);
            if (onOutput && !chunk.isEmpty())
            {
                onOutput(chunk);
            }
            if (!chunk.isEmpty())
            {
                emit processOutput(chunk);
            }
        }
        QByteArray err = process.readAllStandardError();
        if (!err.isEmpty())
        {
            const QString chunk = stderrDecoder.decode(err);
            result.standardError.append(chunk);
            if (!chunk.isEmpty())
            {
                emit processStdErr(chunk);
            }
        }
    };

    // No timeout: the encoder runs to completion or failure
    while (!process.waitForFinished(250))
    {
        if (process.state() == QProcess::NotRunning)
        {
            break;
        }
        drain();
    }
    drain();

    result.crashed = process.exitStatus() != QProcess::NormalExit;
    result.exitCode = process.exitCode();

    if (!result.succeeded())
    {
        emit processError(QString("Process '%1' failed. Code: %2, Status: %3.")
                              .arg(QFileInfo(program).fileName())
                              .arg(result.exitCode)
                              .arg(result.crashed ? "Crash" : "Normal"));
    }
    else
    {
        emit processOutput(QString("Process '%1' finished with code 0.").arg(QFileInfo(program).fileName()));
    }
    return result;
}
