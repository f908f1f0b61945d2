#ifndef PROCESSMANAGER_H
#define PROCESSMANAGER_H

#include "processrunner.h"

#include <QObject>
#include <QProcess>


class ProcessManager : public QObject, public ProcessRunner
{
    Q_OBJECT
public:
    explicit ProcessManager(QObject *parent = nullptr);
    ~ProcessManager() override;

    ProcessResult run(const QString &program, const QStringList &arguments,
                      const OutputCallback &onOutput = OutputCallback()) override;

signals:
    void processOutput(const QString &output);
    void processError(const QString &error);
    void processStdErr(const QString &output);
};

#endif // PROCESSMANAGER_H
