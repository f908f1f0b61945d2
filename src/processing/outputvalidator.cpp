#include "outputvalidator.h"
#include "mediaprober.h"

#include <QFileInfo>

OutputValidator::OutputValidator(MediaProber *prober, const PlatformConstraints &constraints, QObject *parent)
    : QObject(parent),
    m_prober(prober),
    m_constraints(constraints)
{}

ValidationReport OutputValidator::validate(const MediaProbe &probe, const PlatformConstraints &constraints)
{
    ValidationReport report;

    if (probe.width != constraints.width || probe.height != constraints.height) {
        report.issues.append(QString("Wrong resolution: %1x%2 (expected %3x%4)")
                                 .arg(probe.width).arg(probe.height)
                                 .arg(constraints.width).arg(constraints.height));
    }

    if (probe.durationSeconds < constraints.minDurationS) {
        report.issues.append(QString("Video too short: %1 s (min %2 s)")
                                 .arg(probe.durationSeconds, 0, 'f', 1).arg(constraints.minDurationS));
    } else if (probe.durationSeconds > constraints.maxDurationS) {
        report.issues.append(QString("Video too long: %1 s (max %2 s)")
                                 .arg(probe.durationSeconds, 0, 'f', 1).arg(constraints.maxDurationS));
    }

    if (probe.sizeBytes > constraints.maxSizeBytes) {
        const double mib = 1024.0 * 1024.0;
        report.issues.append(QString("File too large: %1 MB (max %2 MB)")
                                 .arg(probe.sizeBytes / mib, 0, 'f', 1)
                                 .arg(constraints.maxSizeBytes / mib, 0, 'f', 0));
    }

    if (!probe.hasAudioStream) {
        report.issues.append("No audio stream");
    }

    report.passed = report.issues.isEmpty();
    return report;
}

ValidationReport OutputValidator::validateFile(const QString &filePath, MediaProbe *probe)
{
    ValidationReport report;

    if (!QFileInfo::exists(filePath)) {
        report.issues.append("Output file does not exist: " + filePath);
        emit logMessage(report.issues.first(), LogCategory::APP);
        return report;
    }

    MediaProbe fileProbe;
    AssemblyError error;
    if (!m_prober->probe(filePath, fileProbe, &error)) {
        report.issues.append("Output file could not be probed: " + error.message);
        emit logMessage(report.issues.first(), LogCategory::APP);
        return report;
    }

    if (probe) {
        *probe = fileProbe;
    }
    report = validate(fileProbe, m_constraints);
    if (report.passed) {
        emit logMessage("Validation passed: " + QFileInfo(filePath).fileName(), LogCategory::APP);
    } else {
        emit logMessage(QString("Validation reported %1 issue(s) for %2: %3")
                            .arg(report.issues.size())
                            .arg(QFileInfo(filePath).fileName())
                            .arg(report.issues.join("; ")),
                        LogCategory::APP);
    }
    return report;
}
