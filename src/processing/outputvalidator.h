#ifndef OUTPUTVALIDATOR_H
#define OUTPUTVALIDATOR_H

#include "appsettings.h"
#include "assemblytypes.h"

#include <QObject>

class MediaProber;

/**
 * @brief Checks a produced file against the platform constraints
 *
 * Issues are advisory. The file is never modified or deleted here.
 */
class OutputValidator : public QObject
{
    Q_OBJECT
public:
    explicit OutputValidator(MediaProber *prober, const PlatformConstraints &constraints, QObject *parent = nullptr);

    // @p probe receives the probe of the file when it could be read
    ValidationReport validateFile(const QString &filePath, MediaProbe *probe = nullptr);

    // Pure function of the probe
    static ValidationReport validate(const MediaProbe &probe, const PlatformConstraints &constraints);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::APP);

private:
    MediaProber *m_prober;
    PlatformConstraints m_constraints;
};

#endif // OUTPUTVALIDATOR_H
