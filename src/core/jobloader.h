#ifndef JOBLOADER_H
#define JOBLOADER_H

#include "assemblytypes.h"

#include <QColor>
#include <QJsonArray>
#include <QMap>
#include <QObject>

/**
 * @brief Reads a job directory (job.json plus the files it names) into an AssemblyRequest
 *
 * Relative paths in job.json are resolved against the job directory.
 */
class JobLoader : public QObject
{
    Q_OBJECT
public:
    explicit JobLoader(const SubtitleStyle &defaultStyle, const QMap<QString, QColor> &themeColors,
                       const QColor &fallbackColor, QObject *parent = nullptr);

    bool load(const QString &jobDir, AssemblyRequest &request, AssemblyError *error = nullptr);

    static QString jobFileName() { return "job.json"; }
    static bool parseCues(const QJsonArray &array, QList<SubtitleCue> &cues, AssemblyError *error = nullptr);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::APP);

private:
    bool parseBackground(const QJsonObject &json, const QString &jobDir, BackgroundSource &source,
                         AssemblyError *error);
    QColor themeColor(const QString &theme);

    SubtitleStyle m_defaultStyle;
    QMap<QString, QColor> m_themeColors;
    QColor m_fallbackColor;
};

#endif // JOBLOADER_H
