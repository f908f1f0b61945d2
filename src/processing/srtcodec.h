#ifndef SRTCODEC_H
#define SRTCODEC_H

#include "assemblytypes.h"

#include <QList>
#include <QString>

/**
 * @brief Reader/writer for numbered subtitle cue files
 *
 * Block layout: "{index}\n{HH:MM:SS,mmm} --> {HH:MM:SS,mmm}\n{text}\n\n".
 * Timestamps are rounded to the nearest millisecond on output.
 */
class SrtCodec
{
public:
    static bool parse(const QString &content, QList<SubtitleCue> &cues, AssemblyError *error = nullptr);
    static QString serialize(const QList<SubtitleCue> &cues);

    static bool readFile(const QString &path, QList<SubtitleCue> &cues, AssemblyError *error = nullptr);
    static bool writeFile(const QString &path, const QList<SubtitleCue> &cues, AssemblyError *error = nullptr);

    static QString formatTimestamp(double seconds);
    static bool parseTimestamp(const QString &text, double &seconds);
};

#endif // SRTCODEC_H
