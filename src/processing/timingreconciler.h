#ifndef TIMINGRECONCILER_H
#define TIMINGRECONCILER_H

#include "assemblytypes.h"

#include <QList>
#include <QObject>

/**
 * @brief Rescales cues from the estimated narration timeline onto the real one
 *
 * One scale factor (actual / estimated) per request, applied to every cue
 * start/end and to every word timing. No per-cue correction, no clamping.
 */
class TimingReconciler : public QObject
{
    Q_OBJECT
public:
    explicit TimingReconciler(QObject *parent = nullptr);

    bool reconcile(const QList<SubtitleCue> &cues, double estimatedDuration, double actualDuration,
                   QList<SubtitleCue> &reconciled, AssemblyError *error = nullptr);

    static QList<SubtitleCue> scaleCues(const QList<SubtitleCue> &cues, double factor);

    // Sorted by start, end > start, no cue starts before the previous one ends
    static bool isOrdered(const QList<SubtitleCue> &cues, QString *problem = nullptr);

    // End of the last cue, 0 when there are none
    static double lastCueEnd(const QList<SubtitleCue> &cues);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::TIMING);
};

#endif // TIMINGRECONCILER_H
