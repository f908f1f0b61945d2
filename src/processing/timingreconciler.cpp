#include "timingreconciler.h"

TimingReconciler::TimingReconciler(QObject *parent) : QObject(parent)
{
}

QList<SubtitleCue> TimingReconciler::scaleCues(const QList<SubtitleCue> &cues, double factor)
{
    QList<SubtitleCue> scaled;
    scaled.reserve(cues.size());
    for (const SubtitleCue &cue : cues) {
        SubtitleCue copy = cue;
        copy.start = cue.start * factor;
        copy.end = cue.end * factor;
        for (WordTiming &word : copy.words) {
            word.start *= factor;
            word.end *= factor;
        }
        scaled.append(copy);
    }
    return scaled;
}

bool TimingReconciler::isOrdered(const QList<SubtitleCue> &cues, QString *problem)
{
    for (int i = 0; i < cues.size(); ++i) {
        const SubtitleCue &cue = cues.at(i);
        if (!(cue.end > cue.start)) {
            if (problem) {
                *problem = QString("cue %1 ends at %2 s, not after its start %3 s")
                               .arg(i + 1).arg(cue.end).arg(cue.start);
            }
            return false;
        }
        if (i > 0 && cue.start < cues.at(i - 1).end) {
            if (problem) {
                *problem = QString("cue %1 starts at %2 s, before cue %3 ends at %4 s")
                               .arg(i + 1).arg(cue.start).arg(i).arg(cues.at(i - 1).end);
            }
            return false;
        }
    }
    return true;
}

double TimingReconciler::lastCueEnd(const QList<SubtitleCue> &cues)
{
    return cues.isEmpty() ? 0.0 : cues.last().end;
}

bool TimingReconciler::reconcile(const QList<SubtitleCue> &cues, double estimatedDuration, double actualDuration,
                                 QList<SubtitleCue> &reconciled, AssemblyError *error)
{
    if (estimatedDuration <= 0.0) {
        return fail(error, AssemblyError::Kind::DegenerateTiming,
                    QString("Estimated duration is %1 s, timing cannot be rescaled").arg(estimatedDuration));
    }
    if (actualDuration <= 0.0) {
        return fail(error, AssemblyError::Kind::DegenerateTiming,
                    QString("Actual audio duration is %1 s").arg(actualDuration));
    }

    QString problem;
    if (!isOrdered(cues, &problem)) {
        return fail(error, AssemblyError::Kind::InvalidInput, "Cue sequence is not ordered: " + problem);
    }

    const double factor = actualDuration / estimatedDuration;
    emit logMessage(QString("Rescaling %1 cues: estimated %2 s -> actual %3 s (factor %4)")
                        .arg(cues.size())
                        .arg(estimatedDuration, 0, 'f', 3)
                        .arg(actualDuration, 0, 'f', 3)
                        .arg(factor, 0, 'f', 4));

    QList<SubtitleCue> scaled = scaleCues(cues, factor);

    // A positive factor keeps the order; anything else is a bug upstream
    if (!isOrdered(scaled, &problem)) {
        return fail(error, AssemblyError::Kind::DegenerateTiming, "Rescaled cues lost their order: " + problem);
    }

    if (!scaled.isEmpty()) {
        emit logMessage(QString("Last cue now ends at %1 s").arg(scaled.last().end, 0, 'f', 3));
    }
    reconciled = scaled;
    return true;
}
