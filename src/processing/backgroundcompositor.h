#ifndef BACKGROUNDCOMPOSITOR_H
#define BACKGROUNDCOMPOSITOR_H

#include "appsettings.h"
#include "assemblytypes.h"

#include <QColor>
#include <QObject>
#include <QStringList>

class MediaProber;

/**
 * @brief Normalized background, described as ffmpeg input 0 plus a filter chain
 *
 * The chain turns [0:v] into frames at the output resolution lasting exactly
 * @c duration seconds. An empty chain means the input is already normalized.
 */
struct BackgroundTrack
{
    BackgroundStrategy strategy = BackgroundStrategy::FlatColor;
    QStringList inputArguments;
    QString filterChain;
    double sourceDuration = 0.0;
    double duration = 0.0;
    int loopCopies = 1;
    bool carriesAudio = false;          // Avatar clip: audio comes from input 0
    QColor color;
};

class BackgroundCompositor : public QObject
{
    Q_OBJECT
public:
    explicit BackgroundCompositor(MediaProber *prober, const EncodingSettings &encoding, const QColor &fallbackColor,
                                  QObject *parent = nullptr);

    /**
     * @brief Probes a Visual or AvatarClip source and plans its normalization.
     * Fails with BackgroundUnavailable when the file cannot be opened or decoded.
     * Kind::None and Kind::Color produce the flat-color track; None and an
     * invalid color use the fallback color.
     */
    bool prepare(const BackgroundSource &source, double targetDuration, BackgroundTrack &track,
                 AssemblyError *error = nullptr);

    // Same as prepare() for a source that was already probed
    bool prepareFromProbe(const BackgroundSource &source, const MediaProbe &probe, double targetDuration,
                          BackgroundTrack &track, AssemblyError *error = nullptr);

    BackgroundTrack flatColor(const QColor &color, double targetDuration) const;

    // ceil(target / source), at least 1
    static int loopCopies(double sourceDuration, double targetDuration);
    static QString scaleCropFilter(int sourceWidth, int sourceHeight, int targetWidth, int targetHeight);
    static QString formatSeconds(double seconds);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::APP);

private:
    MediaProber *m_prober;
    EncodingSettings m_encoding;
    QColor m_fallbackColor;
};

#endif // BACKGROUNDCOMPOSITOR_H
