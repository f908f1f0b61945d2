#ifndef SUBTITLERASTERIZER_H
#define SUBTITLERASTERIZER_H

#include "appsettings.h"
#include "assemblytypes.h"

#include <QFont>
#include <QFontMetrics>
#include <QImage>
#include <QList>
#include <QObject>
#include <QPoint>
#include <QStringList>

/**
 * @brief One subtitle layer ready for composition
 */
struct RasterizedCue
{
    QString imagePath;
    double start = 0.0;
    double duration = 0.0;
    int verticalPosition = 0;           // Top edge of the bitmap inside the frame
    QStringList lines;
};

/**
 * @brief Turns cue text into a transparent PNG the width of the frame
 *
 * Text is wrapped greedily at word boundaries so that each line stays within
 * maxLineWidthRatio of the frame width. The stroke is a filled circular stamp:
 * the text is drawn in the outline color at every integer offset inside the
 * outline radius, then once in the fill color on top.
 */
class SubtitleRasterizer : public QObject
{
    Q_OBJECT
public:
    explicit SubtitleRasterizer(const SubtitleStyle &style, const RasterSettings &raster, QObject *parent = nullptr);

    /**
     * @brief Resolves the configured font. Registers style.fontFile first when
     * set. Falls back to the system default font when the family is not
     * available. Never fails; called lazily by render().
     */
    void prepareFont();
    QFont font() const;
    bool usingFallbackFont() const;

    int maxLineWidth(int frameWidth) const;
    QStringList wrapText(const QString &text, int maxWidth) const;
    QImage render(const QString &text, int frameWidth, QStringList *lines = nullptr);
    int verticalPosition(int frameHeight) const;

    bool rasterize(const SubtitleCue &cue, int index, int frameWidth, int frameHeight,
                   const QString &workDir, RasterizedCue &result, AssemblyError *error = nullptr);

    static QStringList wrapText(const QString &text, const QFontMetrics &metrics, int maxWidth);
    static QList<QPoint> strokeOffsets(int radius);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::APP);

private:
    int lineX(int frameWidth, int textWidth) const;
    void drawBox(QPainter &painter, const QRect &textBlock) const;

    SubtitleStyle m_style;
    RasterSettings m_raster;
    QFont m_font;
    bool m_fontPrepared = false;
    bool m_fallbackFont = false;
    bool m_wordTimingNoticeLogged = false;
};

#endif // SUBTITLERASTERIZER_H
