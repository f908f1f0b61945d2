#include "subtitlerasterizer.h"

#include <QDir>
#include <QFileInfo>
#include <QFontDatabase>
#include <QPainter>
#include <QPainterPath>
#include <QRegularExpression>
#include <QtMath>

SubtitleRasterizer::SubtitleRasterizer(const SubtitleStyle &style, const RasterSettings &raster, QObject *parent)
    : QObject(parent),
    m_style(style),
    m_raster(raster)
{}

void SubtitleRasterizer::prepareFont()
{
    if (m_fontPrepared) {
        return;
    }
    m_fontPrepared = true;

    QString family = m_style.fontFamily;
    if (!m_style.fontFile.isEmpty()) {
        const int fontId = QFontDatabase::addApplicationFont(m_style.fontFile);
        const QStringList families = fontId == -1 ? QStringList() : QFontDatabase::applicationFontFamilies(fontId);
        if (families.isEmpty()) {
            emit logMessage("Failed to load font file " + QFileInfo(m_style.fontFile).fileName(), LogCategory::APP);
        } else {
            family = families.first();
            emit logMessage(QString("Registered font '%1' from %2").arg(family, QFileInfo(m_style.fontFile).fileName()),
                            LogCategory::DEBUG);
        }
    }

    if (!family.isEmpty() && QFontDatabase::families().contains(family, Qt::CaseInsensitive)) {
        m_font = QFont(family);
        m_fallbackFont = false;
    } else {
        m_font = QFontDatabase::systemFont(QFontDatabase::GeneralFont);
        m_fallbackFont = true;
        emit logMessage(QString("Font '%1' is not available, using system font '%2'").arg(family, m_font.family()),
                        LogCategory::APP);
    }
    m_font.setPixelSize(qMax(1, m_style.fontSize));
    m_font.setBold(m_style.bold);
}

QFont SubtitleRasterizer::font() const
{
    return m_font;
}

bool SubtitleRasterizer::usingFallbackFont() const
{
    return m_fallbackFont;
}

int SubtitleRasterizer::maxLineWidth(int frameWidth) const
{
    return static_cast<int>(frameWidth * m_raster.maxLineWidthRatio);
}

QStringList SubtitleRasterizer::wrapText(const QString &text, const QFontMetrics &metrics, int maxWidth)
{
    static const QRegularExpression whitespace("\\s+");
    const QStringList words = text.split(whitespace, Qt::SkipEmptyParts);

    QStringList lines;
    QString current;
    for (const QString &word : words) {
        const QString candidate = current.isEmpty() ? word : current + ' ' + word;
        if (current.isEmpty() || metrics.horizontalAdvance(candidate) <= maxWidth) {
            current = candidate;
        } else {
            lines.append(current);
            current = word;
        }
    }
    if (!current.isEmpty()) {
        lines.append(current);
    }
    return lines;
}

QStringList SubtitleRasterizer::wrapText(const QString &text, int maxWidth) const
{
    return wrapText(text, QFontMetrics(m_font), maxWidth);
}

QList<QPoint> SubtitleRasterizer::strokeOffsets(int radius)
{
    QList<QPoint> offsets;
    if (radius <= 0) {
        return offsets;
    }
    const int radiusSquared = radius * radius;
    for (int dx = -radius; dx <= radius; ++dx) {
        for (int dy = -radius; dy <= radius; ++dy) {
            if (dx * dx + dy * dy <= radiusSquared) {
                offsets.append(QPoint(dx, dy));
            }
        }
    }
    return offsets;
}

int SubtitleRasterizer::verticalPosition(int frameHeight) const
{
    return frameHeight - m_style.marginBottom;
}

int SubtitleRasterizer::lineX(int frameWidth, int textWidth) const
{
    const int areaWidth = maxLineWidth(frameWidth);
    const int areaLeft = (frameWidth - areaWidth) / 2;
    switch (m_style.alignment) {
    case HorizontalAlignment::Left:
        return areaLeft;
    case HorizontalAlignment::Right:
        return areaLeft + areaWidth - textWidth;
    case HorizontalAlignment::Center:
        break;
    }
    return (frameWidth - textWidth) / 2;
}

void SubtitleRasterizer::drawBox(QPainter &painter, const QRect &textBlock) const
{
    QColor boxColor = m_style.boxColor;
    boxColor.setAlphaF(static_cast<float>(qBound(0.0, m_style.boxOpacity, 1.0)));

    const int padding = m_style.boxPadding;
    QRectF boxRect = QRectF(textBlock).adjusted(-padding, -padding, padding, padding);

    QPainterPath path;
    path.addRoundedRect(boxRect, m_style.boxCornerRadius, m_style.boxCornerRadius);
    painter.fillPath(path, boxColor);
}

QImage SubtitleRasterizer::render(const QString &text, int frameWidth, QStringList *lines)
{
    prepareFont();

    QImage image(frameWidth, m_raster.bitmapHeight, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    const QFontMetrics metrics(m_font);
    const QStringList wrapped = wrapText(text, metrics, maxLineWidth(frameWidth));
    if (lines) {
        *lines = wrapped;
    }
    if (wrapped.isEmpty()) {
        return image;
    }

    const int lineHeight = m_style.fontSize + m_raster.lineSpacing;
    const int totalHeight = wrapped.size() * lineHeight;
    const int top = (m_raster.bitmapHeight - totalHeight) / 2;
    if (totalHeight > m_raster.bitmapHeight) {
        emit logMessage(QString("%1 lines do not fit into %2 px: \"%3\"")
                            .arg(wrapped.size()).arg(m_raster.bitmapHeight).arg(text),
                        LogCategory::DEBUG);
    }

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);
    painter.setFont(m_font);

    QList<QPoint> origins;
    QRect textBlock;
    for (int i = 0; i < wrapped.size(); ++i) {
        const int width = metrics.horizontalAdvance(wrapped.at(i));
        const int x = lineX(frameWidth, width);
        const int y = top + i * lineHeight;
        origins.append(QPoint(x, y + metrics.ascent()));
        textBlock = textBlock.united(QRect(x, y, width, lineHeight));
    }

    if (m_style.boxEnabled) {
        drawBox(painter, textBlock);
    }

    const QList<QPoint> offsets = strokeOffsets(m_style.outlineWidth);
    painter.setPen(m_style.outlineColor);
    for (int i = 0; i < wrapped.size(); ++i) {
        for (const QPoint &offset : offsets) {
            painter.drawText(origins.at(i) + offset, wrapped.at(i));
        }
    }

    painter.setPen(m_style.fillColor);
    for (int i = 0; i < wrapped.size(); ++i) {
        painter.drawText(origins.at(i), wrapped.at(i));
    }
    painter.end();

    return image;
}

bool SubtitleRasterizer::rasterize(const SubtitleCue &cue, int index, int frameWidth, int frameHeight,
                                   const QString &workDir, RasterizedCue &result, AssemblyError *error)
{
    if (m_style.highlightMode == HighlightMode::PerWordReveal && !cue.words.isEmpty() && !m_wordTimingNoticeLogged) {
        // Per-word reveal is not animated: the whole cue is one static bitmap
        emit logMessage("Karaoke mode: word timings received, cue is rendered as one static bitmap", LogCategory::DEBUG);
        m_wordTimingNoticeLogged = true;
    }

    QStringList lines;
    const QImage image = render(cue.text, frameWidth, &lines);

    const QString imagePath = QDir(workDir).filePath(QString::asprintf("cue_%03d.png", index));
    if (!image.save(imagePath, "PNG")) {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    "Failed to save subtitle bitmap: " + imagePath);
    }

    result.imagePath = imagePath;
    result.start = cue.start;
    result.duration = cue.duration();
    result.verticalPosition = verticalPosition(frameHeight);
    result.lines = lines;
    return true;
}
