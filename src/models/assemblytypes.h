#ifndef ASSEMBLYTYPES_H
#define ASSEMBLYTYPES_H

#include <QColor>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>

enum class LogCategory
{
    APP,
    FFMPEG,
    TIMING,
    DEBUG
};

/**
 * @brief One word inside a cue, as reported by the transcript collaborator
 */
struct WordTiming
{
    QString text;
    double start = 0.0;
    double end = 0.0;
};

/**
 * @brief One subtitle entry. Times are in seconds.
 *
 * Within a transcript cues are ordered by start and never overlap.
 */
struct SubtitleCue
{
    double start = 0.0;
    double end = 0.0;
    QString text;
    QList<WordTiming> words;

    double duration() const { return end - start; }
};

enum class HorizontalAlignment
{
    Left,
    Center,
    Right
};

enum class HighlightMode
{
    Static,
    PerWordReveal
};

struct SubtitleStyle
{
    QString fontFamily = "Arial";
    QString fontFile;                   // Optional .ttf/.otf to register before lookup
    bool bold = true;
    int fontSize = 85;
    QColor fillColor = QColor(0, 255, 255);
    QColor outlineColor = QColor(0, 0, 0);
    int outlineWidth = 5;
    int marginBottom = 300;             // Distance of the bitmap top from the frame bottom
    HorizontalAlignment alignment = HorizontalAlignment::Center;
    HighlightMode highlightMode = HighlightMode::Static;

    // Optional box drawn behind the text block
    bool boxEnabled = false;
    QColor boxColor = QColor(0, 0, 0);
    double boxOpacity = 0.6;
    int boxPadding = 20;
    int boxCornerRadius = 10;

    void read(const QJsonObject &json);
    void write(QJsonObject &json) const;
};

/**
 * @brief Closed set of background strategies
 */
struct BackgroundSource
{
    enum class Kind
    {
        None,       // Nothing supplied, flat-color fallback
        Visual,     // Stock footage or any local video file
        Color,      // Explicit RGB
        AvatarClip  // Generated clip that already carries the narration
    };

    Kind kind = Kind::None;
    QString path;
    QColor color;

    static BackgroundSource visual(const QString &path);
    static BackgroundSource flatColor(const QColor &color);
    static BackgroundSource avatarClip(const QString &path);
};

struct AssemblyRequest
{
    QString jobId;
    QString audioPath;
    double audioDuration = 0.0;
    double estimatedDuration = 0.0;     // Duration the cue timestamps were computed against
    BackgroundSource background;
    QList<SubtitleCue> cues;
    SubtitleStyle style;
    QString outputPath;
    QString workDir;                    // Scratch space for rasterized cues
};

struct MediaProbe
{
    int width = 0;                      // Displayed size, rotation already applied
    int height = 0;
    int rotation = 0;                   // Degrees from the stream's display matrix or rotate tag
    double durationSeconds = 0.0;
    qint64 sizeBytes = 0;
    bool hasAudioStream = false;
    bool hasVideoStream = false;
    QString videoCodec;
};

struct ValidationReport
{
    bool passed = false;
    QStringList issues;
};

enum class BackgroundStrategy
{
    Visual,
    FlatColor,
    AvatarPassthrough
};

struct AssemblyResult
{
    QString outputPath;
    ValidationReport validation;
    BackgroundStrategy strategy = BackgroundStrategy::FlatColor;
    double outputDuration = 0.0;
};

struct AssemblyError
{
    enum class Kind
    {
        None,
        DegenerateTiming,
        BackgroundUnavailable,
        EncodingFailed,
        InvalidInput,
        ProbeFailed,
        Timeout
    };

    Kind kind = Kind::None;
    QString message;
    QString diagnostics;                // Raw tool output, kept for the log

    bool isFatal() const { return kind != Kind::None && kind != Kind::BackgroundUnavailable; }

    static QString kindName(Kind kind);
};

/**
 * @brief Fills @p error if it is not null. Always returns false so callers can
 * write "return fail(error, ...);".
 */
bool fail(AssemblyError *error, AssemblyError::Kind kind, const QString &message,
          const QString &diagnostics = QString());

QString logCategoryToString(LogCategory category);
QString horizontalAlignmentToString(HorizontalAlignment alignment);
HorizontalAlignment horizontalAlignmentFromString(const QString &value);
QString highlightModeToString(HighlightMode mode);
HighlightMode highlightModeFromString(const QString &value);
QString backgroundStrategyToString(BackgroundStrategy strategy);

Q_DECLARE_METATYPE(AssemblyRequest)
Q_DECLARE_METATYPE(AssemblyResult)
Q_DECLARE_METATYPE(AssemblyError)

#endif // ASSEMBLYTYPES_H
