#include "appsettings.h"
#include <QCoreApplication>
#include <QStandardPaths>
#include <QDir>
#include <QFileInfo>
#include <QVariantList>


static QString findExecutablePath(const QString &exeName) {
    // 1. tools/ next to the binary
    const QString kAppDir = QCoreApplication::applicationDirPath();
    QString candidate = QDir(kAppDir).filePath("tools/" + exeName);
    if (QFileInfo::exists(candidate)) {
        return QDir::toNativeSeparators(candidate);
    }

    // 2. next to the binary
    candidate = QDir(kAppDir).filePath(exeName);
    if (QFileInfo::exists(candidate)) {
        return QDir::toNativeSeparators(candidate);
    }

    // 3. PATH
    QString path = QStandardPaths::findExecutable(exeName);
    if (!path.isEmpty()) {
        return QDir::toNativeSeparators(path);
    }

    // 4. Bare name, QProcess will report if it cannot be started
    return exeName;
}

/**
 * @brief Load a tool path from settings, re-detecting if the stored path no longer exists.
 */
static QString loadToolPath(const QSettings &settings, const QString &key, const QString &exeName) {
    QString stored = settings.value(key).toString();
    if (!stored.isEmpty() && QFileInfo::exists(stored)) {
        return stored;
    }
    return findExecutablePath(exeName);
}

static QColor colorValue(const QSettings &settings, const QString &key, const QColor &fallback) {
    QColor color = QColor::fromString(settings.value(key, fallback.name()).toString());
    return color.isValid() ? color : fallback;
}

AppSettings& AppSettings::instance() {
    static AppSettings self;
    return self;
}

AppSettings::AppSettings(QObject *parent) : QObject(parent) {
    loadDefaults();
}

void AppSettings::loadDefaults() {
    m_ffmpegPath = findExecutablePath("ffmpeg");
    m_ffprobePath = findExecutablePath("ffprobe");
    m_encoding = EncodingSettings();
    m_platform = PlatformConstraints();
    m_raster = RasterSettings();
    m_defaultStyle = SubtitleStyle();
    m_fallbackColor = QColor(20, 20, 40);
    m_themeColors.clear();
    m_themeColors.insert("motivation", QColor(20, 30, 60));
    m_themeColors.insert("productivite", QColor(30, 20, 40));
    m_themeColors.insert("tech", QColor(10, 20, 30));
    m_themeColors.insert("business", QColor(30, 30, 30));
    m_themeColors.insert("sante", QColor(20, 40, 30));
    m_avatarPoll = PollSettings();
    m_probeRetry = RetrySettings();
    m_enabledLogCategories = {LogCategory::APP, LogCategory::TIMING};
    m_logFilePath = "clipassembler.log";
}

void AppSettings::load(const QString &iniPath) {
    m_iniPath = iniPath;
    if (m_iniPath.isEmpty()) {
        QSettings settings("ClipAssembler", "ClipAssembler");
        readFrom(settings);
    } else {
        QSettings settings(m_iniPath, QSettings::IniFormat);
        readFrom(settings);
    }
}

void AppSettings::save() const {
    if (m_iniPath.isEmpty()) {
        QSettings settings("ClipAssembler", "ClipAssembler");
        writeTo(settings);
    } else {
        QSettings settings(m_iniPath, QSettings::IniFormat);
        writeTo(settings);
    }
}

void AppSettings::readFrom(QSettings &settings) {
    const EncodingSettings enc;
    const PlatformConstraints plat;
    const RasterSettings raster;
    const SubtitleStyle style;

    m_ffmpegPath = loadToolPath(settings, "paths/ffmpeg", "ffmpeg");
    m_ffprobePath = loadToolPath(settings, "paths/ffprobe", "ffprobe");

    m_encoding.width = settings.value("encoding/width", enc.width).toInt();
    m_encoding.height = settings.value("encoding/height", enc.height).toInt();
    m_encoding.fps = settings.value("encoding/fps", enc.fps).toInt();
    m_encoding.videoCodec = settings.value("encoding/videoCodec", enc.videoCodec).toString();
    m_encoding.preset = settings.value("encoding/preset", enc.preset).toString();
    m_encoding.crf = settings.value("encoding/crf", enc.crf).toInt();
    m_encoding.pixelFormat = settings.value("encoding/pixelFormat", enc.pixelFormat).toString();
    m_encoding.audioCodec = settings.value("encoding/audioCodec", enc.audioCodec).toString();
    m_encoding.audioBitrate = settings.value("encoding/audioBitrate", enc.audioBitrate).toString();

    m_platform.width = settings.value("platform/width", plat.width).toInt();
    m_platform.height = settings.value("platform/height", plat.height).toInt();
    m_platform.minDurationS = settings.value("platform/minDuration", plat.minDurationS).toDouble();
    m_platform.maxDurationS = settings.value("platform/maxDuration", plat.maxDurationS).toDouble();
    m_platform.maxSizeBytes = settings.value("platform/maxSizeBytes", plat.maxSizeBytes).toLongLong();

    m_raster.bitmapHeight = settings.value("subtitles/bitmapHeight", raster.bitmapHeight).toInt();
    m_raster.maxLineWidthRatio = settings.value("subtitles/maxLineWidthRatio", raster.maxLineWidthRatio).toDouble();
    m_raster.lineSpacing = settings.value("subtitles/lineSpacing", raster.lineSpacing).toInt();

    m_defaultStyle.fontFamily = settings.value("subtitles/fontFamily", style.fontFamily).toString();
    m_defaultStyle.fontFile = settings.value("subtitles/fontFile", style.fontFile).toString();
    m_defaultStyle.bold = settings.value("subtitles/bold", style.bold).toBool();
    m_defaultStyle.fontSize = settings.value("subtitles/fontSize", style.fontSize).toInt();
    m_defaultStyle.fillColor = colorValue(settings, "subtitles/fillColor", style.fillColor);
    m_defaultStyle.outlineColor = colorValue(settings, "subtitles/outlineColor", style.outlineColor);
    m_defaultStyle.outlineWidth = settings.value("subtitles/outlineWidth", style.outlineWidth).toInt();
    m_defaultStyle.marginBottom = settings.value("subtitles/marginBottom", style.marginBottom).toInt();
    m_defaultStyle.alignment = horizontalAlignmentFromString(
        settings.value("subtitles/alignment", horizontalAlignmentToString(style.alignment)).toString());
    m_defaultStyle.highlightMode = highlightModeFromString(
        settings.value("subtitles/highlightMode", highlightModeToString(style.highlightMode)).toString());
    m_defaultStyle.boxEnabled = settings.value("subtitles/boxEnabled", style.boxEnabled).toBool();
    m_defaultStyle.boxColor = colorValue(settings, "subtitles/boxColor", style.boxColor);
    m_defaultStyle.boxOpacity = settings.value("subtitles/boxOpacity", style.boxOpacity).toDouble();
    m_defaultStyle.boxPadding = settings.value("subtitles/boxPadding", style.boxPadding).toInt();
    m_defaultStyle.boxCornerRadius = settings.value("subtitles/boxCornerRadius", style.boxCornerRadius).toInt();

    m_fallbackColor = colorValue(settings, "background/fallbackColor", m_fallbackColor);
    settings.beginGroup("themes");
    const QStringList themeKeys = settings.childKeys();
    for (const QString &theme : themeKeys) {
        QColor color = QColor::fromString(settings.value(theme).toString());
        if (color.isValid()) {
            m_themeColors.insert(theme, color);
        }
    }
    settings.endGroup();

    m_avatarPoll.intervalMs = settings.value("avatar/pollIntervalMs", m_avatarPoll.intervalMs).toInt();
    m_avatarPoll.timeoutMs = settings.value("avatar/waitTimeoutMs", m_avatarPoll.timeoutMs).toInt();
    m_probeRetry.maxAttempts = settings.value("probe/maxAttempts", m_probeRetry.maxAttempts).toInt();
    m_probeRetry.initialDelayMs = settings.value("probe/initialDelayMs", m_probeRetry.initialDelayMs).toInt();
    m_probeRetry.backoffFactor = settings.value("probe/backoffFactor", m_probeRetry.backoffFactor).toDouble();

    QVariantList enabledCategoriesInts = settings.value("logging/enabledCategories").toList();
    if (!enabledCategoriesInts.isEmpty()) {
        m_enabledLogCategories.clear();
        for (const QVariant& val : enabledCategoriesInts) {
            m_enabledLogCategories.insert(static_cast<LogCategory>(val.toInt()));
        }
    }
    m_logFilePath = settings.value("logging/file", m_logFilePath).toString();
}

void AppSettings::writeTo(QSettings &settings) const {
    settings.setValue("paths/ffmpeg", m_ffmpegPath);
    settings.setValue("paths/ffprobe", m_ffprobePath);

    settings.setValue("encoding/width", m_encoding.width);
    settings.setValue("encoding/height", m_encoding.height);
    settings.setValue("encoding/fps", m_encoding.fps);
    settings.setValue("encoding/videoCodec", m_encoding.videoCodec);
    settings.setValue("encoding/preset", m_encoding.preset);
    settings.setValue("encoding/crf", m_encoding.crf);
    settings.setValue("encoding/pixelFormat", m_encoding.pixelFormat);
    settings.setValue("encoding/audioCodec", m_encoding.audioCodec);
    settings.setValue("encoding/audioBitrate", m_encoding.audioBitrate);

    settings.setValue("platform/width", m_platform.width);
    settings.setValue("platform/height", m_platform.height);
    settings.setValue("platform/minDuration", m_platform.minDurationS);
    settings.setValue("platform/maxDuration", m_platform.maxDurationS);
    settings.setValue("platform/maxSizeBytes", m_platform.maxSizeBytes);

    settings.setValue("subtitles/bitmapHeight", m_raster.bitmapHeight);
    settings.setValue("subtitles/maxLineWidthRatio", m_raster.maxLineWidthRatio);
    settings.setValue("subtitles/lineSpacing", m_raster.lineSpacing);
    settings.setValue("subtitles/fontFamily", m_defaultStyle.fontFamily);
    settings.setValue("subtitles/fontFile", m_defaultStyle.fontFile);
    settings.setValue("subtitles/bold", m_defaultStyle.bold);
    settings.setValue("subtitles/fontSize", m_defaultStyle.fontSize);
    settings.setValue("subtitles/fillColor", m_defaultStyle.fillColor.name());
    settings.setValue("subtitles/outlineColor", m_defaultStyle.outlineColor.name());
    settings.setValue("subtitles/outlineWidth", m_defaultStyle.outlineWidth);
    settings.setValue("subtitles/marginBottom", m_defaultStyle.marginBottom);
    settings.setValue("subtitles/alignment", horizontalAlignmentToString(m_defaultStyle.alignment));
    settings.setValue("subtitles/highlightMode", highlightModeToString(m_defaultStyle.highlightMode));
    settings.setValue("subtitles/boxEnabled", m_defaultStyle.boxEnabled);
    settings.setValue("subtitles/boxColor", m_defaultStyle.boxColor.name());
    settings.setValue("subtitles/boxOpacity", m_defaultStyle.boxOpacity);
    settings.setValue("subtitles/boxPadding", m_defaultStyle.boxPadding);
    settings.setValue("subtitles/boxCornerRadius", m_defaultStyle.boxCornerRadius);

    settings.setValue("background/fallbackColor", m_fallbackColor.name());
    settings.beginGroup("themes");
    for (auto it = m_themeColors.constBegin(); it != m_themeColors.constEnd(); ++it) {
        settings.setValue(it.key(), it.value().name());
    }
    settings.endGroup();

    settings.setValue("avatar/pollIntervalMs", m_avatarPoll.intervalMs);
    settings.setValue("avatar/waitTimeoutMs", m_avatarPoll.timeoutMs);
    settings.setValue("probe/maxAttempts", m_probeRetry.maxAttempts);
    settings.setValue("probe/initialDelayMs", m_probeRetry.initialDelayMs);
    settings.setValue("probe/backoffFactor", m_probeRetry.backoffFactor);

    QVariantList enabledCategoriesInts;
    for (const LogCategory& cat : m_enabledLogCategories) {
        enabledCategoriesInts.append(static_cast<int>(cat));
    }
    settings.setValue("logging/enabledCategories", enabledCategoriesInts);
    settings.setValue("logging/file", m_logFilePath);
}

QString AppSettings::ffmpegPath() const { return m_ffmpegPath; }
void AppSettings::setFfmpegPath(const QString &path) { m_ffmpegPath = path; }

QString AppSettings::ffprobePath() const {
    if (QFileInfo::exists(m_ffprobePath)) {
        return m_ffprobePath;
    }
    // Fall back to the ffprobe shipped next to the configured ffmpeg
    QFileInfo ffmpegInfo(m_ffmpegPath);
    QString sibling = QDir(ffmpegInfo.absolutePath()).filePath("ffprobe" + QString(ffmpegInfo.suffix() == "exe" ? ".exe" : ""));
    if (ffmpegInfo.isAbsolute() && QFileInfo::exists(sibling)) {
        return QDir::toNativeSeparators(sibling);
    }
    return m_ffprobePath;
}
void AppSettings::setFfprobePath(const QString &path) { m_ffprobePath = path; }

EncodingSettings AppSettings::encoding() const { return m_encoding; }
void AppSettings::setEncoding(const EncodingSettings &encoding) { m_encoding = encoding; }
PlatformConstraints AppSettings::platform() const { return m_platform; }
void AppSettings::setPlatform(const PlatformConstraints &platform) { m_platform = platform; }
RasterSettings AppSettings::raster() const { return m_raster; }
void AppSettings::setRaster(const RasterSettings &raster) { m_raster = raster; }
SubtitleStyle AppSettings::defaultStyle() const { return m_defaultStyle; }
void AppSettings::setDefaultStyle(const SubtitleStyle &style) { m_defaultStyle = style; }

QColor AppSettings::fallbackColor() const { return m_fallbackColor; }
void AppSettings::setFallbackColor(const QColor &color) { m_fallbackColor = color; }

QColor AppSettings::themeColor(const QString &theme) const {
    return m_themeColors.value(theme.trimmed().toLower(), m_fallbackColor);
}
QMap<QString, QColor> AppSettings::themeColors() const { return m_themeColors; }

PollSettings AppSettings::avatarPoll() const { return m_avatarPoll; }
void AppSettings::setAvatarPoll(const PollSettings &poll) { m_avatarPoll = poll; }
RetrySettings AppSettings::probeRetry() const { return m_probeRetry; }
void AppSettings::setProbeRetry(const RetrySettings &retry) { m_probeRetry = retry; }

QSet<LogCategory> AppSettings::enabledLogCategories() const { return m_enabledLogCategories; }
void AppSettings::setEnabledLogCategories(const QSet<LogCategory> &categories) { m_enabledLogCategories = categories; }
QString AppSettings::logFilePath() const { return m_logFilePath; }
void AppSettings::setLogFilePath(const QString &path) { m_logFilePath = path; }
