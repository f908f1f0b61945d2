#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include "assemblytypes.h"

#include <QColor>
#include <QMap>
#include <QObject>
#include <QSet>
#include <QSettings>

struct EncodingSettings
{
    int width = 1080;
    int height = 1920;
    int fps = 30;
    QString videoCodec = "libx264";
    QString preset = "medium";
    int crf = 23;
    QString pixelFormat = "yuv420p";
    QString audioCodec = "aac";
    QString audioBitrate = "128k";
};

struct PlatformConstraints
{
    int width = 1080;
    int height = 1920;
    double minDurationS = 15.0;
    double maxDurationS = 60.0;
    qint64 maxSizeBytes = 50LL * 1024 * 1024;
};

struct RasterSettings
{
    int bitmapHeight = 250;
    double maxLineWidthRatio = 0.8;
    int lineSpacing = 10;
};

struct PollSettings
{
    int intervalMs = 5000;
    int timeoutMs = 0;                  // 0 = do not wait for a missing clip
};

struct RetrySettings
{
    int maxAttempts = 3;
    int initialDelayMs = 500;
    double backoffFactor = 2.0;
};

class AppSettings : public QObject
{
    Q_OBJECT
private:
    explicit AppSettings(QObject *parent = nullptr);
    AppSettings(const AppSettings&) = delete;
    AppSettings& operator=(const AppSettings&) = delete;

public:
    static AppSettings& instance();

    // Empty path = native settings store
    void load(const QString &iniPath = QString());
    void save() const;
    void loadDefaults();

    QString ffmpegPath() const;
    void setFfmpegPath(const QString &path);
    QString ffprobePath() const;
    void setFfprobePath(const QString &path);

    EncodingSettings encoding() const;
    void setEncoding(const EncodingSettings &encoding);
    PlatformConstraints platform() const;
    void setPlatform(const PlatformConstraints &platform);
    RasterSettings raster() const;
    void setRaster(const RasterSettings &raster);
    SubtitleStyle defaultStyle() const;
    void setDefaultStyle(const SubtitleStyle &style);

    QColor fallbackColor() const;
    void setFallbackColor(const QColor &color);
    QColor themeColor(const QString &theme) const;
    QMap<QString, QColor> themeColors() const;

    PollSettings avatarPoll() const;
    void setAvatarPoll(const PollSettings &poll);
    RetrySettings probeRetry() const;
    void setProbeRetry(const RetrySettings &retry);

    QSet<LogCategory> enabledLogCategories() const;
    void setEnabledLogCategories(const QSet<LogCategory> &categories);
    QString logFilePath() const;
    void setLogFilePath(const QString &path);

private:
    void readFrom(QSettings &settings);
    void writeTo(QSettings &settings) const;

    QString m_iniPath;
    QString m_ffmpegPath;
    QString m_ffprobePath;
    EncodingSettings m_encoding;
    PlatformConstraints m_platform;
    RasterSettings m_raster;
    SubtitleStyle m_defaultStyle;
    QColor m_fallbackColor;
    QMap<QString, QColor> m_themeColors;
    PollSettings m_avatarPoll;
    RetrySettings m_probeRetry;
    QSet<LogCategory> m_enabledLogCategories;
    QString m_logFilePath;
};

#endif // APPSETTINGS_H
