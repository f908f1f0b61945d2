#include "jobloader.h"
#include "srtcodec.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

static QString resolvePath(const QString &jobDir, const QString &path)
{
    if (path.isEmpty()) {
        return QString();
    }
    return QDir::cleanPath(QDir(jobDir).absoluteFilePath(path));
}

JobLoader::JobLoader(const SubtitleStyle &defaultStyle, const QMap<QString, QColor> &themeColors,
                     const QColor &fallbackColor, QObject *parent)
    : QObject(parent),
    m_defaultStyle(defaultStyle),
    m_themeColors(themeColors),
    m_fallbackColor(fallbackColor)
{}

QColor JobLoader::themeColor(const QString &theme)
{
    const QString key = theme.trimmed().toLower();
    if (m_themeColors.contains(key)) {
        return m_themeColors.value(key);
    }
    emit logMessage(QString("Unknown theme '%1', using the fallback color").arg(theme), LogCategory::APP);
    return m_fallbackColor;
}

bool JobLoader::parseCues(const QJsonArray &array, QList<SubtitleCue> &cues, AssemblyError *error)
{
    cues.clear();
    for (int i = 0; i < array.size(); ++i) {
        if (!array.at(i).isObject()) {
            return fail(error, AssemblyError::Kind::InvalidInput, QString("Cue %1 is not an object").arg(i + 1));
        }
        QJsonObject obj = array.at(i).toObject();
        if (!obj.contains("start") || !obj.contains("end")) {
            return fail(error, AssemblyError::Kind::InvalidInput, QString("Cue %1 has no start/end").arg(i + 1));
        }

        SubtitleCue cue;
        cue.start = obj["start"].toDouble();
        cue.end = obj["end"].toDouble();
        cue.text = obj["text"].toString().trimmed();

        const QJsonArray words = obj["words"].toArray();
        for (const auto &val : words) {
            QJsonObject wordObj = val.toObject();
            WordTiming word;
            word.text = wordObj["text"].toString(wordObj["word"].toString()).trimmed();
            word.start = wordObj["start"].toDouble();
            word.end = wordObj["end"].toDouble();
            cue.words.append(word);
        }
        cues.append(cue);
    }
    return true;
}

bool JobLoader::parseBackground(const QJsonObject &json, const QString &jobDir, BackgroundSource &source,
                                AssemblyError *error)
{
    const QString type = json["type"].toString().toLower();

    if (type == "visual" || type == "avatar") {
        const QString path = resolvePath(jobDir, json["path"].toString());
        if (path.isEmpty()) {
            return fail(error, AssemblyError::Kind::InvalidInput, QString("Background '%1' has no path").arg(type));
        }
        source = type == "visual" ? BackgroundSource::visual(path) : BackgroundSource::avatarClip(path);
        return true;
    }

    if (type == "color") {
        if (json.contains("color")) {
            QColor color = QColor::fromString(json["color"].toString());
            if (!color.isValid()) {
                return fail(error, AssemblyError::Kind::InvalidInput,
                            "Invalid background color: " + json["color"].toString());
            }
            source = BackgroundSource::flatColor(color);
        } else {
            source = BackgroundSource::flatColor(themeColor(json["theme"].toString()));
        }
        return true;
    }

    return fail(error, AssemblyError::Kind::InvalidInput, "Unknown background type: " + type);
}

bool JobLoader::load(const QString &jobDir, AssemblyRequest &request, AssemblyError *error)
{
    QDir dir(jobDir);
    if (!dir.exists()) {
        return fail(error, AssemblyError::Kind::InvalidInput, "Job directory does not exist: " + jobDir);
    }

    QFile jobFile(dir.filePath(jobFileName()));
    if (!jobFile.open(QIODevice::ReadOnly)) {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("Cannot open %1: %2").arg(jobFile.fileName(), jobFile.errorString()));
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(jobFile.readAll(), &parseError);
    jobFile.close();
    if (doc.isNull() || !doc.isObject()) {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("%1 is not valid JSON: %2").arg(jobFileName(), parseError.errorString()));
    }
    QJsonObject root = doc.object();
    const QString absoluteDir = dir.absolutePath();

    AssemblyRequest loaded;
    loaded.jobId = root["id"].toString(dir.dirName());
    loaded.audioPath = resolvePath(absoluteDir, root["audio"].toString());
    loaded.audioDuration = root["audioDuration"].toDouble(0.0);
    loaded.estimatedDuration = root["estimatedDuration"].toDouble(0.0);
    loaded.outputPath = resolvePath(absoluteDir, root["output"].toString("final_video.mp4"));

    if (root.contains("background") && !root["background"].isNull()) {
        if (!root["background"].isObject()) {
            return fail(error, AssemblyError::Kind::InvalidInput, "'background' must be an object");
        }
        if (!parseBackground(root["background"].toObject(), absoluteDir, loaded.background, error)) {
            return false;
        }
    }

    if (loaded.audioPath.isEmpty() && loaded.background.kind != BackgroundSource::Kind::AvatarClip) {
        return fail(error, AssemblyError::Kind::InvalidInput, "Job has no 'audio' and no avatar clip");
    }

    if (root.contains("cues")) {
        if (!parseCues(root["cues"].toArray(), loaded.cues, error)) {
            return false;
        }
    } else if (root.contains("subtitles")) {
        if (!SrtCodec::readFile(resolvePath(absoluteDir, root["subtitles"].toString()), loaded.cues, error)) {
            return false;
        }
    } else {
        emit logMessage(QString("Job %1 has no subtitles").arg(loaded.jobId), LogCategory::APP);
    }

    loaded.style = m_defaultStyle;
    if (root["style"].isObject()) {
        loaded.style.read(root["style"].toObject());
        if (!loaded.style.fontFile.isEmpty()) {
            loaded.style.fontFile = resolvePath(absoluteDir, loaded.style.fontFile);
        }
    }

    emit logMessage(QString("Loaded job %1: %2 cues, background %3")
                        .arg(loaded.jobId)
                        .arg(loaded.cues.size())
                        .arg(root["background"].toObject()["type"].toString("none")),
                    LogCategory::APP);

    request = loaded;
    return true;
}
