#include "mediaprober.h"
#include "processrunner.h"

#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

MediaProber::MediaProber(ProcessRunner *runner, const QString &ffprobePath, QObject *parent)
    : QObject(parent),
    m_runner(runner),
    m_ffprobePath(ffprobePath)
{}

int MediaProber::streamRotation(const QJsonObject &stream)
{
    const QJsonArray sideData = stream["side_data_list"].toArray();
    for (const auto &val : sideData) {
        QJsonObject entry = val.toObject();
        if (entry.contains("rotation")) {
            return entry["rotation"].toInt();
        }
    }
    // Older muxers only set the tag
    return stream["tags"].toObject()["rotate"].toString().toInt();
}

QStringList MediaProber::probeArguments(const QString &filePath)
{
    return {"-v", "quiet", "-print_format", "json", "-show_format", "-show_streams", filePath};
}

bool MediaProber::parseProbeJson(const QByteArray &jsonData, MediaProbe &result, QString *problem)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(jsonData, &parseError);
    if (doc.isNull() || !doc.isObject()) {
        if (problem) {
            *problem = "invalid ffprobe JSON: " + parseError.errorString();
        }
        return false;
    }

    QJsonObject root = doc.object();
    if (!root.contains("format") || !root["format"].isObject()) {
        if (problem) {
            *problem = "ffprobe output has no format section";
        }
        return false;
    }

    MediaProbe probe;
    QJsonObject format = root["format"].toObject();
    // ffprobe reports numbers as strings
    probe.durationSeconds = format["duration"].toString().toDouble();
    probe.sizeBytes = format["size"].toString().toLongLong();

    const QJsonArray streams = root["streams"].toArray();
    for (const auto &val : streams) {
        QJsonObject stream = val.toObject();
        QString codecType = stream["codec_type"].toString();

        if (codecType == "video" && !probe.hasVideoStream) {
            probe.hasVideoStream = true;
            probe.width = stream["width"].toInt();
            probe.height = stream["height"].toInt();
            probe.videoCodec = stream["codec_name"].toString();
            probe.rotation = streamRotation(stream);
            // ffmpeg auto-rotates on decode, so quarter turns swap the frame
            if (qAbs(probe.rotation) % 180 == 90) {
                qSwap(probe.width, probe.height);
            }
            if (probe.durationSeconds <= 0.0) {
                probe.durationSeconds = stream["duration"].toString().toDouble();
            }
        }
        else if (codecType == "audio") {
            probe.hasAudioStream = true;
        }
    }

    result = probe;
    return true;
}

bool MediaProber::probe(const QString &filePath, MediaProbe &result, AssemblyError *error)
{
    QFileInfo fileInfo(filePath);
    if (!fileInfo.exists()) {
        return fail(error, AssemblyError::Kind::ProbeFailed, "File not found: " + filePath);
    }

    emit logMessage("Probing " + fileInfo.fileName(), LogCategory::DEBUG);
    ProcessResult process = m_runner->run(m_ffprobePath, probeArguments(filePath));
    if (!process.succeeded() || process.standardOutput.isEmpty()) {
        return fail(error, AssemblyError::Kind::ProbeFailed,
                    QString("ffprobe could not read %1 (exit code %2)").arg(fileInfo.fileName()).arg(process.exitCode),
                    process.standardError);
    }

    QString problem;
    if (!parseProbeJson(process.standardOutput, result, &problem)) {
        return fail(error, AssemblyError::Kind::ProbeFailed,
                    QString("Cannot parse probe of %1: %2").arg(fileInfo.fileName(), problem));
    }
    if (result.sizeBytes <= 0) {
        result.sizeBytes = fileInfo.size();
    }

    emit logMessage(QString("%1: %2x%3, %4 s, %5 bytes, codec %6, audio %7")
                        .arg(fileInfo.fileName())
                        .arg(result.width).arg(result.height)
                        .arg(result.durationSeconds, 0, 'f', 2)
                        .arg(result.sizeBytes)
                        .arg(result.videoCodec.isEmpty() ? "-" : result.videoCodec)
                        .arg(result.hasAudioStream ? "yes" : "no"),
                    LogCategory::DEBUG);
    return true;
}
