#include "srtcodec.h"

#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>
#include <QTextStream>
#include <QtMath>

QString SrtCodec::formatTimestamp(double seconds)
{
    qint64 totalMs = qRound64(qMax(0.0, seconds) * 1000.0);
    const int ms = static_cast<int>(totalMs % 1000);
    totalMs /= 1000;
    const int s = static_cast<int>(totalMs % 60);
    totalMs /= 60;
    const int m = static_cast<int>(totalMs % 60);
    const int h = static_cast<int>(totalMs / 60);
    return QString::asprintf("%02d:%02d:%02d,%03d", h, m, s, ms);
}

bool SrtCodec::parseTimestamp(const QString& text, double& seconds)
{
    // Also accepts "." as the millisecond separator
    static const QRegularExpression re(R"(^\s*(\d+):(\d{1,2}):(\d{1,2})[,.](\d{1,3})\s*$)");
    QRegularExpressionMatch match = re.match(text);
    if (!match.hasMatch())
    {
        return false;
    }

    const qint64 h = match.captured(1).toLongLong();
    const qint64 m = match.captured(2).toLongLong();
    const qint64 s = match.captured(3).toLongLong();
    QString msText = match.captured(4);
    while (msText.size() < 3)
    {
        msText.append('0');
    }
    const qint64 ms = msText.toLongLong();

    seconds = static_cast<double>(((h * 60 + m) * 60 + s) * 1000 + ms) / 1000.0;
    return true;
}

bool SrtCodec::parse(const QString& content, QList<SubtitleCue>& cues, AssemblyError* error)
{
    cues.clear();

    QString normalized = content;
    if (normalized.startsWith(QChar(0xFEFF)))
    {
        normalized.remove(0, 1);
    }
    normalized.replace("\r\n", "\n");
    normalized.replace('\r', '\n');

    static const QRegularExpression blankLines(R"(\n\s*\n)");
    const QStringList blocks = normalized.split(blankLines, Qt::SkipEmptyParts);

    int blockNumber = 0;
    for (const QString& rawBlock : blocks)
    {
        ++blockNumber;
        QStringList lines = rawBlock.trimmed().split('\n');
        if (lines.isEmpty() || lines.first().trimmed().isEmpty())
        {
            continue;
        }

        // Index line is optional in the wild; the timing line is not
        int timingLine = lines.first().contains("-->") ? 0 : 1;
        if (timingLine >= lines.size() || !lines[timingLine].contains("-->"))
        {
            return fail(error, AssemblyError::Kind::InvalidInput,
                        QString("Cue block %1 has no timing line").arg(blockNumber));
        }

        const QStringList times = lines[timingLine].split("-->");
        SubtitleCue cue;
        if (times.size() != 2 || !parseTimestamp(times[0], cue.start) || !parseTimestamp(times[1].trimmed().section(' ', 0, 0), cue.end))
        {
            return fail(error, AssemblyError::Kind::InvalidInput,
                        QString("Cue block %1 has a malformed timing line: %2").arg(blockNumber).arg(lines[timingLine]));
        }

        QStringList textLines = lines.mid(timingLine + 1);
        for (QString& line : textLines)
        {
            line = line.trimmed();
        }
        cue.text = textLines.join('\n');
        cues.append(cue);
    }
    return true;
}

QString SrtCodec::serialize(const QList<SubtitleCue>& cues)
{
    QString out;
    QTextStream stream(&out);
    int lineCounter = 1;
    for (const SubtitleCue& cue : cues)
    {
        stream << lineCounter << "\n";
        stream << formatTimestamp(cue.start) << " --> " << formatTimestamp(cue.end) << "\n";
        stream << cue.text.trimmed() << "\n\n";
        ++lineCounter;
    }
    stream.flush();
    return out;
}

bool SrtCodec::readFile(const QString& path, QList<SubtitleCue>& cues, AssemblyError* error)
{
    QFile inputFile(path);
    if (!inputFile.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("Cannot open cue file %1: %2").arg(path, inputFile.errorString()));
    }
    QTextStream in(&inputFile);
    in.setEncoding(QStringConverter::Utf8);
    return parse(in.readAll(), cues, error);
}

bool SrtCodec::writeFile(const QString& path, const QList<SubtitleCue>& cues, AssemblyError* error)
{
    QFile outputFile(path);
    if (!outputFile.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("Cannot write cue file %1: %2").arg(QFileInfo(path).fileName(), outputFile.errorString()));
    }
    QTextStream out(&outputFile);
    out.setEncoding(QStringConverter::Utf8);
    out << serialize(cues);
    out.flush();
    if (out.status() != QTextStream::Ok)
    {
        return fail(error, AssemblyError::Kind::InvalidInput,
                    QString("Failed while writing cue file %1").arg(QFileInfo(path).fileName()));
    }
    return true;
}
