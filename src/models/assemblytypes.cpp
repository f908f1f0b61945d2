#include "assemblytypes.h"

static QColor readColor(const QJsonObject &json, const QString &key, const QColor &fallback)
{
    if (!json.contains(key)) {
        return fallback;
    }
    QColor color = QColor::fromString(json[key].toString());
    return color.isValid() ? color : fallback;
}

void SubtitleStyle::read(const QJsonObject &json)
{
    fontFamily = json["fontFamily"].toString(fontFamily);
    fontFile = json["fontFile"].toString(fontFile);
    bold = json["bold"].toBool(bold);
    fontSize = json["fontSize"].toInt(fontSize);
    fillColor = readColor(json, "fillColor", fillColor);
    outlineColor = readColor(json, "outlineColor", outlineColor);
    outlineWidth = json["outlineWidth"].toInt(outlineWidth);
    marginBottom = json["marginBottom"].toInt(marginBottom);
    if (json.contains("alignment")) {
        alignment = horizontalAlignmentFromString(json["alignment"].toString());
    }
    if (json.contains("highlightMode")) {
        highlightMode = highlightModeFromString(json["highlightMode"].toString());
    }

    boxEnabled = json["boxEnabled"].toBool(boxEnabled);
    boxColor = readColor(json, "boxColor", boxColor);
    boxOpacity = json["boxOpacity"].toDouble(boxOpacity);
    boxPadding = json["boxPadding"].toInt(boxPadding);
    boxCornerRadius = json["boxCornerRadius"].toInt(boxCornerRadius);
}

void SubtitleStyle::write(QJsonObject &json) const
{
    json["fontFamily"] = fontFamily;
    if (!fontFile.isEmpty()) {
        json["fontFile"] = fontFile;
    }
    json["bold"] = bold;
    json["fontSize"] = fontSize;
    json["fillColor"] = fillColor.name();
    json["outlineColor"] = outlineColor.name();
    json["outlineWidth"] = outlineWidth;
    json["marginBottom"] = marginBottom;
    json["alignment"] = horizontalAlignmentToString(alignment);
    json["highlightMode"] = highlightModeToString(highlightMode);
    json["boxEnabled"] = boxEnabled;
    json["boxColor"] = boxColor.name();
    json["boxOpacity"] = boxOpacity;
    json["boxPadding"] = boxPadding;
    json["boxCornerRadius"] = boxCornerRadius;
}

BackgroundSource BackgroundSource::visual(const QString &path)
{
    BackgroundSource source;
    source.kind = Kind::Visual;
    source.path = path;
    return source;
}

BackgroundSource BackgroundSource::flatColor(const QColor &color)
{
    BackgroundSource source;
    source.kind = Kind::Color;
    source.color = color;
    return source;
}

BackgroundSource BackgroundSource::avatarClip(const QString &path)
{
    BackgroundSource source;
    source.kind = Kind::AvatarClip;
    source.path = path;
    return source;
}

QString AssemblyError::kindName(Kind kind)
{
    switch (kind)
    {
    case Kind::None:
        return "None";
    case Kind::DegenerateTiming:
        return "DegenerateTiming";
    case Kind::BackgroundUnavailable:
        return "BackgroundUnavailable";
    case Kind::EncodingFailed:
        return "EncodingFailed";
    case Kind::InvalidInput:
        return "InvalidInput";
    case Kind::ProbeFailed:
        return "ProbeFailed";
    case Kind::Timeout:
        return "Timeout";
    }
    return "Unknown";
}

bool fail(AssemblyError *error, AssemblyError::Kind kind, const QString &message, const QString &diagnostics)
{
    if (error) {
        error->kind = kind;
        error->message = message;
        error->diagnostics = diagnostics;
    }
    return false;
}

QString logCategoryToString(LogCategory category)
{
    switch (category)
    {
    case LogCategory::APP:
        return "APP";
    case LogCategory::FFMPEG:
        return "FFMPEG";
    case LogCategory::TIMING:
        return "TIMING";
    case LogCategory::DEBUG:
        return "DEBUG";
    }
    return "UNKNOWN";
}

QString horizontalAlignmentToString(HorizontalAlignment alignment)
{
    switch (alignment)
    {
    case HorizontalAlignment::Left:
        return "left";
    case HorizontalAlignment::Right:
        return "right";
    case HorizontalAlignment::Center:
        break;
    }
    return "center";
}

HorizontalAlignment horizontalAlignmentFromString(const QString &value)
{
    const QString v = value.trimmed().toLower();
    if (v == "left") {
        return HorizontalAlignment::Left;
    }
    if (v == "right") {
        return HorizontalAlignment::Right;
    }
    return HorizontalAlignment::Center;
}

QString highlightModeToString(HighlightMode mode)
{
    return mode == HighlightMode::PerWordReveal ? "karaoke" : "static";
}

HighlightMode highlightModeFromString(const QString &value)
{
    const QString v = value.trimmed().toLower();
    if (v == "karaoke" || v == "per-word" || v == "perwordreveal") {
        return HighlightMode::PerWordReveal;
    }
    return HighlightMode::Static;
}

QString backgroundStrategyToString(BackgroundStrategy strategy)
{
    switch (strategy)
    {
    case BackgroundStrategy::Visual:
        return "visual";
    case BackgroundStrategy::FlatColor:
        return "color";
    case BackgroundStrategy::AvatarPassthrough:
        return "avatar";
    }
    return "unknown";
}
