#include "MediaProbe.h"
#include "ProcessRunner.h"
#include "TimeUtil.h"
#include "Logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

MediaProbe::MediaProbe(ProcessRunner& runner, const QString& ffprobePath, QObject* parent)
    : QObject(parent)
    , m_runner(runner)
    , m_ffprobe(ffprobePath)
{
}

MediaProbe::~MediaProbe() = default;

std::optional<MediaInfo> MediaProbe::probe(const QString& filePath) {
    m_error.clear();

    const QStringList args = {
        "-v", "error",
        "-print_format", "json",
        "-show_streams",
        "-show_format",
        filePath
    };
    ProcessResult result = m_runner.run(m_ffprobe, args);

    if (!result.started) {
        m_error = result.errorString;
        DC_LOG_WARN("ffprobe unavailable: {}", m_error.toStdString());
        return std::nullopt;
    }
    if (!result.ok()) {
        m_error = QString("ffprobe exited with %1: %2")
                      .arg(result.exitCode)
                      .arg(result.diagnostics().trimmed());
        DC_LOG_DEBUG("probe failed for {}: {}", filePath.toStdString(), m_error.toStdString());
        return std::nullopt;
    }

    auto info = parse(result.stdOut, filePath, &m_error);
    if (!info)
        DC_LOG_DEBUG("probe output unusable for {}: {}", filePath.toStdString(), m_error.toStdString());
    return info;
}

std::optional<MediaInfo> MediaProbe::parse(const QByteArray& json, const QString& filePath,
                                           QString* error) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) *error = QString("Malformed ffprobe output: %1").arg(parseError.errorString());
        return std::nullopt;
    }

    QJsonObject root = doc.object();
    MediaInfo info;
    info.filePath = filePath;

    // Container info
    QJsonObject format = root["format"].toObject();
    info.containerFormat = format["format_name"].toString();
    info.duration = format["duration"].toString().toDouble();

    // First video and first audio stream only
    const QJsonArray streams = root["streams"].toArray();
    for (const auto& val : streams) {
        QJsonObject stream = val.toObject();
        const QString type = stream["codec_type"].toString();

        if (type == "video" && !info.hasVideo) {
            info.hasVideo = true;
            info.videoCodec = stream["codec_name"].toString().toLower();
            info.videoPixelFormat = stream["pix_fmt"].toString().toLower();
            info.videoWidth = stream["width"].toInt();
            info.videoHeight = stream["height"].toInt();

            info.videoFps = TimeUtil::parseRational(stream["avg_frame_rate"].toString());
            if (info.videoFps <= 0.0)
                info.videoFps = TimeUtil::parseRational(stream["r_frame_rate"].toString());
        }
        else if (type == "audio" && !info.hasAudio) {
            info.hasAudio = true;
            info.audioCodec = stream["codec_name"].toString().toLower();
            info.audioSampleRate = stream["sample_rate"].toString().toInt();
            info.audioChannels = stream["channels"].toInt();
        }
    }

    return info;
}
