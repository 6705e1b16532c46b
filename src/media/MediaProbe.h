#pragma once

#include <QObject>
#include <QString>
#include <QByteArray>
#include <optional>

class ProcessRunner;

struct MediaInfo {
    QString filePath;
    QString containerFormat;
    double duration = 0.0;
    int videoWidth = 0;
    int videoHeight = 0;
    double videoFps = 0.0;
    QString videoCodec;
    QString videoPixelFormat;
    int audioSampleRate = 0;
    int audioChannels = 0;
    QString audioCodec;
    bool hasVideo = false;
    bool hasAudio = false;
};

// Stream metadata through `ffprobe -print_format json`. Never cached: the
// file may have been rewritten since the last call.
class MediaProbe : public QObject {
    Q_OBJECT
public:
    MediaProbe(ProcessRunner& runner, const QString& ffprobePath, QObject* parent = nullptr);
    ~MediaProbe();

    std::optional<MediaInfo> probe(const QString& filePath);
    QString errorString() const { return m_error; }

    // Parse ffprobe JSON output; empty on malformed input
    static std::optional<MediaInfo> parse(const QByteArray& json, const QString& filePath,
                                          QString* error = nullptr);

private:
    ProcessRunner& m_runner;
    QString m_ffprobe;
    QString m_error;
};
