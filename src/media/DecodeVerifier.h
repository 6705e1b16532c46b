#pragma once

#include <QObject>
#include <QString>
#include <cstdint>
#include <memory>

struct DecodeReport {
    int64_t videoFrames = 0;
    int64_t audioFrames = 0;
    int decodeErrors = 0;
};

// Full decode pass over every audio and video stream of a file, output
// discarded. Used to accept a rewritten file before it replaces the original.
class DecodeVerifier : public QObject {
    Q_OBJECT
public:
    explicit DecodeVerifier(QObject* parent = nullptr);
    ~DecodeVerifier();

    bool verify(const QString& filePath);

    const DecodeReport& report() const { return m_report; }
    QString errorString() const { return m_error; }

    // libavformat/libavcodec versions linked into this binary
    static QString libraryVersions();

private:
    struct FFmpegContext;

    DecodeReport m_report;
    QString m_error;
};
