#pragma once

#include <QString>

// Output profile every exported or repaired clip must satisfy
struct TargetProfile {
    QString videoCodec = "h264";
    QString pixelFormat = "yuv420p";
    QString audioCodec = "aac";
    bool dropAudio = false;
    int frameRate = 0;              // 0 = keep the source rate

    QString softwareEncoder = "libx264";
#ifdef Q_OS_MACOS
    QString hardwareEncoder = "h264_videotoolbox";
#else
    QString hardwareEncoder = "h264_nvenc";
#endif
    QString hardwareBitrate = "2M";
    QString audioBitrate = "128k";
    int crf = 20;
};
