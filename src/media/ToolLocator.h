#pragma once

#include <QString>

struct ToolPaths {
    QString ffmpeg;
    QString ffprobe;
};

namespace ToolLocator {

// FFMPEG_BINARY, <baseDir>/bin/ffmpeg, Homebrew and /usr/local, then PATH.
// Falls back to the bare name so the failure surfaces when it is run.
QString findFfmpeg(const QString& baseDir);

// Sibling "ffprobe" next to ffmpeg, else ffprobe from PATH
QString findFfprobe(const QString& ffmpegPath);

ToolPaths locate(const QString& baseDir);

} // namespace ToolLocator
