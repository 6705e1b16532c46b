#include "ToolLocator.h"
#include "AppConstants.h"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QStringList>

namespace {

bool isExecutableFile(const QString& path) {
    QFileInfo fi(path);
    return fi.isFile() && fi.isExecutable();
}

} // namespace

namespace ToolLocator {

QString findFfmpeg(const QString& baseDir) {
    const QString env = qEnvironmentVariable(AppConstants::FfmpegEnvVar);
    if (!env.isEmpty()) {
        if (isExecutableFile(env)) return env;
        const QString onPath = QStandardPaths::findExecutable(env);
        if (!onPath.isEmpty()) return onPath;
    }

    const QStringList candidates = {
        QDir(baseDir).filePath("bin/ffmpeg"),
        "/opt/homebrew/bin/ffmpeg",
        "/usr/local/bin/ffmpeg",
    };
    for (const QString& c : candidates) {
        if (isExecutableFile(c)) return c;
    }

    const QString onPath = QStandardPaths::findExecutable("ffmpeg");
    return onPath.isEmpty() ? QString("ffmpeg") : onPath;
}

QString findFfprobe(const QString& ffmpegPath) {
    QFileInfo fi(ffmpegPath);
    if (fi.fileName().contains("ffmpeg")) {
        const QString sibling = fi.dir().filePath(QString(fi.fileName()).replace("ffmpeg", "ffprobe"));
        if (fi.path() != "." && isExecutableFile(sibling)) return sibling;
    }
    const QString onPath = QStandardPaths::findExecutable("ffprobe");
    return onPath.isEmpty() ? QString("ffprobe") : onPath;
}

ToolPaths locate(const QString& baseDir) {
    ToolPaths paths;
    paths.ffmpeg = findFfmpeg(baseDir);
    paths.ffprobe = findFfprobe(paths.ffmpeg);
    return paths;
}

} // namespace ToolLocator
