#include "VideoLibrary.h"
#include "PathUtil.h"
#include "Logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

VideoLibrary::VideoLibrary(const QString& videosDir)
    : m_dir(videosDir)
{
}

QStringList VideoLibrary::list() const {
    QStringList names;
    QDir dir(m_dir);
    const QStringList exts = PathUtil::defaultMediaExtensions();
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& fi : entries) {
        if (PathUtil::isListableMedia(fi, exts)) names.append(fi.fileName());
    }
    return names;
}

QString VideoLibrary::importVideo(const QString& sourcePath) {
    m_error.clear();

    QFileInfo src(sourcePath);
    if (!src.isFile()) {
        m_error = QString("File not found: %1").arg(sourcePath);
        return QString();
    }
    if (!PathUtil::defaultMediaExtensions().contains("." + src.suffix().toLower())) {
        m_error = "Only MP4/MOV allowed";
        return QString();
    }

    if (!QDir().mkpath(m_dir)) {
        m_error = QString("Cannot create %1").arg(m_dir);
        return QString();
    }

    const QString name = PathUtil::sanitizeFileName(src.fileName());
    const QString dest = QDir(m_dir).filePath(name);
    const QString part = PathUtil::tempSibling(dest, "import");

    PathUtil::removeIfExists(part);
    if (!QFile::copy(sourcePath, part)) {
        m_error = QString("Cannot copy %1 to %2").arg(sourcePath, m_dir);
        return QString();
    }
    if (!PathUtil::atomicRename(part, dest, &m_error)) {
        PathUtil::removeIfExists(part);
        return QString();
    }

    DC_LOG_INFO("Imported {} as {}", sourcePath.toStdString(), name.toStdString());
    return name;
}

QString VideoLibrary::resolve(const QString& nameOrPath) const {
    const QString inLibrary = QDir(m_dir).filePath(nameOrPath);
    if (QFileInfo(nameOrPath).isRelative() && QFileInfo(inLibrary).isFile())
        return inLibrary;
    return QFileInfo(nameOrPath).absoluteFilePath();
}
