#pragma once

#include <QString>
#include <QStringList>

// Source videos the operator scrubs, kept in one flat directory
class VideoLibrary {
public:
    explicit VideoLibrary(const QString& videosDir);

    QStringList list() const;

    // Copy a .mp4/.mov/.m4v file in under its sanitized name; returns that name
    QString importVideo(const QString& sourcePath);

    // Library file name or an existing path
    QString resolve(const QString& nameOrPath) const;

    QString directory() const { return m_dir; }
    QString errorString() const { return m_error; }

private:
    QString m_dir;
    QString m_error;
};
