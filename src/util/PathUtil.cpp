#include "PathUtil.h"
#include "AppConstants.h"

#include <QDir>
#include <QFile>
#include <QStringView>
#include <filesystem>
#include <system_error>

namespace PathUtil {

QString sanitizeFileName(const QString& name, const QString& fallback) {
    QString safe;
    safe.reserve(name.size());
    for (const uint ucs4 : QStringView(name).toUcs4()) {
        const char32_t c = ucs4;
        if (QChar::isLetterOrNumber(c) || c == U'-' || c == U'_' || c == U'.')
            safe.append(QString::fromUcs4(&c, 1));
        else
            safe.append('_');
    }

    int first = 0;
    int last = safe.size() - 1;
    while (first <= last && (safe[first] == '.' || safe[first] == '_')) ++first;
    while (last >= first && (safe[last] == '.' || safe[last] == '_')) --last;
    safe = safe.mid(first, last - first + 1);

    return safe.isEmpty() ? fallback : safe;
}

QStringList defaultMediaExtensions() {
    QStringList exts;
    for (const char* ext : AppConstants::MediaExtensions) exts.append(QLatin1String(ext));
    return exts;
}

QStringList normalizeExtensions(const QStringList& exts) {
    QStringList result;
    for (QString e : exts) {
        e = e.trimmed().toLower();
        if (e.isEmpty()) continue;
        if (!e.startsWith('.')) e.prepend('.');
        if (!result.contains(e)) result.append(e);
    }
    return result;
}

bool isListableMedia(const QFileInfo& info, const QStringList& allowedExts) {
    if (!info.isFile()) return false;

    const QString name = info.fileName();
    const QString low = name.toLower();
    if (name.startsWith('.') || low.startsWith("._")) return false;
    for (const char* meta : AppConstants::ExcludedMetaNames) {
        if (low == QLatin1String(meta)) return false;
    }

    const QString suffix = "." + info.suffix().toLower();
    return allowedExts.contains(suffix);
}

bool atomicRename(const QString& from, const QString& to, QString* error) {
    std::error_code ec;
    std::filesystem::rename(std::filesystem::path(from.toStdString()),
                            std::filesystem::path(to.toStdString()), ec);
    if (ec) {
        if (error) {
            *error = QString("Cannot rename %1 to %2: %3")
                         .arg(from, to, QString::fromStdString(ec.message()));
        }
        return false;
    }
    return true;
}

bool removeIfExists(const QString& path) {
    if (!QFileInfo::exists(path)) return true;
    return QFile::remove(path);
}

QString tempSibling(const QString& path, const QString& tag) {
    QFileInfo fi(path);
    return fi.absoluteDir().filePath(QString(".%1.%2.mp4").arg(fi.fileName(), tag));
}

} // namespace PathUtil
