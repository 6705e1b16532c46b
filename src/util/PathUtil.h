#pragma once

#include <QString>
#include <QStringList>
#include <QFileInfo>

namespace PathUtil {

// Keep Unicode letters and digits plus '-', '_' and '.'; every other code
// point becomes one '_'. Leading/trailing '.' and '_' are stripped.
QString sanitizeFileName(const QString& name, const QString& fallback = "clip");

// .mp4 .mov .m4v
QStringList defaultMediaExtensions();

// Lower-case, dot-prefixed extension list (".mp4"); accepts "mp4" or ".MP4"
QStringList normalizeExtensions(const QStringList& exts);

// A regular media file with an allowed extension that is not a dotfile,
// an AppleDouble fork or a known OS metadata file
bool isListableMedia(const QFileInfo& info, const QStringList& allowedExts);

// rename(2) semantics: replaces an existing destination atomically
bool atomicRename(const QString& from, const QString& to, QString* error = nullptr);

// Remove a file if present; true when nothing is left at path
bool removeIfExists(const QString& path);

// Hidden sibling used for in-progress writes: "<dir>/.<name>.<tag>.mp4"
QString tempSibling(const QString& path, const QString& tag);

} // namespace PathUtil
