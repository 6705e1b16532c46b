#include "LabelRegistry.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

LabelRegistry::LabelRegistry(const QString& filePath)
    : m_filePath(filePath)
{
}

QStringList LabelRegistry::load() const {
    QMutexLocker locker(&m_mutex);
    return readFile();
}

bool LabelRegistry::append(const QString& label) {
    const QString trimmed = label.trimmed();
    if (trimmed.isEmpty()) return true;

    QMutexLocker locker(&m_mutex);
    QStringList labels = readFile();
    if (labels.contains(trimmed)) return true;
    labels.append(trimmed);

    QDir().mkpath(QFileInfo(m_filePath).absolutePath());
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        m_error = QString("Cannot write to: %1").arg(m_filePath);
        return false;
    }
    QTextStream out(&file);
    for (const QString& l : labels) out << l << '\n';
    out.flush();

    if (!file.commit()) {
        m_error = QString("Cannot commit: %1").arg(m_filePath);
        return false;
    }
    return true;
}

QStringList LabelRegistry::readFile() const {
    QStringList labels;
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return labels;

    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (!line.isEmpty() && !labels.contains(line)) labels.append(line);
    }
    return labels;
}
