#include "UndoStack.h"
#include "Logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QSaveFile>
#include <QTextStream>

namespace {

// Held across read-modify-write so concurrent processes cannot lose entries
class LogLock {
public:
    explicit LogLock(const QString& logPath) : m_lock(logPath + ".lock") {
        m_lock.setStaleLockTime(30000);
        m_locked = m_lock.lock();
    }
    bool isLocked() const { return m_locked; }

private:
    QLockFile m_lock;
    bool m_locked = false;
};

} // namespace

UndoStack::UndoStack(const QString& logPath, int capacity)
    : m_logPath(logPath)
    , m_capacity(capacity > 0 ? capacity : 1)
{
    QDir().mkpath(QFileInfo(m_logPath).absolutePath());
}

bool UndoStack::push(const QString& path) {
    QMutexLocker locker(&m_mutex);
    m_error.clear();
    LogLock lock(m_logPath);
    if (!lock.isLocked()) {
        m_error = QString("Cannot lock undo log: %1").arg(m_logPath);
        return false;
    }

    QStringList lines = readLog();
    lines.append(path);
    while (lines.size() > m_capacity) {
        DC_LOG_DEBUG("Undo log full, forgetting {}", lines.first().toStdString());
        lines.removeFirst();
    }
    return writeLog(lines);
}

std::optional<QString> UndoStack::pop() {
    QMutexLocker locker(&m_mutex);
    m_error.clear();
    LogLock lock(m_logPath);
    if (!lock.isLocked()) {
        m_error = QString("Cannot lock undo log: %1").arg(m_logPath);
        return std::nullopt;
    }

    QStringList lines = readLog();
    if (lines.isEmpty()) return std::nullopt;

    QString last = lines.takeLast();
    if (!writeLog(lines)) return std::nullopt;
    return last;
}

QStringList UndoStack::entries() const {
    QMutexLocker locker(&m_mutex);
    return readLog();
}

QStringList UndoStack::readLog() const {
    QStringList lines;
    QFile file(m_logPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return lines;

    QTextStream in(&file);
    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();
        if (!line.isEmpty()) lines.append(line);
    }
    // A log written by hand may exceed the cap
    while (lines.size() > m_capacity) lines.removeFirst();
    return lines;
}

bool UndoStack::writeLog(const QStringList& lines) {
    QSaveFile file(m_logPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        m_error = QString("Cannot write to: %1").arg(m_logPath);
        return false;
    }
    QTextStream out(&file);
    for (const QString& line : lines) out << line << '\n';
    out.flush();

    if (!file.commit()) {
        m_error = QString("Cannot commit: %1").arg(m_logPath);
        return false;
    }
    return true;
}
