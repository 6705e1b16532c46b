#pragma once

#include <QMutex>
#include <QString>
#include <QStringList>
#include <optional>

// Bounded LIFO of exported clip paths, persisted one path per line (most
// recent last). Every call reloads the log, so state survives restarts and
// other processes sharing the same file.
class UndoStack {
public:
    explicit UndoStack(const QString& logPath, int capacity = 10);

    // Pushing past capacity forgets the oldest entry; its file is kept
    bool push(const QString& path);

    // Most recent entry, removed from the log. The clip file is not touched.
    std::optional<QString> pop();

    // Oldest first
    QStringList entries() const;
    int size() const { return entries().size(); }

    QString logPath() const { return m_logPath; }
    int capacity() const { return m_capacity; }
    QString errorString() const { return m_error; }

private:
    QStringList readLog() const;
    bool writeLog(const QStringList& lines);

    QString m_logPath;
    int m_capacity;
    QString m_error;
    mutable QMutex m_mutex;
};
