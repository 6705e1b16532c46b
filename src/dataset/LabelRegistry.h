#pragma once

#include <QMutex>
#include <QString>
#include <QStringList>

// Labels seen so far, one per line in first-seen order, never duplicated
class LabelRegistry {
public:
    explicit LabelRegistry(const QString& filePath);

    QStringList load() const;

    // No-op when the label is already registered
    bool append(const QString& label);

    QString filePath() const { return m_filePath; }
    QString errorString() const { return m_error; }

private:
    QStringList readFile() const;

    QString m_filePath;
    QString m_error;
    mutable QMutex m_mutex;
};
