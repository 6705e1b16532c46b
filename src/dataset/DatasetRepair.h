#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <vector>

#include "ErrorKind.h"
#include "TranscodeExecutor.h"

struct RepairOptions {
    QString root;                 // Training directory holding label folders
    QStringList extensions;       // empty = .mp4 .mov .m4v
    bool dryRun = false;
    QString backupSuffix = ".bak";   // empty = originals are replaced without backup
};

struct RepairEntry {
    QString path;
    RepairAction action = RepairAction::Reencode;
    bool ok = false;
    bool dryRun = false;
    ErrorKind error = ErrorKind::None;
    QString message;
};

struct RepairReport {
    int processed = 0;
    int repaired = 0;
    int failed = 0;
    int remuxed = 0;
    int reencoded = 0;
    bool cancelled = false;
    std::vector<RepairEntry> entries;
};

// Re-normalizes every media file of a label-bucketed dataset in place,
// strictly one file at a time. A failed file never stops the batch.
class DatasetRepair : public QObject {
    Q_OBJECT
public:
    explicit DatasetRepair(TranscodeExecutor& executor, QObject* parent = nullptr);
    ~DatasetRepair();

    bool run(const RepairOptions& options, RepairReport& report);

    // Stops before the next file (and the next ffmpeg invocation)
    void requestCancel();

    // Label folders sorted by name, files sorted by name
    static QStringList collectFiles(const QString& root, const QStringList& extensions);

    QString errorString() const { return m_error; }

signals:
    void fileProcessed(const RepairEntry& entry);

private:
    RepairEntry repairFile(const QString& path, const RepairOptions& options);

    TranscodeExecutor& m_executor;
    std::atomic<bool> m_cancelled{false};
    QString m_error;
};
