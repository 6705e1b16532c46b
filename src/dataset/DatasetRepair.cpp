#include "DatasetRepair.h"
#include "PathUtil.h"
#include "Logging.h"

#include <QDir>
#include <QFileInfo>

DatasetRepair::DatasetRepair(TranscodeExecutor& executor, QObject* parent)
    : QObject(parent)
    , m_executor(executor)
{
}

DatasetRepair::~DatasetRepair() = default;

void DatasetRepair::requestCancel() {
    m_cancelled = true;
    m_executor.requestCancel();
}

QStringList DatasetRepair::collectFiles(const QString& root, const QStringList& extensions) {
    const QStringList exts = PathUtil::normalizeExtensions(
        extensions.isEmpty() ? PathUtil::defaultMediaExtensions() : extensions);

    QStringList files;
    QDir rootDir(root);
    const QStringList labelDirs = rootDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString& label : labelDirs) {
        QDir labelDir(rootDir.filePath(label));
        const QFileInfoList entries = labelDir.entryInfoList(
            QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::Name);
        for (const QFileInfo& fi : entries) {
            if (PathUtil::isListableMedia(fi, exts))
                files.append(fi.absoluteFilePath());
        }
    }
    return files;
}

bool DatasetRepair::run(const RepairOptions& options, RepairReport& report) {
    report = RepairReport{};
    m_error.clear();
    m_cancelled = false;
    m_executor.resetCancel();

    QFileInfo rootInfo(options.root);
    if (!rootInfo.exists() || !rootInfo.isDir()) {
        m_error = QString("Root not found or not a directory: %1").arg(options.root);
        DC_LOG_ERROR("{}", m_error.toStdString());
        return false;
    }

    const QStringList files = collectFiles(options.root, options.extensions);
    DC_LOG_INFO("Repairing {} file(s) under {}{}", files.size(), options.root.toStdString(),
                options.dryRun ? " (dry run)" : "");

    for (const QString& path : files) {
        if (m_cancelled) {
            report.cancelled = true;
            DC_LOG_WARN("Repair cancelled after {} file(s)", report.processed);
            break;
        }

        RepairEntry entry = repairFile(path, options);
        if (entry.error == ErrorKind::Cancelled) {
            report.cancelled = true;
            break;
        }

        ++report.processed;
        if (entry.ok) {
            ++report.repaired;
            if (entry.action == RepairAction::Remux)
                ++report.remuxed;
            else
                ++report.reencoded;
        } else {
            ++report.failed;
        }
        report.entries.push_back(entry);
        emit fileProcessed(entry);
    }

    DC_LOG_INFO("Done. processed={} repaired={} failed={}",
                report.processed, report.repaired, report.failed);
    return true;
}

RepairEntry DatasetRepair::repairFile(const QString& path, const RepairOptions& options) {
    RepairEntry entry;
    entry.path = path;
    entry.dryRun = options.dryRun;

    if (options.dryRun) {
        NormalizePlan plan = m_executor.planNormalize(path);
        entry.action = plan.action;
        entry.ok = true;
        entry.message = plan.description;
        if (!plan.probed) entry.error = ErrorKind::ProbeUnavailable;
        DC_LOG_INFO("[DRY] Would {}: {}",
                    plan.action == RepairAction::Remux ? "remux" : "re-encode", path.toStdString());
        return entry;
    }

    TranscodeOutcome outcome = m_executor.normalizeInPlace(path, options.backupSuffix);
    entry.action = outcome.action;
    entry.ok = outcome.ok;
    entry.error = outcome.error;
    entry.message = outcome.ok ? QString("via %1").arg(outcome.rung) : outcome.message;

    if (outcome.ok)
        DC_LOG_INFO("[OK] Repaired {} ({})", path.toStdString(), outcome.rung.toStdString());
    else
        DC_LOG_ERROR("[ERR] {}: {}", path.toStdString(), outcome.message.toStdString());
    return entry;
}
