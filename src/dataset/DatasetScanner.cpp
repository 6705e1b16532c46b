#include "DatasetScanner.h"
#include "PathUtil.h"

#include <QDir>
#include <QFileInfo>
#include <algorithm>

DatasetScanner::DatasetScanner(const QStringList& extensions)
    : m_extensions(PathUtil::normalizeExtensions(
          extensions.isEmpty() ? PathUtil::defaultMediaExtensions() : extensions))
{
}

bool DatasetScanner::scan(const QString& trainingRoot) {
    m_counts.clear();
    m_error.clear();

    QDir root(trainingRoot);
    if (!root.exists()) {
        m_error = QString("Dataset path not found: %1").arg(trainingRoot);
        return false;
    }

    const QStringList labelDirs = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString& name : labelDirs) {
        LabelCount lc;
        lc.label = name;
        lc.count = countClips(root.filePath(name));
        m_counts.push_back(lc);
    }
    return true;
}

void DatasetScanner::addRegisteredLabels(const QStringList& labels) {
    for (const QString& label : labels) {
        auto it = std::find_if(m_counts.begin(), m_counts.end(),
                               [&](const LabelCount& lc) { return lc.label == label; });
        if (it != m_counts.end()) continue;

        LabelCount lc;
        lc.label = label;
        lc.hasFolder = false;
        m_counts.push_back(lc);
    }
}

int DatasetScanner::countClips(const QString& labelDir) const {
    QDir dir(labelDir);
    if (!dir.exists()) return 0;

    int n = 0;
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot);
    for (const QFileInfo& fi : entries) {
        if (PathUtil::isListableMedia(fi, m_extensions)) ++n;
    }
    return n;
}

DatasetSummary DatasetScanner::summarize(const std::vector<LabelCount>& counts) {
    DatasetSummary s;
    if (counts.empty()) return s;

    s.classes = static_cast<int>(counts.size());
    s.min = counts.front().count;
    s.max = counts.front().count;
    for (const LabelCount& lc : counts) {
        s.total += lc.count;
        s.min = std::min(s.min, lc.count);
        s.max = std::max(s.max, lc.count);
    }
    s.mean = static_cast<double>(s.total) / s.classes;
    return s;
}

LabelStatus DatasetScanner::statusFor(int count, int target, int margin) {
    if (count >= target) return LabelStatus::Complete;
    if (count >= target - std::max(0, margin)) return LabelStatus::Near;
    return LabelStatus::Needs;
}

QString DatasetScanner::statusName(LabelStatus status) {
    switch (status) {
    case LabelStatus::Complete: return "complete";
    case LabelStatus::Near:     return "near";
    case LabelStatus::Needs:    break;
    }
    return "needs";
}

std::vector<FocusItem> DatasetScanner::belowTarget(const std::vector<LabelCount>& counts,
                                                   int target, int margin) {
    std::vector<FocusItem> under;
    for (const LabelCount& lc : counts) {
        if (lc.count >= target) continue;
        FocusItem item;
        item.label = lc.label;
        item.count = lc.count;
        item.deficit = target - lc.count;
        item.status = statusFor(lc.count, target, margin);
        under.push_back(item);
    }

    std::sort(under.begin(), under.end(), [](const FocusItem& a, const FocusItem& b) {
        if (a.count != b.count) return a.count < b.count;
        return a.label < b.label;
    });
    return under;
}
