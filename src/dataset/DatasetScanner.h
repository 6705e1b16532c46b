#pragma once

#include <QString>
#include <QStringList>
#include <vector>

enum class LabelStatus {
    Complete,   // count >= target
    Near,       // within the margin below target
    Needs
};

struct LabelCount {
    QString label;
    int count = 0;
    bool hasFolder = true;
};

struct DatasetSummary {
    int classes = 0;
    int total = 0;
    double mean = 0.0;
    int min = 0;
    int max = 0;
};

struct FocusItem {
    QString label;
    int count = 0;
    int deficit = 0;
    LabelStatus status = LabelStatus::Needs;
};

// Clip counts per label folder under a Training root
class DatasetScanner {
public:
    explicit DatasetScanner(const QStringList& extensions = QStringList());

    bool scan(const QString& trainingRoot);

    // Registered labels without a folder are reported with zero clips
    void addRegisteredLabels(const QStringList& labels);

    const std::vector<LabelCount>& counts() const { return m_counts; }
    QStringList extensions() const { return m_extensions; }
    QString errorString() const { return m_error; }

    int countClips(const QString& labelDir) const;

    static DatasetSummary summarize(const std::vector<LabelCount>& counts);
    static LabelStatus statusFor(int count, int target, int margin);
    static QString statusName(LabelStatus status);

    // Labels below target, fewest clips first, then by name
    static std::vector<FocusItem> belowTarget(const std::vector<LabelCount>& counts,
                                              int target, int margin);

private:
    QStringList m_extensions;
    std::vector<LabelCount> m_counts;
    QString m_error;
};
