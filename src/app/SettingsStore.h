#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QMutex>
#include <optional>

#include "AppConstants.h"
#include "ClipPlanner.h"

struct ExportSettings {
    QString datasetRoot;
    double clipDuration = AppConstants::DefaultClipDuration;  // seconds
    ClipMode clipMode = ClipMode::Backward;
    int targetPerLabel = AppConstants::DefaultTargetPerLabel;
    int marginPerLabel = AppConstants::DefaultMarginPerLabel;
    bool alwaysReencode = false;    // skip the stream copy attempt
    int frameRate = 0;              // 0 = keep source rate

    QString trainingDir() const;
};

// Fields left empty are not changed
struct SettingsUpdate {
    std::optional<QString> datasetRoot;
    std::optional<double> clipDuration;
    std::optional<QString> clipMode;
    std::optional<int> targetPerLabel;
    std::optional<int> marginPerLabel;
    std::optional<bool> alwaysReencode;
    std::optional<int> frameRate;
};

// Process-wide export settings with an on-disk JSON mirror. update() is the
// only mutation; readers take a snapshot with current().
class SettingsStore : public QObject {
    Q_OBJECT
public:
    SettingsStore(const QString& filePath, const ExportSettings& defaults, QObject* parent = nullptr);
    ~SettingsStore();

    // A missing file keeps the defaults
    bool load();

    ExportSettings current() const;
    bool update(const SettingsUpdate& change);

    QString filePath() const { return m_filePath; }
    QString errorString() const { return m_error; }

    static QJsonObject toJson(const ExportSettings& settings);
    static ExportSettings fromJson(const QJsonObject& obj, const ExportSettings& defaults);

signals:
    void settingsChanged(const ExportSettings& settings);

private:
    bool writeFile(const ExportSettings& settings);

    QString m_filePath;
    ExportSettings m_defaults;
    ExportSettings m_settings;
    QString m_error;
    mutable QMutex m_mutex;
};
