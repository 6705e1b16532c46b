#include "SettingsStore.h"
#include "AppConstants.h"
#include "Logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <algorithm>

QString ExportSettings::trainingDir() const {
    return QDir(datasetRoot).filePath(AppConstants::TrainingDirName);
}

SettingsStore::SettingsStore(const QString& filePath, const ExportSettings& defaults, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath)
    , m_defaults(defaults)
    , m_settings(defaults)
{
}

SettingsStore::~SettingsStore() = default;

bool SettingsStore::load() {
    QMutexLocker locker(&m_mutex);

    QFile file(m_filePath);
    if (!file.exists()) {
        m_settings = m_defaults;
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(m_filePath);
        return false;
    }

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    file.close();

    if (!doc.isObject()) {
        m_error = "Invalid settings file format";
        return false;
    }

    QJsonObject root = doc.object();
    int version = root["version"].toInt(0);
    if (version < 1) {
        m_error = "Unsupported settings file version";
        return false;
    }

    m_settings = fromJson(root, m_defaults);
    return true;
}

ExportSettings SettingsStore::current() const {
    QMutexLocker locker(&m_mutex);
    return m_settings;
}

bool SettingsStore::update(const SettingsUpdate& change) {
    ExportSettings next;
    {
        QMutexLocker locker(&m_mutex);
        next = m_settings;

        if (change.clipDuration) {
            if (!(*change.clipDuration > 0.0)) {
                m_error = "Clip duration must be positive";
                return false;
            }
            next.clipDuration = *change.clipDuration;
        }
        if (change.clipMode) {
            auto mode = ClipPlanner::modeFromString(*change.clipMode);
            if (!mode) {
                m_error = QString("Unknown clip mode: %1").arg(*change.clipMode);
                return false;
            }
            next.clipMode = *mode;
        }
        if (change.targetPerLabel) {
            if (*change.targetPerLabel < 0) {
                m_error = "Target per label must not be negative";
                return false;
            }
            next.targetPerLabel = *change.targetPerLabel;
        }
        if (change.marginPerLabel) {
            if (*change.marginPerLabel < 0) {
                m_error = "Margin per label must not be negative";
                return false;
            }
            next.marginPerLabel = *change.marginPerLabel;
        }
        if (change.frameRate) {
            if (*change.frameRate < 0) {
                m_error = "Frame rate must not be negative";
                return false;
            }
            next.frameRate = *change.frameRate;
        }
        if (change.alwaysReencode)
            next.alwaysReencode = *change.alwaysReencode;

        if (change.datasetRoot && !change.datasetRoot->trimmed().isEmpty()) {
            next.datasetRoot = QDir::cleanPath(change.datasetRoot->trimmed());
            if (!QDir().mkpath(next.trainingDir())) {
                m_error = QString("Cannot create %1").arg(next.trainingDir());
                return false;
            }
        }

        if (!writeFile(next)) return false;
        m_settings = next;
    }

    DC_LOG_INFO("Settings updated: root={} duration={} mode={}",
                next.datasetRoot.toStdString(), next.clipDuration,
                ClipPlanner::modeToString(next.clipMode).toStdString());
    emit settingsChanged(next);
    return true;
}

bool SettingsStore::writeFile(const ExportSettings& settings) {
    QDir().mkpath(QFileInfo(m_filePath).absolutePath());

    QJsonObject root = toJson(settings);
    root["version"] = 1;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(m_filePath);
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        m_error = QString("Cannot commit: %1").arg(m_filePath);
        return false;
    }
    return true;
}

QJsonObject SettingsStore::toJson(const ExportSettings& settings) {
    QJsonObject obj;
    obj["dataset_root"] = settings.datasetRoot;
    obj["clip_duration"] = settings.clipDuration;
    obj["clip_mode"] = ClipPlanner::modeToString(settings.clipMode);
    obj["target_per_label"] = settings.targetPerLabel;
    obj["margin_per_label"] = settings.marginPerLabel;
    obj["always_reencode"] = settings.alwaysReencode;
    obj["frame_rate"] = settings.frameRate;
    return obj;
}

ExportSettings SettingsStore::fromJson(const QJsonObject& obj, const ExportSettings& defaults) {
    ExportSettings s = defaults;
    s.datasetRoot = obj["dataset_root"].toString(defaults.datasetRoot);

    double duration = obj["clip_duration"].toDouble(defaults.clipDuration);
    if (duration > 0.0) s.clipDuration = duration;

    auto mode = ClipPlanner::modeFromString(obj["clip_mode"].toString());
    if (mode) s.clipMode = *mode;

    s.targetPerLabel = std::max(0, obj["target_per_label"].toInt(defaults.targetPerLabel));
    s.marginPerLabel = std::max(0, obj["margin_per_label"].toInt(defaults.marginPerLabel));
    s.alwaysReencode = obj["always_reencode"].toBool(defaults.alwaysReencode);
    s.frameRate = std::max(0, obj["frame_rate"].toInt(defaults.frameRate));
    return s;
}
