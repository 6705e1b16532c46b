#include "AppContext.h"
#include "AppConstants.h"
#include "Logging.h"

#include <QDir>

AppPaths AppPaths::forBaseDir(const QString& baseDir) {
    AppPaths p;
    p.baseDir = QDir::cleanPath(baseDir);
    QDir base(p.baseDir);
    p.dataDir = base.filePath("data");
    p.videosDir = base.filePath("data/videos");
    p.settingsFile = base.filePath(QString("data/%1").arg(AppConstants::SettingsFileName));
    p.labelsFile = base.filePath(QString("data/%1").arg(AppConstants::LabelsFileName));
    p.undoFile = base.filePath(QString("data/%1").arg(AppConstants::UndoFileName));
    p.logFile = base.filePath(QString("data/%1").arg(AppConstants::LogFileName));
    p.defaultDatasetRoot = base.filePath("dataset");
    return p;
}

QString AppPaths::defaultBaseDir() {
    const QString env = qEnvironmentVariable(AppConstants::HomeEnvVar);
    if (!env.isEmpty()) return env;
    return QDir::home().filePath(AppConstants::BaseDirName);
}

AppContext::AppContext(const QString& baseDir)
    : m_paths(AppPaths::forBaseDir(baseDir.isEmpty() ? AppPaths::defaultBaseDir() : baseDir))
    , m_runner(std::make_unique<QProcessRunner>())
{
    ExportSettings defaults;
    defaults.datasetRoot = m_paths.defaultDatasetRoot;

    m_settings = std::make_unique<SettingsStore>(m_paths.settingsFile, defaults);
    m_labels = std::make_unique<LabelRegistry>(m_paths.labelsFile);
    m_undo = std::make_unique<UndoStack>(m_paths.undoFile, AppConstants::UndoCapacity);
    m_library = std::make_unique<VideoLibrary>(m_paths.videosDir);
    m_tools = ToolLocator::locate(m_paths.baseDir);
}

AppContext::~AppContext() = default;

bool AppContext::initialize() {
    QDir dirs;
    if (!dirs.mkpath(m_paths.videosDir)) {
        m_error = QString("Cannot create %1").arg(m_paths.videosDir);
        return false;
    }

    if (!m_settings->load()) {
        m_error = m_settings->errorString();
        return false;
    }

    const QString training = m_settings->current().trainingDir();
    if (!dirs.mkpath(training)) {
        m_error = QString("Cannot create %1").arg(training);
        return false;
    }

    DC_LOG_DEBUG("Base dir {}, ffmpeg {}, ffprobe {}", m_paths.baseDir.toStdString(),
                 m_tools.ffmpeg.toStdString(), m_tools.ffprobe.toStdString());
    return true;
}

TargetProfile AppContext::exportProfile() const {
    TargetProfile profile;
    profile.frameRate = m_settings->current().frameRate;
    return profile;
}
