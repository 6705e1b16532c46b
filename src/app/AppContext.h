#pragma once

#include <QString>
#include <memory>

#include "LabelRegistry.h"
#include "ProcessRunner.h"
#include "SettingsStore.h"
#include "TargetProfile.h"
#include "ToolLocator.h"
#include "UndoStack.h"
#include "VideoLibrary.h"

struct AppPaths {
    QString baseDir;
    QString dataDir;
    QString videosDir;
    QString settingsFile;
    QString labelsFile;
    QString undoFile;
    QString logFile;
    QString defaultDatasetRoot;

    static AppPaths forBaseDir(const QString& baseDir);

    // $DATASET_CUTTER_HOME, else ~/DatasetCutter
    static QString defaultBaseDir();
};

// Owns everything an export or repair needs: paths, the settings store,
// the label registry, the undo log, the video library and the tool runner.
class AppContext {
public:
    explicit AppContext(const QString& baseDir = QString());
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    // Create the data directories and load settings.json
    bool initialize();

    const AppPaths& paths() const { return m_paths; }
    SettingsStore& settings() { return *m_settings; }
    LabelRegistry& labels() { return *m_labels; }
    UndoStack& undo() { return *m_undo; }
    VideoLibrary& library() { return *m_library; }

    ProcessRunner& runner() { return *m_runner; }
    void setRunner(std::unique_ptr<ProcessRunner> runner) { m_runner = std::move(runner); }

    const ToolPaths& tools() const { return m_tools; }
    void setTools(const ToolPaths& tools) { m_tools = tools; }

    // Target profile with the frame rate from the current settings
    TargetProfile exportProfile() const;

    QString errorString() const { return m_error; }

private:
    AppPaths m_paths;
    ToolPaths m_tools;
    std::unique_ptr<SettingsStore> m_settings;
    std::unique_ptr<LabelRegistry> m_labels;
    std::unique_ptr<UndoStack> m_undo;
    std::unique_ptr<VideoLibrary> m_library;
    std::unique_ptr<ProcessRunner> m_runner;
    QString m_error;
};
