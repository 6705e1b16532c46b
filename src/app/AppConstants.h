#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "dataset-cutter";
    inline constexpr const char* AppVersion = "0.3.0";
    inline constexpr const char* OrgName = "DatasetCutter";

    // Base directory under $HOME unless DATASET_CUTTER_HOME overrides it
    inline constexpr const char* BaseDirName = "DatasetCutter";
    inline constexpr const char* HomeEnvVar = "DATASET_CUTTER_HOME";
    inline constexpr const char* FfmpegEnvVar = "FFMPEG_BINARY";

    inline constexpr const char* TrainingDirName = "Training";
    inline constexpr const char* SettingsFileName = "settings.json";
    inline constexpr const char* LabelsFileName = "labels.txt";
    inline constexpr const char* UndoFileName = "undo.txt";
    inline constexpr const char* LogFileName = "server.log";

    inline constexpr int UndoCapacity = 10;

    // Export defaults
    inline constexpr double DefaultClipDuration = 2.0;
    inline constexpr int DefaultTargetPerLabel = 50;
    inline constexpr int DefaultMarginPerLabel = 5;

    // Batch repair defaults
    inline constexpr int DefaultRepairFrameRate = 30;
    inline constexpr const char* DefaultBackupSuffix = ".bak";

    inline constexpr const char* MediaExtensions[] = {".mp4", ".mov", ".m4v"};

    // Case-insensitive OS metadata names never listed as media
    inline constexpr const char* ExcludedMetaNames[] = {
        ".ds_store", "thumbs.db", "ehthumbs.db", "desktop.ini"
    };
}
