#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <atomic>
#include <functional>

#include "ClipPlanner.h"
#include "CompatibilityPolicy.h"
#include "ErrorKind.h"
#include "MediaProbe.h"
#include "TargetProfile.h"
#include "ToolLocator.h"

class ProcessRunner;

// One ffmpeg invocation of the fallback ladder
struct TranscodeAttempt {
    QString rung;
    QString program;
    QStringList args;
    QString commandLine;
    int exitCode = -1;
    bool ok = false;
    QString diagnostics;   // captured stderr, or why the process did not start
};

enum class RepairAction {
    Remux,      // already compatible: stream copy with fast start
    Reencode
};

struct NormalizePlan {
    RepairAction action = RepairAction::Reencode;
    CompatibilityVerdict verdict;
    bool probed = false;
    bool hasAudio = false;
    QString description;   // probe summary or probe error
};

struct TranscodeOutcome {
    bool ok = false;
    ErrorKind error = ErrorKind::None;
    QString message;
    QString rung;              // rung that produced the delivered file
    bool renormalized = false; // stream copy result was re-encoded after verification
    RepairAction action = RepairAction::Reencode;
    QVector<TranscodeAttempt> attempts;
};

class TranscodeExecutor : public QObject {
    Q_OBJECT
public:
    using DecodeCheck = std::function<bool(const QString& filePath, QString* error)>;

    TranscodeExecutor(ProcessRunner& runner, const ToolPaths& tools,
                      const TargetProfile& profile, QObject* parent = nullptr);
    ~TranscodeExecutor();

    // Cut [window.start, window.end) of source into destination:
    // stream copy, then software encode, then hardware encode.
    TranscodeOutcome cut(const QString& source, const ClipWindow& window,
                         const QString& destination, bool forceReencode);

    // Rewrite an existing file to the target profile. An empty backupSuffix
    // replaces the original without keeping a copy.
    TranscodeOutcome normalizeInPlace(const QString& path, const QString& backupSuffix);

    // Probe only: what normalizeInPlace would do
    NormalizePlan planNormalize(const QString& path);

    void setDecodeCheck(DecodeCheck check) { m_decodeCheck = std::move(check); }

    // Checked before every ffmpeg invocation; a running one is not interrupted
    void requestCancel() { m_cancelled = true; }
    void resetCancel() { m_cancelled = false; }

private:
    enum class AudioHandling { Copy, Encode, Drop };

    struct Rung {
        QString name;
        QStringList args;
    };

    // Index of the rung that produced a non-empty output, or -1
    int runLadder(const QVector<Rung>& rungs, const QString& output, TranscodeOutcome& outcome);

    QVector<Rung> encodeRungs(const QStringList& inputArgs, const QStringList& mapArgs,
                              AudioHandling audio, const QString& output) const;
    QStringList videoEncodeArgs(bool hardware) const;
    QStringList audioArgs(AudioHandling audio) const;
    QStringList outputArgs(const QString& output) const;

    void fail(TranscodeOutcome& outcome, ErrorKind kind, const QString& message) const;

    ProcessRunner& m_runner;
    ToolPaths m_tools;
    TargetProfile m_profile;
    MediaProbe m_probe;
    DecodeCheck m_decodeCheck;
    std::atomic<bool> m_cancelled{false};
};
