#include "TranscodeExecutor.h"
#include "DecodeVerifier.h"
#include "ProcessRunner.h"
#include "PathUtil.h"
#include "TimeUtil.h"
#include "Logging.h"

#include <QDir>
#include <QFileInfo>

namespace {

const char* CopyRung = "copy";
const char* RemuxRung = "remux";
const char* SoftwareRung = "software";
const char* HardwareRung = "hardware";

const char* EvenScaleFilter = "scale=trunc(iw/2)*2:trunc(ih/2)*2";

bool hasOutput(const QString& path) {
    QFileInfo fi(path);
    return fi.isFile() && fi.size() > 0;
}

} // namespace

TranscodeExecutor::TranscodeExecutor(ProcessRunner& runner, const ToolPaths& tools,
                                     const TargetProfile& profile, QObject* parent)
    : QObject(parent)
    , m_runner(runner)
    , m_tools(tools)
    , m_profile(profile)
    , m_probe(runner, tools.ffprobe)
{
    m_decodeCheck = [](const QString& filePath, QString* error) {
        DecodeVerifier verifier;
        bool ok = verifier.verify(filePath);
        if (!ok && error) *error = verifier.errorString();
        return ok;
    };
}

TranscodeExecutor::~TranscodeExecutor() = default;

TranscodeOutcome TranscodeExecutor::cut(const QString& source, const ClipWindow& window,
                                        const QString& destination, bool forceReencode) {
    TranscodeOutcome outcome;

    if (!QFileInfo(source).isFile()) {
        fail(outcome, ErrorKind::SourceMissing, QString("Source video not found: %1").arg(source));
        return outcome;
    }
    if (!window.isValid()) {
        fail(outcome, ErrorKind::InvalidWindow, "Invalid segment duration");
        return outcome;
    }
    if (!QFileInfo(destination).absoluteDir().exists()) {
        fail(outcome, ErrorKind::IoError,
             QString("Output directory missing: %1").arg(QFileInfo(destination).absolutePath()));
        return outcome;
    }

    const QStringList inputArgs = {
        "-ss", TimeUtil::secondsArg(window.start),
        "-i", source,
        "-t", TimeUtil::secondsArg(window.duration())
    };
    const AudioHandling audio = m_profile.dropAudio ? AudioHandling::Drop : AudioHandling::Encode;
    const QString partPath = PathUtil::tempSibling(destination, "part");

    QVector<Rung> rungs;
    if (!forceReencode) {
        Rung copy;
        copy.name = CopyRung;
        copy.args << "-hide_banner" << "-nostdin" << inputArgs << "-c" << "copy"
                  << outputArgs(partPath);
        rungs.append(copy);
    }
    rungs += encodeRungs(inputArgs, QStringList(), audio, partPath);

    int used = runLadder(rungs, partPath, outcome);
    if (used < 0) {
        PathUtil::removeIfExists(partPath);
        if (m_cancelled)
            fail(outcome, ErrorKind::Cancelled, "Export cancelled");
        else
            fail(outcome, ErrorKind::TranscodeFailed, "ffmpeg failed to export clip");
        return outcome;
    }
    outcome.rung = rungs[used].name;

    QString finalPart = partPath;
    if (outcome.rung == CopyRung) {
        // Stream copy may succeed yet leave the clip outside the profile
        std::optional<MediaInfo> info = m_probe.probe(partPath);
        if (!info) {
            DC_LOG_WARN("Cannot probe stream copy of {} ({}), re-encoding",
                        destination.toStdString(), m_probe.errorString().toStdString());
        }
        CompatibilityVerdict verdict = CompatibilityPolicy::evaluate(info, m_profile);

        if (!verdict.isCompatible()) {
            DC_LOG_INFO("Stream copy not in target profile ({}), normalizing",
                        info ? CompatibilityPolicy::describe(*info).toStdString() : std::string("unknown"));

            const QString normPath = PathUtil::tempSibling(destination, "norm");
            const QVector<Rung> normRungs =
                encodeRungs(QStringList{"-i", partPath}, QStringList(), audio, normPath);

            int normUsed = runLadder(normRungs, normPath, outcome);
            PathUtil::removeIfExists(partPath);
            if (normUsed < 0) {
                PathUtil::removeIfExists(normPath);
                if (m_cancelled)
                    fail(outcome, ErrorKind::Cancelled, "Export cancelled");
                else
                    fail(outcome, ErrorKind::VerificationFailed,
                         "Stream copy was not compatible and could not be normalized");
                return outcome;
            }
            outcome.rung = normRungs[normUsed].name;
            outcome.renormalized = true;
            finalPart = normPath;
        }
    }

    QString renameError;
    if (!PathUtil::atomicRename(finalPart, destination, &renameError)) {
        PathUtil::removeIfExists(finalPart);
        fail(outcome, ErrorKind::ReplaceFailed, renameError);
        return outcome;
    }

    outcome.ok = true;
    DC_LOG_INFO("Exported {} [{} - {}] via {}{}", destination.toStdString(),
                TimeUtil::secondsToHMS(window.start).toStdString(),
                TimeUtil::secondsToHMS(window.end).toStdString(),
                outcome.rung.toStdString(), outcome.renormalized ? " (re-normalized)" : "");
    return outcome;
}

NormalizePlan TranscodeExecutor::planNormalize(const QString& path) {
    NormalizePlan plan;

    std::optional<MediaInfo> info = m_probe.probe(path);
    plan.probed = info.has_value();
    plan.verdict = CompatibilityPolicy::evaluate(info, m_profile);
    plan.action = plan.verdict.isCompatible() ? RepairAction::Remux : RepairAction::Reencode;

    if (info) {
        plan.hasAudio = info->hasAudio;
        plan.description = CompatibilityPolicy::describe(*info);
    } else {
        plan.description = QString("probe unavailable: %1").arg(m_probe.errorString());
    }
    return plan;
}

TranscodeOutcome TranscodeExecutor::normalizeInPlace(const QString& path, const QString& backupSuffix) {
    TranscodeOutcome outcome;

    if (!QFileInfo(path).isFile()) {
        fail(outcome, ErrorKind::SourceMissing, QString("File not found: %1").arg(path));
        return outcome;
    }

    const NormalizePlan plan = planNormalize(path);
    outcome.action = plan.action;
    if (!plan.probed)
        DC_LOG_WARN("Cannot probe {}, re-encoding: {}", path.toStdString(), plan.description.toStdString());

    const QString tmpPath = PathUtil::tempSibling(path, "repair");
    const QStringList inputArgs = {"-i", path};

    QVector<Rung> rungs;
    if (plan.action == RepairAction::Remux) {
        Rung remux;
        remux.name = RemuxRung;
        remux.args << "-hide_banner" << "-nostdin" << inputArgs << "-map" << "0:v:0";
        if (plan.hasAudio) remux.args << "-map" << "0:a:0";
        remux.args << "-c" << "copy" << outputArgs(tmpPath);
        rungs.append(remux);
    } else {
        AudioHandling audio = AudioHandling::Encode;
        if (m_profile.dropAudio)
            audio = AudioHandling::Drop;
        else if (plan.probed && plan.verdict.audioOk)
            audio = AudioHandling::Copy;
        rungs = encodeRungs(inputArgs, QStringList{"-map", "0:v:0", "-map", "0:a:0?"}, audio, tmpPath);
    }

    int used = runLadder(rungs, tmpPath, outcome);
    if (used < 0) {
        PathUtil::removeIfExists(tmpPath);
        if (m_cancelled)
            fail(outcome, ErrorKind::Cancelled, "Repair cancelled");
        else
            fail(outcome, ErrorKind::TranscodeFailed, QString("Failed to repair %1").arg(path));
        return outcome;
    }
    outcome.rung = rungs[used].name;

    QString decodeError;
    if (!m_decodeCheck(tmpPath, &decodeError)) {
        PathUtil::removeIfExists(tmpPath);
        fail(outcome, ErrorKind::VerificationFailed,
             QString("Post-repair decode check failed for %1: %2").arg(path, decodeError));
        return outcome;
    }

    QString renameError;
    if (backupSuffix.isEmpty()) {
        if (!PathUtil::atomicRename(tmpPath, path, &renameError)) {
            PathUtil::removeIfExists(tmpPath);
            fail(outcome, ErrorKind::ReplaceFailed, renameError);
            return outcome;
        }
    } else {
        const QString backupPath = path + backupSuffix;
        if (!PathUtil::removeIfExists(backupPath)) {
            PathUtil::removeIfExists(tmpPath);
            fail(outcome, ErrorKind::ReplaceFailed, QString("Cannot remove stale backup %1").arg(backupPath));
            return outcome;
        }
        if (!PathUtil::atomicRename(path, backupPath, &renameError)) {
            PathUtil::removeIfExists(tmpPath);
            fail(outcome, ErrorKind::ReplaceFailed, renameError);
            return outcome;
        }
        if (!PathUtil::atomicRename(tmpPath, path, &renameError)) {
            QString restoreError;
            if (!PathUtil::atomicRename(backupPath, path, &restoreError))
                renameError += "; restore failed: " + restoreError;
            PathUtil::removeIfExists(tmpPath);
            fail(outcome, ErrorKind::ReplaceFailed, renameError);
            return outcome;
        }
    }

    outcome.ok = true;
    return outcome;
}

int TranscodeExecutor::runLadder(const QVector<Rung>& rungs, const QString& output,
                                 TranscodeOutcome& outcome) {
    for (int i = 0; i < rungs.size(); ++i) {
        if (m_cancelled) return -1;

        const Rung& rung = rungs[i];
        PathUtil::removeIfExists(output);

        TranscodeAttempt attempt;
        attempt.rung = rung.name;
        attempt.program = m_tools.ffmpeg;
        attempt.args = rung.args;
        attempt.commandLine = ProcessRunner::commandLine(m_tools.ffmpeg, rung.args);
        DC_LOG_DEBUG("ffmpeg {}: {}", rung.name.toStdString(), attempt.commandLine.toStdString());

        ProcessResult result = m_runner.run(m_tools.ffmpeg, rung.args);
        attempt.exitCode = result.exitCode;
        attempt.diagnostics = result.diagnostics();
        attempt.ok = result.ok() && hasOutput(output);
        if (result.ok() && !attempt.ok)
            attempt.diagnostics.append("\nffmpeg reported success but produced no output");

        outcome.attempts.append(attempt);

        if (attempt.ok) return i;
        DC_LOG_WARN("ffmpeg {} attempt failed (exit {})", rung.name.toStdString(), result.exitCode);
    }
    return -1;
}

QVector<TranscodeExecutor::Rung> TranscodeExecutor::encodeRungs(const QStringList& inputArgs,
                                                                const QStringList& mapArgs,
                                                                AudioHandling audio,
                                                                const QString& output) const {
    QVector<Rung> rungs;
    for (bool hardware : {false, true}) {
        Rung rung;
        rung.name = hardware ? HardwareRung : SoftwareRung;
        rung.args << "-hide_banner" << "-nostdin" << inputArgs << mapArgs
                  << "-vf" << EvenScaleFilter
                  << videoEncodeArgs(hardware)
                  << audioArgs(audio)
                  << outputArgs(output);
        rungs.append(rung);
    }
    return rungs;
}

QStringList TranscodeExecutor::videoEncodeArgs(bool hardware) const {
    QStringList args;
    if (hardware) {
        args << "-c:v" << m_profile.hardwareEncoder << "-b:v" << m_profile.hardwareBitrate;
    } else {
        args << "-c:v" << m_profile.softwareEncoder
             << "-preset" << "veryfast"
             << "-crf" << QString::number(m_profile.crf)
             << "-profile:v" << "main"
             << "-level" << "4.1";
    }
    args << "-pix_fmt" << m_profile.pixelFormat;
    if (m_profile.frameRate > 0)
        args << "-r" << QString::number(m_profile.frameRate);
    return args;
}

QStringList TranscodeExecutor::audioArgs(AudioHandling audio) const {
    switch (audio) {
    case AudioHandling::Copy:
        return {"-c:a", "copy"};
    case AudioHandling::Drop:
        return {"-an"};
    case AudioHandling::Encode:
        break;
    }
    return {"-c:a", m_profile.audioCodec, "-b:a", m_profile.audioBitrate};
}

QStringList TranscodeExecutor::outputArgs(const QString& output) const {
    return {"-movflags", "+faststart", "-y", output};
}

void TranscodeExecutor::fail(TranscodeOutcome& outcome, ErrorKind kind, const QString& message) const {
    outcome.ok = false;
    outcome.error = kind;
    outcome.message = message;

    DC_LOG_ERROR("{} [{}]", message.toStdString(), errorKindName(kind).toStdString());
    for (const TranscodeAttempt& a : outcome.attempts) {
        DC_LOG_ERROR("ffmpeg {} cmd: {}", a.rung.toStdString(), a.commandLine.toStdString());
        DC_LOG_ERROR("stderr ({}):\n{}", a.rung.toStdString(), a.diagnostics.toStdString());
    }
}
