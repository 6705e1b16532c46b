#include "ClipExporter.h"
#include "AppContext.h"
#include "Logging.h"
#include "PathUtil.h"
#include "TimeUtil.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

ClipExporter::ClipExporter(AppContext& context, QObject* parent)
    : QObject(parent), m_context(context) {}

ClipExporter::~ClipExporter() = default;

QString ClipExporter::clipFileName(const QString& source, const ClipWindow& window, qint64 exportMs) {
    const QString stem = PathUtil::sanitizeFileName(QFileInfo(source).completeBaseName());
    return QString("%1_%2_%3_%4.mp4")
        .arg(stem)
        .arg(TimeUtil::secondsToMs(window.start))
        .arg(TimeUtil::secondsToMs(window.end))
        .arg(exportMs);
}

ExportResult ClipExporter::exportClip(const ClipRequest& request) {
    ExportResult result;
    const ExportSettings settings = m_context.settings().current();

    const QString source = m_context.library().resolve(request.video);
    if (!QFileInfo(source).isFile()) {
        result.error = ErrorKind::SourceMissing;
        result.message = QString("Source video not found: %1").arg(request.video);
        return finish(result);
    }

    const ClipMode mode = request.mode.value_or(settings.clipMode);
    const double duration = request.duration.value_or(settings.clipDuration);
    result.window = ClipPlanner::plan(mode, request.currentTime, duration,
                                      request.inMark, request.outMark);
    if (!result.window.isValid()) {
        result.error = ErrorKind::InvalidWindow;
        result.message = QString("Invalid segment duration (%1 to %2)")
                             .arg(TimeUtil::secondsArg(result.window.start),
                                  TimeUtil::secondsArg(result.window.end));
        return finish(result);
    }

    result.label = PathUtil::sanitizeFileName(request.label);
    if (!m_context.labels().append(result.label))
        DC_LOG_WARN("Label not registered: {}", m_context.labels().errorString().toStdString());

    const QString labelDir = QDir(settings.trainingDir()).filePath(result.label);
    if (!QDir().mkpath(labelDir)) {
        result.error = ErrorKind::IoError;
        result.message = QString("Cannot create %1").arg(labelDir);
        return finish(result);
    }

    const QString destination =
        QDir(labelDir).filePath(clipFileName(source, result.window, TimeUtil::epochMs()));

    TargetProfile profile = m_context.exportProfile();
    TranscodeExecutor executor(m_context.runner(), m_context.tools(), profile);
    if (m_decodeCheck) executor.setDecodeCheck(m_decodeCheck);

    DC_LOG_INFO("Exporting {} [{}, {}) as {}", source.toStdString(),
                TimeUtil::secondsArg(result.window.start).toStdString(),
                TimeUtil::secondsArg(result.window.end).toStdString(),
                result.label.toStdString());

    const TranscodeOutcome outcome =
        executor.cut(source, result.window, destination,
                     request.forceReencode || settings.alwaysReencode);
    result.attempts = outcome.attempts;
    result.rung = outcome.rung;
    result.renormalized = outcome.renormalized;
    if (!outcome.ok) {
        result.error = outcome.error;
        result.message = outcome.message;
        return finish(result);
    }

    if (QFileInfo(destination).size() <= 0) {
        PathUtil::removeIfExists(destination);
        result.error = ErrorKind::TranscodeFailed;
        result.message = QString("Export produced no output: %1").arg(destination);
        return finish(result);
    }

    result.ok = true;
    result.path = destination;
    result.message = QString("Saved %1").arg(destination);
    if (!m_context.undo().push(destination))
        DC_LOG_WARN("Undo log not updated: {}", m_context.undo().errorString().toStdString());
    return finish(result);
}

UndoResult ClipExporter::undoLast() {
    UndoResult result;
    const std::optional<QString> last = m_context.undo().pop();
    if (!last) {
        result.message = m_context.undo().errorString().isEmpty()
            ? QString("Nothing to undo") : m_context.undo().errorString();
        return result;
    }

    result.path = *last;
    if (!QFile::exists(*last)) {
        result.ok = true;
        result.message = QString("Already gone: %1").arg(*last);
    } else if (QFile::remove(*last)) {
        result.ok = true;
        result.fileRemoved = true;
        result.message = QString("Removed %1").arg(*last);
    } else {
        // The clip is still on disk, so it stays undoable
        result.message = QString("Could not remove %1").arg(*last);
        if (!m_context.undo().push(*last))
            result.message += "; " + m_context.undo().errorString();
        DC_LOG_ERROR("Undo: {}", result.message.toStdString());
        return result;
    }
    DC_LOG_INFO("Undo: {}", result.message.toStdString());
    return result;
}

ExportResult ClipExporter::finish(ExportResult& result) {
    if (result.ok)
        DC_LOG_INFO("{}", result.message.toStdString());
    else
        DC_LOG_ERROR("Export failed ({}): {}", errorKindName(result.error).toStdString(),
                     result.message.toStdString());
    emit finished(result.ok, result.message);
    return result;
}
