#pragma once

#include <QObject>
#include <QString>
#include <QVector>
#include <optional>

#include "ClipPlanner.h"
#include "ErrorKind.h"
#include "TranscodeExecutor.h"

class AppContext;

struct ClipRequest {
    QString video;                       // library name or path
    double currentTime = 0.0;
    QString label;
    std::optional<double> inMark;
    std::optional<double> outMark;
    std::optional<ClipMode> mode;        // overrides the stored clip mode
    std::optional<double> duration;      // overrides the stored clip duration
    bool forceReencode = false;
};

struct ExportResult {
    bool ok = false;
    ErrorKind error = ErrorKind::None;
    QString message;
    QString path;
    QString label;           // sanitized
    ClipWindow window;
    QString rung;
    bool renormalized = false;
    QVector<TranscodeAttempt> attempts;
};

struct UndoResult {
    bool ok = false;         // false when the stack was empty
    QString path;
    bool fileRemoved = false;
    QString message;
};

// Interactive export: plan the window, cut it into Training/<label>/ and
// record it for undo.
class ClipExporter : public QObject {
    Q_OBJECT
public:
    explicit ClipExporter(AppContext& context, QObject* parent = nullptr);
    ~ClipExporter();

    ExportResult exportClip(const ClipRequest& request);

    // Pop the most recent export and delete its file
    UndoResult undoLast();

    void setDecodeCheck(TranscodeExecutor::DecodeCheck check) { m_decodeCheck = std::move(check); }

    static QString clipFileName(const QString& source, const ClipWindow& window, qint64 exportMs);

signals:
    void finished(bool success, const QString& message);

private:
    ExportResult finish(ExportResult& result);

    AppContext& m_context;
    TranscodeExecutor::DecodeCheck m_decodeCheck;
};
