#include "ProcessRunner.h"

#include <QProcess>

QString ProcessResult::diagnostics() const {
    if (!started) return errorString;
    QString text = QString::fromUtf8(stdErr);
    if (text.trimmed().isEmpty()) text = QString::fromUtf8(stdOut);
    if (crashed) text.append("\n(process crashed)");
    return text;
}

QString ProcessRunner::commandLine(const QString& program, const QStringList& args) {
    QStringList parts;
    parts.append(program);
    for (const QString& a : args) {
        if (a.isEmpty() || a.contains(' ') || a.contains('\'') || a.contains('"'))
            parts.append("'" + QString(a).replace("'", "'\\''") + "'");
        else
            parts.append(a);
    }
    return parts.join(' ');
}

ProcessResult QProcessRunner::run(const QString& program, const QStringList& args) {
    ProcessResult result;

    QProcess proc;
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.setStandardInputFile(QProcess::nullDevice());
    proc.start(program, args);

    if (!proc.waitForStarted(-1)) {
        result.errorString = QString("Cannot start %1: %2").arg(program, proc.errorString());
        return result;
    }
    result.started = true;

    // No timeout: transcodes run to completion
    proc.waitForFinished(-1);

    result.stdOut = proc.readAllStandardOutput();
    result.stdErr = proc.readAllStandardError();
    result.crashed = proc.exitStatus() == QProcess::CrashExit;
    result.exitCode = proc.exitCode();
    return result;
}
