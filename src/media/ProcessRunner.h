#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

struct ProcessResult {
    bool started = false;
    bool crashed = false;
    int exitCode = -1;
    QByteArray stdOut;
    QByteArray stdErr;
    QString errorString;   // set when the program could not be started

    bool ok() const { return started && !crashed && exitCode == 0; }

    // stderr, falling back to the start error, for diagnostics
    QString diagnostics() const;
};

// Runs a program synchronously with an argument vector (no shell).
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const QString& program, const QStringList& args) = 0;

    static QString commandLine(const QString& program, const QStringList& args);
};

class QProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const QString& program, const QStringList& args) override;
};
