#pragma once

#include <QStringList>

class QCoreApplication;

// dataset-cutter subcommands. Each returns the process exit code:
// 0 success, 1 operation failure, 2 usage error or missing dataset root.
namespace Commands {

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

int run(const QStringList& arguments);

QStringList commandNames();

} // namespace Commands
