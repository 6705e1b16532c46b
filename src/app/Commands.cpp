#include "Commands.h"
#include "AppConstants.h"
#include "AppContext.h"
#include "ClipExporter.h"
#include "DatasetRepair.h"
#include "DatasetScanner.h"
#include "DecodeVerifier.h"
#include "Logging.h"
#include "PathUtil.h"

#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <csignal>

namespace {

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

DatasetRepair* g_activeRepair = nullptr;

void onInterrupt(int) {
    if (g_activeRepair) g_activeRepair->requestCancel();
}

int usageError(const QString& message) {
    err() << "error: " << message << Qt::endl;
    return Commands::ExitUsage;
}

bool toDouble(const QString& text, double& value) {
    bool ok = false;
    value = text.toDouble(&ok);
    return ok;
}

bool toInt(const QString& text, int& value) {
    bool ok = false;
    value = text.toInt(&ok);
    return ok;
}

// args[0] is the command name
bool parseCommand(QCommandLineParser& parser, const QStringList& args) {
    parser.addHelpOption();
    QStringList argv = args;
    argv[0] = QString("%1 %2").arg(AppConstants::AppName, args.first());
    if (!parser.parse(argv)) {
        err() << "error: " << parser.errorText() << Qt::endl;
        return false;
    }
    if (parser.isSet("help")) {
        out() << parser.helpText();
        return false;
    }
    return true;
}

QString usageText() {
    return QString(
        "Usage: %1 [--home DIR] [--log-level LEVEL] [--log-file PATH] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  export <video> --time T --label L   Cut a clip into Training/<label>/\n"
        "  undo [--list]                       Delete the most recent clip\n"
        "  labels                              Registered labels\n"
        "  focus                               Per-label counts against the target\n"
        "  repair                              Normalize every clip in place\n"
        "  settings                            Show or change export settings\n"
        "  videos                              List the video library\n"
        "  import <file>                       Copy a video into the library\n"
        "  doctor                              Check ffmpeg, ffprobe and FFmpeg libraries\n")
        .arg(AppConstants::AppName);
}

void printSettings(const ExportSettings& s) {
    out() << "dataset_root      " << s.datasetRoot << '\n'
          << "clip_duration     " << s.clipDuration << '\n'
          << "clip_mode         " << ClipPlanner::modeToString(s.clipMode) << '\n'
          << "target_per_label  " << s.targetPerLabel << '\n'
          << "margin_per_label  " << s.marginPerLabel << '\n'
          << "always_reencode   " << (s.alwaysReencode ? "on" : "off") << '\n'
          << "frame_rate        " << s.frameRate << Qt::endl;
}

void printAttempts(const QVector<TranscodeAttempt>& attempts) {
    for (const TranscodeAttempt& a : attempts) {
        err() << "[" << a.rung << "] exit " << a.exitCode << (a.ok ? " ok" : " failed") << '\n'
              << "  " << a.commandLine << '\n';
        if (!a.ok && !a.diagnostics.isEmpty())
            err() << a.diagnostics.trimmed() << '\n';
    }
    err().flush();
}

int cmdExport(AppContext& ctx, const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Cut a clip around the cursor into the dataset.");
    QCommandLineOption time("time", "Cursor position in seconds.", "seconds");
    QCommandLineOption label("label", "Label folder for the clip.", "label");
    QCommandLineOption inMark("in", "Range start in seconds.", "seconds");
    QCommandLineOption outMark("out", "Range end in seconds.", "seconds");
    QCommandLineOption mode("mode", "backward, centered or range.", "mode");
    QCommandLineOption duration("duration", "Clip duration in seconds.", "seconds");
    QCommandLineOption reencode("reencode", "Skip the stream copy attempt.");
    parser.addOptions({time, label, inMark, outMark, mode, duration, reencode});
    parser.addPositionalArgument("video", "Library video name or path.");
    if (!parseCommand(parser, args)) return Commands::ExitUsage;

    if (parser.positionalArguments().size() != 1)
        return usageError("export takes exactly one video");
    if (!parser.isSet(label))
        return usageError("--label is required");

    ClipRequest request;
    request.video = parser.positionalArguments().first();
    request.label = parser.value(label);
    request.forceReencode = parser.isSet(reencode);

    double value = 0.0;
    if (parser.isSet(inMark)) {
        if (!toDouble(parser.value(inMark), value)) return usageError("--in must be a number");
        request.inMark = value;
    }
    if (parser.isSet(outMark)) {
        if (!toDouble(parser.value(outMark), value)) return usageError("--out must be a number");
        request.outMark = value;
    }
    const bool haveRange = request.inMark && request.outMark;

    if (parser.isSet(time)) {
        if (!toDouble(parser.value(time), request.currentTime))
            return usageError("--time must be a number");
    } else if (!haveRange) {
        return usageError("--time is required unless --in and --out are given");
    } else {
        request.currentTime = *request.outMark;
    }

    if (parser.isSet(mode)) {
        request.mode = ClipPlanner::modeFromString(parser.value(mode));
        if (!request.mode) return usageError(QString("unknown mode: %1").arg(parser.value(mode)));
    } else if (haveRange) {
        request.mode = ClipMode::Range;
    }
    if (parser.isSet(duration)) {
        if (!toDouble(parser.value(duration), value) || value <= 0.0)
            return usageError("--duration must be a positive number");
        request.duration = value;
    }

    ClipExporter exporter(ctx);
    const ExportResult result = exporter.exportClip(request);
    if (!result.ok) {
        err() << "Export failed (" << errorKindName(result.error) << "): " << result.message << Qt::endl;
        printAttempts(result.attempts);
        return Commands::ExitFailure;
    }

    out() << result.path << Qt::endl;
    return Commands::ExitOk;
}

int cmdUndo(AppContext& ctx, const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Delete the most recently exported clip.");
    QCommandLineOption list("list", "Show the undo stack, most recent first.");
    parser.addOption(list);
    if (!parseCommand(parser, args)) return Commands::ExitUsage;

    if (parser.isSet(list)) {
        const QStringList entries = ctx.undo().entries();
        for (int i = entries.size() - 1; i >= 0; --i)
            out() << entries[i] << '\n';
        out().flush();
        return Commands::ExitOk;
    }

    ClipExporter exporter(ctx);
    const UndoResult result = exporter.undoLast();
    if (!result.ok) {
        err() << result.message << Qt::endl;
        return Commands::ExitFailure;
    }
    out() << result.message << Qt::endl;
    return Commands::ExitOk;
}

int cmdLabels(AppContext& ctx, const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("List registered labels in first-seen order.");
    if (!parseCommand(parser, args)) return Commands::ExitUsage;

    for (const QString& label : ctx.labels().load())
        out() << label << '\n';
    out().flush();
    return Commands::ExitOk;
}

int cmdFocus(AppContext& ctx, const QStringList& args) {
    const ExportSettings settings = ctx.settings().current();

    QCommandLineParser parser;
    parser.setApplicationDescription("Show which labels still need clips.");
    QCommandLineOption root("root", "Training directory.", "dir", settings.trainingDir());
    QCommandLineOption threshold("threshold", "Target clips per label.", "n",
                                 QString::number(settings.targetPerLabel));
    QCommandLineOption top("top", "Show at most this many labels (0 = all).", "n", "0");
    QCommandLineOption ext("ext", "Additional clip extension (repeatable).", "ext");
    parser.addOptions({root, threshold, top, ext});
    if (!parseCommand(parser, args)) return Commands::ExitUsage;

    int target = 0;
    int limit = 0;
    if (!toInt(parser.value(threshold), target) || target < 1)
        return usageError("--threshold must be a positive integer");
    if (!toInt(parser.value(top), limit) || limit < 0)
        return usageError("--top must be zero or more");

    DatasetScanner scanner(PathUtil::defaultMediaExtensions() + parser.values(ext));
    if (!scanner.scan(parser.value(root))) {
        err() << scanner.errorString() << Qt::endl;
        return Commands::ExitUsage;
    }
    scanner.addRegisteredLabels(ctx.labels().load());

    const int margin = settings.marginPerLabel;
    for (const LabelCount& lc : scanner.counts()) {
        out() << QString("%1 %2 %3")
                     .arg(lc.label, -24)
                     .arg(lc.count, 6)
                     .arg(DatasetScanner::statusName(DatasetScanner::statusFor(lc.count, target, margin)))
              << (lc.hasFolder ? "" : " (no folder)") << '\n';
    }

    const DatasetSummary summary = DatasetScanner::summarize(scanner.counts());
    out() << QString("\nclasses %1, total %2, mean %3, min %4, max %5\n")
                 .arg(summary.classes).arg(summary.total)
                 .arg(summary.mean, 0, 'f', 1).arg(summary.min).arg(summary.max);

    const std::vector<FocusItem> focus = DatasetScanner::belowTarget(scanner.counts(), target, margin);
    int needed = 0;
    for (const FocusItem& item : focus) needed += item.deficit;

    if (focus.empty()) {
        out() << QString("All labels have at least %1 clips.").arg(target) << Qt::endl;
        return Commands::ExitOk;
    }

    out() << QString("\nBelow %1 (%2 clips needed):\n").arg(target).arg(needed);
    int shown = 0;
    for (const FocusItem& item : focus) {
        if (limit > 0 && shown >= limit) break;
        out() << QString("  %1 %2 need %3 [%4]\n")
                     .arg(item.label, -24).arg(item.count, 6).arg(item.deficit)
                     .arg(DatasetScanner::statusName(item.status));
        ++shown;
    }
    out().flush();
    return Commands::ExitOk;
}

int cmdRepair(AppContext& ctx, const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Re-encode every clip to the training profile, in place.");
    QCommandLineOption root("root", "Training directory.", "dir", ctx.settings().current().trainingDir());
    QCommandLineOption exts("exts", "Comma separated extensions.", "list", ".mp4,.mov,.m4v");
    QCommandLineOption cfr("cfr", "Constant output frame rate (0 = keep).", "fps",
                           QString::number(AppConstants::DefaultRepairFrameRate));
    QCommandLineOption dryRun("dry-run", "Report what would be done.");
    QCommandLineOption backupExt("backup-ext", "Backup suffix, empty for none.", "suffix",
                                 AppConstants::DefaultBackupSuffix);
    parser.addOptions({root, exts, cfr, dryRun, backupExt});
    if (!parseCommand(parser, args)) return Commands::ExitUsage;

    int fps = 0;
    if (!toInt(parser.value(cfr), fps) || fps < 0)
        return usageError("--cfr must be zero or more");

    RepairOptions options;
    options.root = parser.value(root);
    options.extensions = parser.value(exts).split(',', Qt::SkipEmptyParts);
    options.dryRun = parser.isSet(dryRun);
    options.backupSuffix = parser.value(backupExt);

    if (!QFileInfo(options.root).isDir()) {
        err() << "Dataset path not found: " << options.root << Qt::endl;
        return Commands::ExitUsage;
    }

    TargetProfile profile;
    profile.frameRate = fps;
    TranscodeExecutor executor(ctx.runner(), ctx.tools(), profile);
    DatasetRepair repair(executor);

    QObject::connect(&repair, &DatasetRepair::fileProcessed, [](const RepairEntry& entry) {
        const QString action = entry.action == RepairAction::Remux ? "remux" : "reencode";
        if (entry.dryRun)
            out() << "[DRY] " << action << " " << entry.path << '\n';
        else if (entry.ok)
            out() << "[OK] " << action << " " << entry.path << '\n';
        else
            out() << "[ERR] " << entry.path << ": " << entry.message << '\n';
        out().flush();
    });

    g_activeRepair = &repair;
    auto previous = std::signal(SIGINT, onInterrupt);

    RepairReport report;
    const bool ran = repair.run(options, report);

    std::signal(SIGINT, previous);
    g_activeRepair = nullptr;

    if (!ran) {
        err() << repair.errorString() << Qt::endl;
        return Commands::ExitUsage;
    }

    out() << QString("Done. processed=%1 repaired=%2 failed=%3 (remuxed=%4 reencoded=%5)%6")
                 .arg(report.processed).arg(report.repaired).arg(report.failed)
                 .arg(report.remuxed).arg(report.reencoded)
                 .arg(report.cancelled ? " cancelled" : "")
          << Qt::endl;
    return (report.failed > 0 || report.cancelled) ? Commands::ExitFailure : Commands::ExitOk;
}

int cmdSettings(AppContext& ctx, const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Show the export settings, applying any changes first.");
    QCommandLineOption datasetRoot("dataset-root", "Dataset root directory.", "dir");
    QCommandLineOption duration("duration", "Clip duration in seconds.", "seconds");
    QCommandLineOption mode("mode", "backward, centered or range.", "mode");
    QCommandLineOption target("target", "Target clips per label.", "n");
    QCommandLineOption margin("margin", "Clips below target still counted as near.", "n");
    QCommandLineOption alwaysReencode("always-reencode", "on or off.", "on|off");
    QCommandLineOption fps("fps", "Export frame rate (0 = keep source rate).", "n");
    parser.addOptions({datasetRoot, duration, mode, target, margin, alwaysReencode, fps});
    if (!parseCommand(parser, args)) return Commands::ExitUsage;

    SettingsUpdate change;
    bool changed = false;
    double d = 0.0;
    int n = 0;

    if (parser.isSet(datasetRoot)) {
        change.datasetRoot = QFileInfo(parser.value(datasetRoot)).absoluteFilePath();
        changed = true;
    }
    if (parser.isSet(duration)) {
        if (!toDouble(parser.value(duration), d)) return usageError("--duration must be a number");
        change.clipDuration = d;
        changed = true;
    }
    if (parser.isSet(mode)) {
        change.clipMode = parser.value(mode);
        changed = true;
    }
    if (parser.isSet(target)) {
        if (!toInt(parser.value(target), n)) return usageError("--target must be an integer");
        change.targetPerLabel = n;
        changed = true;
    }
    if (parser.isSet(margin)) {
        if (!toInt(parser.value(margin), n)) return usageError("--margin must be an integer");
        change.marginPerLabel = n;
        changed = true;
    }
    if (parser.isSet(alwaysReencode)) {
        const QString v = parser.value(alwaysReencode).toLower();
        if (v != "on" && v != "off") return usageError("--always-reencode takes on or off");
        change.alwaysReencode = (v == "on");
        changed = true;
    }
    if (parser.isSet(fps)) {
        if (!toInt(parser.value(fps), n)) return usageError("--fps must be an integer");
        change.frameRate = n;
        changed = true;
    }

    if (changed && !ctx.settings().update(change))
        return usageError(ctx.settings().errorString());

    printSettings(ctx.settings().current());
    return Commands::ExitOk;
}

int cmdVideos(AppContext& ctx, const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("List the source video library.");
    if (!parseCommand(parser, args)) return Commands::ExitUsage;

    for (const QString& name : ctx.library().list())
        out() << name << '\n';
    out().flush();
    return Commands::ExitOk;
}

int cmdImport(AppContext& ctx, const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Copy a video into the library.");
    parser.addPositionalArgument("file", "Video to import (.mp4, .mov, .m4v).");
    if (!parseCommand(parser, args)) return Commands::ExitUsage;
    if (parser.positionalArguments().size() != 1)
        return usageError("import takes exactly one file");

    const QString name = ctx.library().importVideo(parser.positionalArguments().first());
    if (name.isEmpty()) {
        err() << ctx.library().errorString() << Qt::endl;
        return Commands::ExitFailure;
    }
    out() << name << Qt::endl;
    return Commands::ExitOk;
}

int cmdDoctor(AppContext& ctx, const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Check the ffmpeg tools and FFmpeg libraries.");
    if (!parseCommand(parser, args)) return Commands::ExitUsage;

    bool healthy = true;
    auto check = [&](const char* name, const QString& program) {
        const ProcessResult r = ctx.runner().run(program, {"-hide_banner", "-version"});
        if (!r.ok()) {
            healthy = false;
            out() << name << ": " << program << " (unavailable: "
                  << r.diagnostics().trimmed().section('\n', 0, 0) << ")\n";
            return;
        }
        const QString firstLine = QString::fromUtf8(r.stdOut).section('\n', 0, 0).trimmed();
        out() << name << ": " << program << '\n' << "  " << firstLine << '\n';
    };

    check("ffmpeg", ctx.tools().ffmpeg);
    check("ffprobe", ctx.tools().ffprobe);
    out() << "libraries: " << DecodeVerifier::libraryVersions() << '\n'
          << "home: " << ctx.paths().baseDir << '\n'
          << "dataset: " << ctx.settings().current().trainingDir() << Qt::endl;
    return healthy ? Commands::ExitOk : Commands::ExitFailure;
}

} // namespace

namespace Commands {

QStringList commandNames() {
    return {"export", "undo", "labels", "focus", "repair", "settings", "videos", "import", "doctor"};
}

int run(const QStringList& arguments) {
    QCommandLineParser parser;
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    QCommandLineOption home("home", "Application base directory.", "dir");
    QCommandLineOption logLevel("log-level", "trace, debug, info, warn, error, critical or off.",
                                "level", "info");
    QCommandLineOption logFile("log-file", "Log file (default <home>/data/server.log).", "path");
    QCommandLineOption help({"h", "help"}, "Show this help.");
    QCommandLineOption version("version", "Show the version.");
    parser.addOptions({home, logLevel, logFile, help, version});

    if (!parser.parse(arguments))
        return usageError(parser.errorText());
    if (parser.isSet(version)) {
        out() << AppConstants::AppName << " " << AppConstants::AppVersion << Qt::endl;
        return ExitOk;
    }

    const QStringList rest = parser.positionalArguments();
    if (rest.isEmpty() || parser.isSet(help)) {
        (rest.isEmpty() && !parser.isSet(help) ? err() : out()) << usageText() << Qt::flush;
        return parser.isSet(help) ? ExitOk : ExitUsage;
    }

    const QString command = rest.first();
    if (!commandNames().contains(command))
        return usageError(QString("unknown command: %1\n\n%2").arg(command, usageText()));

    AppContext ctx(parser.value(home));
    QDir().mkpath(ctx.paths().dataDir);
    const QString logPath = parser.isSet(logFile) ? parser.value(logFile) : ctx.paths().logFile;
    initLogging(parser.value(logLevel).toStdString(), logPath.toStdString());

    if (!ctx.initialize()) {
        DC_LOG_ERROR("{}", ctx.errorString().toStdString());
        return ExitFailure;
    }
    DC_LOG_DEBUG("Command: {}", arguments.join(' ').toStdString());

    if (command == "export")   return cmdExport(ctx, rest);
    if (command == "undo")     return cmdUndo(ctx, rest);
    if (command == "labels")   return cmdLabels(ctx, rest);
    if (command == "focus")    return cmdFocus(ctx, rest);
    if (command == "repair")   return cmdRepair(ctx, rest);
    if (command == "settings") return cmdSettings(ctx, rest);
    if (command == "videos")   return cmdVideos(ctx, rest);
    if (command == "import")   return cmdImport(ctx, rest);
    return cmdDoctor(ctx, rest);
}

} // namespace Commands
