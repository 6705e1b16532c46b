#pragma once

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMap>
#include <QSet>
#include <QStringList>
#include <QVector>

#include "media/ProcessRunner.h"

// Scripted stand-in for ffmpeg and ffprobe. A "media file" is a text file
// holding a stream description such as
//     codec=h264;pix=yuv420p;w=640;h=480;audio=aac
// Encodes write a description derived from their input and arguments, and
// the fake ffprobe turns a description back into ffprobe JSON.
class FakeProcessRunner : public ProcessRunner {
public:
    struct Call {
        QString program;
        QStringList args;
    };

    QString ffmpeg = "ffmpeg";
    QString ffprobe = "ffprobe";

    QSet<QString> failingEncoders;   // "copy", "libx264", "h264_nvenc", ...
    QSet<QString> silentEncoders;    // exit 0 without writing the output
    bool ffprobeAvailable = true;

    QVector<Call> calls;

    static void writeMedia(const QString& path, const QString& description) {
        QFile file(path);
        if (file.open(QIODevice::WriteOnly | QIODevice::Truncate))
            file.write(description.toUtf8());
    }

    static QMap<QString, QString> readMedia(const QString& path) {
        QMap<QString, QString> fields;
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) return fields;
        const QString text = QString::fromUtf8(file.readAll()).trimmed();
        if (!text.startsWith("codec=")) return fields;
        for (const QString& part : text.split(';', Qt::SkipEmptyParts)) {
            const int eq = part.indexOf('=');
            if (eq > 0) fields.insert(part.left(eq), part.mid(eq + 1));
        }
        return fields;
    }

    ProcessResult run(const QString& program, const QStringList& args) override {
        calls.append(Call{program, args});
        if (program == ffprobe) return runProbe(args);
        if (program == ffmpeg) return runEncode(args);

        ProcessResult r;
        r.errorString = QString("%1: No such file or directory").arg(program);
        return r;
    }

    int ffmpegCalls() const { return countCalls(ffmpeg); }
    int ffprobeCalls() const { return countCalls(ffprobe); }

    // ffmpeg invocations using the given video encoder ("copy" for stream copy)
    int encoderCalls(const QString& encoder) const {
        int n = 0;
        for (const Call& c : calls) {
            if (c.program == ffmpeg && encoderOf(c.args) == encoder) ++n;
        }
        return n;
    }

    QVector<Call> ffmpegInvocations() const {
        QVector<Call> out;
        for (const Call& c : calls) {
            if (c.program == ffmpeg) out.append(c);
        }
        return out;
    }

    static QString encoderOf(const QStringList& args) {
        const int cv = args.indexOf("-c:v");
        if (cv >= 0 && cv + 1 < args.size()) return args[cv + 1];
        const int c = args.indexOf("-c");
        if (c >= 0 && c + 1 < args.size()) return args[c + 1];
        return QString();
    }

    static QString valueAfter(const QStringList& args, const QString& flag) {
        const int i = args.indexOf(flag);
        return (i >= 0 && i + 1 < args.size()) ? args[i + 1] : QString();
    }

private:
    int countCalls(const QString& program) const {
        int n = 0;
        for (const Call& c : calls) {
            if (c.program == program) ++n;
        }
        return n;
    }

    ProcessResult runProbe(const QStringList& args) {
        ProcessResult r;
        if (!ffprobeAvailable) {
            r.errorString = "ffprobe: No such file or directory";
            return r;
        }
        r.started = true;

        const QString path = args.last();
        if (!QFileInfo(path).isFile()) {
            r.exitCode = 1;
            r.stdErr = QString("%1: No such file or directory\n").arg(path).toUtf8();
            return r;
        }
        const QMap<QString, QString> m = readMedia(path);
        if (m.isEmpty()) {
            r.exitCode = 1;
            r.stdErr = QString("%1: Invalid data found when processing input\n").arg(path).toUtf8();
            return r;
        }

        QJsonArray streams;
        QJsonObject video;
        video["codec_type"] = "video";
        video["codec_name"] = m.value("codec");
        video["pix_fmt"] = m.value("pix");
        video["width"] = m.value("w").toInt();
        video["height"] = m.value("h").toInt();
        video["avg_frame_rate"] = m.value("fps", "30") + "/1";
        streams.append(video);

        const QString audio = m.value("audio", "none");
        if (audio != "none") {
            QJsonObject a;
            a["codec_type"] = "audio";
            a["codec_name"] = audio;
            a["sample_rate"] = "48000";
            a["channels"] = 2;
            streams.append(a);
        }

        QJsonObject format;
        format["format_name"] = "mov,mp4,m4a,3gp,3g2,mj2";
        format["duration"] = "5.000000";

        QJsonObject root;
        root["streams"] = streams;
        root["format"] = format;
        r.exitCode = 0;
        r.stdOut = QJsonDocument(root).toJson();
        return r;
    }

    ProcessResult runEncode(const QStringList& args) {
        ProcessResult r;
        r.started = true;

        const QString input = valueAfter(args, "-i");
        const QString output = args.last();
        const QString encoder = encoderOf(args);

        const QMap<QString, QString> in = readMedia(input);
        if (in.isEmpty()) {
            r.exitCode = 1;
            r.stdErr = QString("%1: Invalid data found when processing input\n").arg(input).toUtf8();
            return r;
        }
        if (failingEncoders.contains(encoder)) {
            r.exitCode = 1;
            r.stdErr = QString("Error while opening encoder %1\n").arg(encoder).toUtf8();
            return r;
        }
        r.exitCode = 0;
        if (silentEncoders.contains(encoder)) return r;

        QMap<QString, QString> out = in;
        if (encoder != "copy") {
            out["codec"] = "h264";
            out["pix"] = valueAfter(args, "-pix_fmt");
            out["w"] = QString::number(in.value("w").toInt() / 2 * 2);
            out["h"] = QString::number(in.value("h").toInt() / 2 * 2);
            if (args.contains("-r")) out["fps"] = valueAfter(args, "-r");

            const QString audioCodec = valueAfter(args, "-c:a");
            if (args.contains("-an"))
                out["audio"] = "none";
            else if (!audioCodec.isEmpty() && audioCodec != "copy" && in.value("audio", "none") != "none")
                out["audio"] = audioCodec;
        } else if (args.contains("-map") && !args.contains("0:a:0")) {
            out["audio"] = "none";
        }

        QStringList parts;
        parts << "codec=" + out.value("codec");
        for (const QString& key : {"pix", "w", "h", "fps", "audio"}) {
            if (out.contains(key)) parts << key + "=" + out.value(key);
        }
        writeMedia(output, parts.join(';'));
        return r;
    }
};
