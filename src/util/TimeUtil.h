#pragma once

#include <cstdint>
#include <QString>
#include <QDateTime>

namespace TimeUtil {

// Seconds with millisecond precision, as passed to ffmpeg -ss / -t
inline QString secondsArg(double seconds) {
    return QString::number(seconds, 'f', 3);
}

// Truncating conversion used in clip file names
inline qint64 secondsToMs(double seconds) {
    return static_cast<qint64>(seconds * 1000.0);
}

inline qint64 epochMs() {
    return QDateTime::currentMSecsSinceEpoch();
}

inline QString secondsToHMS(double totalSeconds) {
    int hours = static_cast<int>(totalSeconds) / 3600;
    int minutes = (static_cast<int>(totalSeconds) % 3600) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    int millis = static_cast<int>((totalSeconds - static_cast<int>(totalSeconds)) * 1000);

    if (hours > 0) {
        return QString("%1:%2:%3.%4")
            .arg(hours)
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'))
            .arg(millis, 3, 10, QChar('0'));
    }
    return QString("%1:%2.%3")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

// Parse an ffprobe rational ("30000/1001", "25/1", "0/0"); 0.0 when unknown
inline double parseRational(const QString& text) {
    const int slash = text.indexOf('/');
    if (slash < 0) {
        bool ok = false;
        double value = text.toDouble(&ok);
        return ok ? value : 0.0;
    }
    bool numOk = false;
    bool denOk = false;
    double num = text.left(slash).toDouble(&numOk);
    double den = text.mid(slash + 1).toDouble(&denOk);
    if (!numOk || !denOk || den == 0.0) return 0.0;
    return num / den;
}

} // namespace TimeUtil
