#include "ClipPlanner.h"

#include <algorithm>

namespace ClipPlanner {

ClipWindow plan(ClipMode mode, double currentTime, double duration,
                std::optional<double> inMark, std::optional<double> outMark) {
    ClipWindow w;

    if (mode == ClipMode::Range && inMark && outMark && *outMark > *inMark) {
        w.start = std::max(0.0, *inMark);
        w.end = *outMark;
        return w;
    }

    if (mode == ClipMode::Centered) {
        w.start = std::max(0.0, currentTime - duration / 2.0);
        w.end = w.start + duration;
        return w;
    }

    w.start = std::max(0.0, currentTime - duration);
    w.end = currentTime;
    return w;
}

QString modeToString(ClipMode mode) {
    switch (mode) {
    case ClipMode::Centered: return "centered";
    case ClipMode::Range:    return "range";
    case ClipMode::Backward: break;
    }
    return "backward";
}

std::optional<ClipMode> modeFromString(const QString& text) {
    const QString t = text.trimmed().toLower();
    if (t == "backward") return ClipMode::Backward;
    if (t == "centered") return ClipMode::Centered;
    if (t == "range") return ClipMode::Range;
    return std::nullopt;
}

} // namespace ClipPlanner
