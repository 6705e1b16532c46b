#pragma once

#include <QString>
#include <optional>

enum class ClipMode {
    Backward,   // window ends at the cursor
    Centered,   // window centered on the cursor
    Range       // explicit in/out marks
};

struct ClipWindow {
    double start = 0.0;   // seconds in source
    double end = 0.0;

    double duration() const { return end - start; }
    bool isValid() const { return end - start > 0.0; }
};

namespace ClipPlanner {

// Never fails: invalid range marks fall back to the backward window
ClipWindow plan(ClipMode mode, double currentTime, double duration,
                std::optional<double> inMark = std::nullopt,
                std::optional<double> outMark = std::nullopt);

QString modeToString(ClipMode mode);
std::optional<ClipMode> modeFromString(const QString& text);

} // namespace ClipPlanner
