#pragma once

#include "MediaProbe.h"
#include "TargetProfile.h"
#include <optional>

struct CompatibilityVerdict {
    bool videoOk = false;
    bool audioOk = false;

    bool isCompatible() const { return videoOk && audioOk; }
};

// The one definition of "already matches the target profile", shared by
// clip export verification and dataset repair.
namespace CompatibilityPolicy {

CompatibilityVerdict evaluate(const MediaInfo& info, const TargetProfile& profile);

// No probe result: nothing is trusted, everything is re-encoded
CompatibilityVerdict evaluate(const std::optional<MediaInfo>& info, const TargetProfile& profile);

QString describe(const MediaInfo& info);

} // namespace CompatibilityPolicy
