#include "CompatibilityPolicy.h"

namespace CompatibilityPolicy {

CompatibilityVerdict evaluate(const MediaInfo& info, const TargetProfile& profile) {
    CompatibilityVerdict verdict;

    if (info.hasVideo) {
        const bool codecOk = info.videoCodec.compare(profile.videoCodec, Qt::CaseInsensitive) == 0;
        const bool pixOk = info.videoPixelFormat.isEmpty()
            || info.videoPixelFormat.compare(profile.pixelFormat, Qt::CaseInsensitive) == 0;
        const bool sizeOk = info.videoWidth > 0 && info.videoHeight > 0
            && info.videoWidth % 2 == 0 && info.videoHeight % 2 == 0;
        verdict.videoOk = codecOk && pixOk && sizeOk;
    }

    if (!info.hasAudio) {
        verdict.audioOk = true;
    } else if (!profile.dropAudio) {
        verdict.audioOk = info.audioCodec.compare(profile.audioCodec, Qt::CaseInsensitive) == 0;
    }

    return verdict;
}

CompatibilityVerdict evaluate(const std::optional<MediaInfo>& info, const TargetProfile& profile) {
    if (!info) return CompatibilityVerdict{};
    return evaluate(*info, profile);
}

QString describe(const MediaInfo& info) {
    QString text = info.hasVideo
        ? QString("%1/%2 %3x%4").arg(info.videoCodec, info.videoPixelFormat)
              .arg(info.videoWidth).arg(info.videoHeight)
        : QString("no video");
    text += info.hasAudio ? QString(", audio %1").arg(info.audioCodec) : QString(", no audio");
    return text;
}

} // namespace CompatibilityPolicy
