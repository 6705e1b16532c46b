#pragma once

#include <QString>

enum class ErrorKind {
    None,
    ProbeUnavailable,     // recovered locally: treated as "must re-encode"
    SourceMissing,
    InvalidWindow,
    TranscodeFailed,      // every ladder rung failed
    VerificationFailed,   // re-normalization or decode check failed
    ReplaceFailed,        // backup/rename step failed
    Cancelled,
    IoError
};

inline QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:               return "none";
    case ErrorKind::ProbeUnavailable:   return "probe-unavailable";
    case ErrorKind::SourceMissing:      return "source-missing";
    case ErrorKind::InvalidWindow:      return "invalid-window";
    case ErrorKind::TranscodeFailed:    return "transcode-failed";
    case ErrorKind::VerificationFailed: return "verification-failed";
    case ErrorKind::ReplaceFailed:      return "replace-failed";
    case ErrorKind::Cancelled:          return "cancelled";
    case ErrorKind::IoError:            return "io-error";
    }
    return "unknown";
}
