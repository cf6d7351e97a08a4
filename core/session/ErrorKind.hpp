#pragma once
#include "utils/Logger.hpp"

namespace ts {

enum class ErrorKind {
    HandAbsent,
    ClassifierUnavailable,
    ClassificationFailure,
    PersistenceFailure,
    RecordingInProgress
};

inline const char* errorName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::HandAbsent:
        return "HandAbsent";
    case ErrorKind::ClassifierUnavailable:
        return "ClassifierUnavailable";
    case ErrorKind::ClassificationFailure:
        return "ClassificationFailure";
    case ErrorKind::PersistenceFailure:
        return "PersistenceFailure";
    case ErrorKind::RecordingInProgress:
        return "RecordingInProgress";
    }
    return "Unknown";
}

// A missing hand is an ordinary frame, not a failure.
inline bool isFailure(ErrorKind kind) { return kind != ErrorKind::HandAbsent; }

inline LogLevel logLevelFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::HandAbsent:
        return LogLevel::Debug;
    case ErrorKind::ClassifierUnavailable:
        return LogLevel::Error;
    case ErrorKind::ClassificationFailure:
    case ErrorKind::PersistenceFailure:
    case ErrorKind::RecordingInProgress:
        return LogLevel::Warn;
    }
    return LogLevel::Warn;
}

} // namespace ts
