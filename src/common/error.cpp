#include "common/error.hpp"

#include <utility>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::EmptyInput: return "EmptyInput";
        case ErrorKind::DanglingReference: return "DanglingReference";
        case ErrorKind::HashMismatch: return "HashMismatch";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::IntegrityViolation: return "IntegrityViolation";
        case ErrorKind::TimedOut: return "TimedOut";
        case ErrorKind::Unreachable: return "Unreachable";
        case ErrorKind::OverlayUnavailable: return "OverlayUnavailable";
        case ErrorKind::InvalidMetadata: return "InvalidMetadata";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::IoError: return "IoError";
    }
    return "Unknown";
}

bool is_integrity_error(ErrorKind kind) {
    return kind == ErrorKind::HashMismatch || kind == ErrorKind::IntegrityViolation;
}

bool is_availability_error(ErrorKind kind) {
    return kind == ErrorKind::NotFound || kind == ErrorKind::Unreachable ||
           kind == ErrorKind::TimedOut || kind == ErrorKind::OverlayUnavailable;
}

KnapsackError::KnapsackError(ErrorKind kind, std::string operation, const std::string& detail)
    : std::runtime_error(operation + " failed [" + error_kind_name(kind) + "]: " + detail),
      kind_(kind),
      operation_(std::move(operation)) {}
