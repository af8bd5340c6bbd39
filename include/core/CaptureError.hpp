#pragma once
#include "hal/HalTypes.hpp"
#include <stdexcept>
#include <string>

enum class CaptureErrorKind {
    TapCreation,
    NoOutputDevices,
    AggregateCreation,
    DeviceStart,
    FormatUnavailable,
    NoDefaultDevice,
    DeviceQuery,
    FileCreation,
    TapUnavailable
};

inline const char* errorKindToString(CaptureErrorKind kind) {
    switch (kind) {
        case CaptureErrorKind::TapCreation:       return "tap_creation";
        case CaptureErrorKind::NoOutputDevices:   return "no_output_devices";
        case CaptureErrorKind::AggregateCreation: return "aggregate_creation";
        case CaptureErrorKind::DeviceStart:       return "device_start";
        case CaptureErrorKind::FormatUnavailable: return "format_unavailable";
        case CaptureErrorKind::NoDefaultDevice:   return "no_default_device";
        case CaptureErrorKind::DeviceQuery:       return "device_query";
        case CaptureErrorKind::FileCreation:      return "file_creation";
        case CaptureErrorKind::TapUnavailable:    return "tap_unavailable";
    }
    return "unknown";
}

// Failure of a capture operation. Callers branch on kind(); what() is the
// human-readable message shown to the user.
class CaptureError : public std::runtime_error {
public:
    CaptureError(CaptureErrorKind kind, const std::string& message,
                 HalStatus status = kHalNoError)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    CaptureErrorKind kind() const { return kind_; }

    // Underlying OS status, kHalNoError when the failure had none.
    HalStatus status() const { return status_; }

private:
    CaptureErrorKind kind_;
    HalStatus        status_;
};
