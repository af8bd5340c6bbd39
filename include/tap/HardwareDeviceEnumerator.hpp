#pragma once
#include "hal/IAudioHardware.hpp"
#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

// Read-only queries over the hardware device list.
// Every failing query throws CaptureError carrying the OS status.
class HardwareDeviceEnumerator {
public:
    explicit HardwareDeviceEnumerator(IAudioHardware& hardware);

    // Devices with at least one output channel, in hardware order.
    // Devices whose channel query fails are logged and skipped.
    // Throws CaptureError(DeviceQuery) if the list itself is unreadable.
    std::vector<HalObjectId> listOutputCapableDevices() const;

    // Throws CaptureError(NoDefaultDevice).
    HalObjectId defaultSystemOutputDevice() const;

    // Throws CaptureError(DeviceQuery).
    std::string readDeviceUID(HalObjectId device) const;

    // Total output channels; 0 for devices without an output configuration.
    // Throws CaptureError(DeviceQuery).
    uint32_t readChannelCount(HalObjectId device) const;

private:
    IAudioHardware&                 hardware_;
    std::shared_ptr<spdlog::logger> log_;
};
