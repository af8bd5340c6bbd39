#include "tap/HardwareDeviceEnumerator.hpp"
#include "core/CaptureError.hpp"
#include <spdlog/spdlog.h>

HardwareDeviceEnumerator::HardwareDeviceEnumerator(IAudioHardware& hardware)
    : hardware_(hardware)
    , log_(spdlog::default_logger()->clone("HardwareDeviceEnumerator"))
{
}

std::vector<HalObjectId> HardwareDeviceEnumerator::listOutputCapableDevices() const {
    std::vector<HalObjectId> all;
    HalStatus err = hardware_.listHardwareDevices(all);
    if (err != kHalNoError) {
        throw CaptureError(CaptureErrorKind::DeviceQuery,
                           "Failed to read hardware device list: " +
                               halStatusToString(err),
                           err);
    }

    std::vector<HalObjectId> result;
    for (HalObjectId device : all) {
        try {
            uint32_t channels = readChannelCount(device);
            if (channels > 0)
                result.push_back(device);
            else
                log_->debug("Device {} has no output channels", device);
        } catch (const CaptureError& e) {
            log_->warn("Ignored device {}: {}", device, e.what());
        }
    }
    return result;
}

HalObjectId HardwareDeviceEnumerator::defaultSystemOutputDevice() const {
    HalObjectId device = kHalUnknownObject;
    HalStatus err = hardware_.readDefaultOutputDevice(device);
    if (err != kHalNoError) {
        throw CaptureError(CaptureErrorKind::NoDefaultDevice,
                           "Failed to read default system output device: " +
                               halStatusToString(err),
                           err);
    }
    if (device == kHalUnknownObject) {
        throw CaptureError(CaptureErrorKind::NoDefaultDevice,
                           "No default system output device");
    }
    return device;
}

std::string HardwareDeviceEnumerator::readDeviceUID(HalObjectId device) const {
    std::string uid;
    HalStatus err = hardware_.readDeviceUID(device, uid);
    if (err != kHalNoError) {
        throw CaptureError(CaptureErrorKind::DeviceQuery,
                           "Failed to read UID of device " + std::to_string(device) +
                               ": " + halStatusToString(err),
                           err);
    }
    return uid;
}

uint32_t HardwareDeviceEnumerator::readChannelCount(HalObjectId device) const {
    uint32_t channels = 0;
    HalStatus err = hardware_.readOutputChannelCount(device, channels);
    if (err == kHalUnknownPropertyError) return 0;
    if (err != kHalNoError) {
        throw CaptureError(CaptureErrorKind::DeviceQuery,
                           "Error reading output stream configuration of device " +
                               std::to_string(device) + ": " + halStatusToString(err),
                           err);
    }
    return channels;
}
