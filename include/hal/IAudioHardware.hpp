#pragma once
#include "HalTypes.hpp"
#include <string>
#include <vector>

class SerialQueue;

// Abstract audio hardware layer.
// Implementations: CoreAudioHardware (macOS process taps),
// PortAudioHardware (loopback capture devices on other hosts).
//
// Every call returns kHalNoError or an OS-style failure code and never
// throws. Callers own the objects they create and must destroy them.
class IAudioHardware {
public:
    virtual ~IAudioHardware() = default;

    // Taps
    virtual HalStatus createProcessTap(const TapDescription& description,
                                       HalObjectId& outTap) = 0;
    virtual HalStatus destroyProcessTap(HalObjectId tap) = 0;
    virtual HalStatus readTapFormat(HalObjectId tap, StreamFormat& outFormat) = 0;

    // Devices
    virtual HalStatus listHardwareDevices(std::vector<HalObjectId>& outDevices) = 0;
    virtual HalStatus readDefaultOutputDevice(HalObjectId& outDevice) = 0;
    virtual HalStatus readDeviceUID(HalObjectId device, std::string& outUid) = 0;
    // Total channels over all output streams. Devices without an output
    // stream configuration report kHalUnknownPropertyError.
    virtual HalStatus readOutputChannelCount(HalObjectId device,
                                             uint32_t& outChannels) = 0;

    // Aggregate devices
    virtual HalStatus createAggregateDevice(const AggregateDeviceDescription& description,
                                            HalObjectId& outDevice) = 0;
    virtual HalStatus destroyAggregateDevice(HalObjectId device) = 0;

    // I/O. `block` runs on `queue`, one call per delivered buffer.
    virtual HalStatus createIOProc(HalObjectId device, SerialQueue& queue,
                                   IOBlock block, IOProcId& outProc) = 0;
    virtual HalStatus destroyIOProc(HalObjectId device, IOProcId proc) = 0;
    virtual HalStatus startDevice(HalObjectId device, IOProcId proc) = 0;
    virtual HalStatus stopDevice(HalObjectId device, IOProcId proc) = 0;

    // Liveness notifications
    virtual HalStatus addDeviceDeathListener(HalObjectId device,
                                             DeviceDeathListener listener,
                                             uint64_t& outToken) = 0;
    virtual HalStatus removeDeviceDeathListener(HalObjectId device,
                                                uint64_t token) = 0;

    // Process objects
    virtual HalStatus translatePidToProcessObject(int pid, HalObjectId& outProcess) = 0;
    virtual HalStatus listProcessObjects(std::vector<HalObjectId>& outProcesses) = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
