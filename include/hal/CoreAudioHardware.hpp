#pragma once
#include "IAudioHardware.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

// macOS hardware layer over the CoreAudio HAL process-tap API (14.2+).
// Implemented in Objective-C++ (CoreAudioHardware.mm); this header stays
// plain C++ so the rest of the project never sees CoreAudio headers.
//
// Status codes are the HAL's own OSStatus values.
class CoreAudioHardware : public IAudioHardware {
public:
    struct Config {
        int framesPerBuffer = 512;  // pump chunk size
    };

    explicit CoreAudioHardware() : CoreAudioHardware(Config{}) {}
    explicit CoreAudioHardware(Config config);
    ~CoreAudioHardware() override;

    HalStatus createProcessTap(const TapDescription& description, HalObjectId& outTap) override;
    HalStatus destroyProcessTap(HalObjectId tap) override;
    HalStatus readTapFormat(HalObjectId tap, StreamFormat& outFormat) override;

    HalStatus listHardwareDevices(std::vector<HalObjectId>& outDevices) override;
    HalStatus readDefaultOutputDevice(HalObjectId& outDevice) override;
    HalStatus readDeviceUID(HalObjectId device, std::string& outUid) override;
    HalStatus readOutputChannelCount(HalObjectId device, uint32_t& outChannels) override;

    HalStatus createAggregateDevice(const AggregateDeviceDescription& description,
                                    HalObjectId& outDevice) override;
    HalStatus destroyAggregateDevice(HalObjectId device) override;

    HalStatus createIOProc(HalObjectId device, SerialQueue& queue,
                           IOBlock block, IOProcId& outProc) override;
    HalStatus destroyIOProc(HalObjectId device, IOProcId proc) override;
    HalStatus startDevice(HalObjectId device, IOProcId proc) override;
    HalStatus stopDevice(HalObjectId device, IOProcId proc) override;

    HalStatus addDeviceDeathListener(HalObjectId device, DeviceDeathListener listener,
                                     uint64_t& outToken) override;
    HalStatus removeDeviceDeathListener(HalObjectId device, uint64_t token) override;

    HalStatus translatePidToProcessObject(int pid, HalObjectId& outProcess) override;
    HalStatus listProcessObjects(std::vector<HalObjectId>& outProcesses) override;

    std::string backendName() const override { return "CoreAudio"; }

    struct IOProcRecord;
    struct ListenerRecord;

private:
    IOProcRecord* findProc(HalObjectId device, IOProcId proc);

    Config     config_;
    std::mutex mtx_;
    IOProcId   nextProcId_ = 1;
    uint64_t   nextToken_  = 1;
    std::map<std::string, HalObjectId>                  tapsByUuid_;
    std::map<HalObjectId, HalObjectId>                  aggregateTaps_;
    std::map<IOProcId, std::unique_ptr<IOProcRecord>>   procs_;
    std::map<uint64_t, std::unique_ptr<ListenerRecord>> listeners_;
};
