#pragma once
#include "IAudioHardware.hpp"
#include "IOProcPump.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// PortAudio-based hardware layer for hosts without OS process taps
// (ALSA/PulseAudio/PipeWire/JACK on Linux). Link with -lportaudio.
//
// Mapping onto the tap model:
//   hardware device  -> PortAudio device (id = device index + 1)
//   process tap      -> a loopback capture device, e.g. a PulseAudio
//                       "Monitor of ..." source, or an input device named
//                       after the process for single-process targets
//   aggregate device -> bookkeeping that binds the tap to the outputs
//   I/O proc         -> PortAudio input stream + IOProcPump
//
// A stream that finishes without being stopped is reported to the
// device-death listeners of its aggregate device.

// Forward declare PortAudio types to avoid including portaudio.h in header
typedef void PaStream;

class PortAudioHardware : public IAudioHardware {
public:
    struct Config {
        std::string loopbackDeviceMatch = "monitor";  // case-insensitive substring
        int         framesPerBuffer     = 512;
    };

    explicit PortAudioHardware() : PortAudioHardware(Config{}) {}
    explicit PortAudioHardware(Config config);
    ~PortAudioHardware() override;

    bool isInitialized() const { return paInitialized_; }

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

    std::string backendName() const override { return "PortAudio"; }

    // Shared with the PortAudio C callbacks
    struct IOProcRecord {
        HalObjectId                 device  = kHalUnknownObject;
        PaStream*                   stream  = nullptr;
        std::unique_ptr<IOProcPump> pump;
        bool                        started = false;
        std::atomic<bool>           stopping{false};
    };

private:
    struct TapRecord {
        int          paDevice = -1;
        std::string  uuid;
        StreamFormat format;
    };

    struct AggregateRecord {
        HalObjectId tap = kHalUnknownObject;
        std::string name;
    };

    struct Listener {
        uint64_t            token;
        DeviceDeathListener callback;
    };

    int findCaptureDevice(const TapDescription& description) const;
    IOProcRecord* findProc(HalObjectId device, IOProcId proc);
    void fireDeviceDeath(HalObjectId device);

    Config config_;
    bool   paInitialized_ = false;

    std::mutex                                        mtx_;
    HalObjectId                                       nextObjectId_ = 0x10000;
    IOProcId                                          nextProcId_ = 1;
    uint64_t                                          nextToken_ = 1;
    std::map<HalObjectId, TapRecord>                  taps_;
    std::map<HalObjectId, AggregateRecord>            aggregates_;
    std::map<IOProcId, std::unique_ptr<IOProcRecord>> procs_;
    std::map<HalObjectId, std::vector<Listener>>      listeners_;
};
