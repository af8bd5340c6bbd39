#include "hal/PortAudioHardware.hpp"
#include "core/SerialQueue.hpp"
#include <portaudio.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool nameContains(const char* name, const std::string& needle) {
    if (!name || needle.empty()) return false;
    return toLower(name).find(toLower(needle)) != std::string::npos;
}

const PaDeviceInfo* deviceInfo(HalObjectId device) {
    if (device == kHalUnknownObject) return nullptr;
    int index = static_cast<int>(device) - 1;
    if (index >= Pa_GetDeviceCount()) return nullptr;
    return Pa_GetDeviceInfo(index);
}

// PortAudio stream callback (real-time thread): copy into the pump's ring.
int paCallback(const void* input, void* /*output*/,
               unsigned long frameCount,
               const PaStreamCallbackTimeInfo* /*timeInfo*/,
               PaStreamCallbackFlags /*statusFlags*/,
               void* userData)
{
    auto* record = static_cast<PortAudioHardware::IOProcRecord*>(userData);
    if (input && record->pump)
        record->pump->push(static_cast<const float*>(input),
                           static_cast<uint32_t>(frameCount));
    return paContinue;
}

// Fires when the stream stops for any reason, including device loss.
void paFinished(void* userData) {
    auto* record = static_cast<PortAudioHardware::IOProcRecord*>(userData);
    if (!record->stopping.load() && record->pump)
        record->pump->markSourceLost();
}

} // namespace

PortAudioHardware::PortAudioHardware(Config config)
    : config_(std::move(config))
{
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        paInitialized_ = true;
    } else {
        spdlog::error("PortAudio init failed: {}", Pa_GetErrorText(err));
    }
}

PortAudioHardware::~PortAudioHardware() {
    for (auto& [id, record] : procs_) {
        record->stopping = true;
        if (record->stream) Pa_AbortStream(record->stream);
        if (record->pump) record->pump->stop();
        if (record->stream) Pa_CloseStream(record->stream);
    }
    procs_.clear();

    if (paInitialized_)
        Pa_Terminate();
}

// ── Taps ─────────────────────────────────────────────────────────────────

int PortAudioHardware::findCaptureDevice(const TapDescription& description) const {
    const std::string& needle = description.exclusive
        ? config_.loopbackDeviceMatch
        : description.name;

    int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0 && nameContains(info->name, needle))
            return i;
    }
    return paNoDevice;
}

HalStatus PortAudioHardware::createProcessTap(const TapDescription& description,
                                              HalObjectId& outTap) {
    if (!paInitialized_) return kHalIllegalOperationError;

    int paDevice = findCaptureDevice(description);
    if (paDevice == paNoDevice) {
        if (description.exclusive)
            spdlog::warn("No capture device matching '{}'; enable a monitor/loopback source",
                         config_.loopbackDeviceMatch);
        else
            spdlog::warn("No capture device exposes process '{}'", description.name);
        return kHalUnsupportedError;
    }

    if (description.muteBehavior != MuteBehavior::Unmuted)
        spdlog::warn("PortAudio taps cannot mute the tapped process; ignoring");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(paDevice);

    TapRecord record;
    record.paDevice = paDevice;
    record.uuid     = description.uuid;
    record.format.sampleRate   = info->defaultSampleRate;
    record.format.channelCount = static_cast<uint32_t>(std::min(info->maxInputChannels, 2));
    record.format.encoding     = SampleEncoding::Float32;
    record.format.interleaved  = true;

    std::lock_guard lock(mtx_);
    outTap = nextObjectId_++;
    taps_[outTap] = record;

    spdlog::info("Tap #{} reads '{}' ({})", outTap, info->name, record.format.describe());
    return kHalNoError;
}

HalStatus PortAudioHardware::destroyProcessTap(HalObjectId tap) {
    std::lock_guard lock(mtx_);
    return taps_.erase(tap) ? kHalNoError : kHalBadObjectError;
}

HalStatus PortAudioHardware::readTapFormat(HalObjectId tap, StreamFormat& outFormat) {
    std::lock_guard lock(mtx_);
    auto it = taps_.find(tap);
    if (it == taps_.end()) return kHalBadObjectError;
    outFormat = it->second.format;
    return kHalNoError;
}

// ── Devices ──────────────────────────────────────────────────────────────

HalStatus PortAudioHardware::listHardwareDevices(std::vector<HalObjectId>& outDevices) {
    if (!paInitialized_) return kHalIllegalOperationError;

    int count = Pa_GetDeviceCount();
    if (count < 0) return count;  // PaError

    outDevices.clear();
    for (int i = 0; i < count; i++)
        outDevices.push_back(static_cast<HalObjectId>(i + 1));
    return kHalNoError;
}

HalStatus PortAudioHardware::readDefaultOutputDevice(HalObjectId& outDevice) {
    if (!paInitialized_) return kHalIllegalOperationError;

    PaDeviceIndex index = Pa_GetDefaultOutputDevice();
    if (index == paNoDevice) return kHalBadObjectError;
    outDevice = static_cast<HalObjectId>(index + 1);
    return kHalNoError;
}

HalStatus PortAudioHardware::readDeviceUID(HalObjectId device, std::string& outUid) {
    const PaDeviceInfo* info = deviceInfo(device);
    if (!info) return kHalBadObjectError;

    const PaHostApiInfo* host = Pa_GetHostApiInfo(info->hostApi);
    outUid = std::string(host ? host->name : "unknown") + ":" + info->name;
    return kHalNoError;
}

HalStatus PortAudioHardware::readOutputChannelCount(HalObjectId device, uint32_t& outChannels) {
    const PaDeviceInfo* info = deviceInfo(device);
    if (!info) return kHalBadObjectError;
    outChannels = static_cast<uint32_t>(std::max(info->maxOutputChannels, 0));
    return kHalNoError;
}

// ── Aggregate devices ────────────────────────────────────────────────────

HalStatus PortAudioHardware::createAggregateDevice(const AggregateDeviceDescription& description,
                                                   HalObjectId& outDevice) {
    if (description.taps.empty() || description.subDeviceUids.empty())
        return kHalIllegalOperationError;

    std::lock_guard lock(mtx_);
    auto tap = std::find_if(taps_.begin(), taps_.end(), [&](const auto& entry) {
        return entry.second.uuid == description.taps.front().uid;
    });
    if (tap == taps_.end()) return kHalBadObjectError;

    outDevice = nextObjectId_++;
    aggregates_[outDevice] = AggregateRecord{tap->first, description.name};

    spdlog::debug("Aggregate '{}' #{} hosts tap #{} over {} outputs (main {})",
                  description.name, outDevice, tap->first,
                  description.subDeviceUids.size(), description.mainSubDeviceUid);
    return kHalNoError;
}

HalStatus PortAudioHardware::destroyAggregateDevice(HalObjectId device) {
    std::lock_guard lock(mtx_);
    for (const auto& [id, record] : procs_) {
        if (record->device == device) return kHalIllegalOperationError;
    }
    listeners_.erase(device);
    return aggregates_.erase(device) ? kHalNoError : kHalBadObjectError;
}

// ── I/O ──────────────────────────────────────────────────────────────────

HalStatus PortAudioHardware::createIOProc(HalObjectId device, SerialQueue& queue,
                                          IOBlock block, IOProcId& outProc) {
    TapRecord tap;
    {
        std::lock_guard lock(mtx_);
        auto agg = aggregates_.find(device);
        if (agg == aggregates_.end()) return kHalBadObjectError;
        auto t = taps_.find(agg->second.tap);
        if (t == taps_.end()) return kHalBadObjectError;
        tap = t->second;
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(tap.paDevice);
    if (!info) return kHalBadObjectError;

    auto record = std::make_unique<IOProcRecord>();
    record->device = device;
    record->pump = std::make_unique<IOProcPump>(
        tap.format.channelCount, tap.format.sampleRate,
        static_cast<uint32_t>(config_.framesPerBuffer), queue, std::move(block));
    record->pump->onSourceLost = [this, device] { fireDeviceDeath(device); };

    PaStreamParameters inputParams;
    inputParams.device = tap.paDevice;
    inputParams.channelCount = static_cast<int>(tap.format.channelCount);
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = info->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(
        &record->stream,
        &inputParams,
        nullptr,  // no output
        tap.format.sampleRate,
        static_cast<unsigned long>(config_.framesPerBuffer),
        paClipOff,
        &paCallback,
        record.get());
    if (err != paNoError) {
        spdlog::error("Pa_OpenStream failed: {}", Pa_GetErrorText(err));
        return err;
    }

    err = Pa_SetStreamFinishedCallback(record->stream, &paFinished);
    if (err != paNoError)
        spdlog::warn("Stream loss will go unnoticed: {}", Pa_GetErrorText(err));

    std::lock_guard lock(mtx_);
    outProc = nextProcId_++;
    procs_[outProc] = std::move(record);
    return kHalNoError;
}

PortAudioHardware::IOProcRecord* PortAudioHardware::findProc(HalObjectId device, IOProcId proc) {
    std::lock_guard lock(mtx_);
    auto it = procs_.find(proc);
    if (it == procs_.end() || it->second->device != device) return nullptr;
    return it->second.get();
}

HalStatus PortAudioHardware::startDevice(HalObjectId device, IOProcId proc) {
    IOProcRecord* record = findProc(device, proc);
    if (!record) return kHalBadObjectError;
    if (record->started) return kHalNoError;

    record->stopping = false;
    record->pump->start();
    PaError err = Pa_StartStream(record->stream);
    if (err != paNoError) {
        spdlog::error("Pa_StartStream failed: {}", Pa_GetErrorText(err));
        record->stopping = true;
        record->pump->stop();
        return err;
    }
    record->started = true;
    spdlog::info("Audio capture started");
    return kHalNoError;
}

// No lock held while stopping: the pump thread may be reporting a lost
// device, which takes the lock.
HalStatus PortAudioHardware::stopDevice(HalObjectId device, IOProcId proc) {
    IOProcRecord* record = findProc(device, proc);
    if (!record) return kHalBadObjectError;
    if (!record->started) return kHalNoError;

    record->stopping = true;
    PaError err = Pa_StopStream(record->stream);
    record->pump->stop();
    record->started = false;

    if (err != paNoError && err != paStreamIsStopped) {
        spdlog::warn("Pa_StopStream failed: {}", Pa_GetErrorText(err));
        return err;
    }
    spdlog::info("Audio capture stopped");
    return kHalNoError;
}

HalStatus PortAudioHardware::destroyIOProc(HalObjectId device, IOProcId proc) {
    IOProcRecord* record = findProc(device, proc);
    if (!record) return kHalBadObjectError;

    if (record->started) {
        HalStatus err = stopDevice(device, proc);
        if (err != kHalNoError)
            spdlog::warn("Stopping before destroy failed: {}", err);
    }
    record->pump->stop();

    PaError err = Pa_CloseStream(record->stream);
    record->stream = nullptr;

    std::lock_guard lock(mtx_);
    procs_.erase(proc);
    return err == paNoError ? kHalNoError : err;
}

// ── Liveness ─────────────────────────────────────────────────────────────

HalStatus PortAudioHardware::addDeviceDeathListener(HalObjectId device,
                                                    DeviceDeathListener listener,
                                                    uint64_t& outToken) {
    std::lock_guard lock(mtx_);
    if (!aggregates_.count(device)) return kHalBadObjectError;
    outToken = nextToken_++;
    listeners_[device].push_back({outToken, std::move(listener)});
    return kHalNoError;
}

HalStatus PortAudioHardware::removeDeviceDeathListener(HalObjectId device, uint64_t token) {
    std::lock_guard lock(mtx_);
    auto it = listeners_.find(device);
    if (it == listeners_.end()) return kHalBadObjectError;

    auto& list = it->second;
    auto before = list.size();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [token](const Listener& l) { return l.token == token; }),
               list.end());
    return list.size() < before ? kHalNoError : kHalBadObjectError;
}

void PortAudioHardware::fireDeviceDeath(HalObjectId device) {
    std::vector<DeviceDeathListener> callbacks;
    {
        std::lock_guard lock(mtx_);
        auto it = listeners_.find(device);
        if (it == listeners_.end()) return;
        for (auto& l : it->second) callbacks.push_back(l.callback);
    }
    spdlog::warn("Capture stream of device #{} ended unexpectedly", device);
    for (auto& cb : callbacks) cb(device);
}

// ── Processes ────────────────────────────────────────────────────────────

// No process objects here: the PID stands in for one, and taps are
// matched by process name instead.
HalStatus PortAudioHardware::translatePidToProcessObject(int pid, HalObjectId& outProcess) {
    if (pid <= 0) return kHalBadObjectError;
    outProcess = static_cast<HalObjectId>(pid);
    return kHalNoError;
}

HalStatus PortAudioHardware::listProcessObjects(std::vector<HalObjectId>& outProcesses) {
    outProcesses.clear();
    return kHalNoError;
}
