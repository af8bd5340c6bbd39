#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Value types shared by every audio hardware backend.
// Names carry a Hal prefix so they never collide with the CoreAudio C types
// the macOS backend includes.

// Identifier of an object owned by the audio hardware layer
// (device, tap, aggregate device, process object).
using HalObjectId = uint32_t;
constexpr HalObjectId kHalUnknownObject = 0;

// Registered I/O callback on a device.
using IOProcId = uint64_t;
constexpr IOProcId kHalNoIOProc = 0;

// OS-style status: 0 on success, a four-char code otherwise.
using HalStatus = int32_t;
constexpr HalStatus kHalNoError                = 0;
constexpr HalStatus kHalUnspecifiedError       = 0x77686174;  // 'what'
constexpr HalStatus kHalUnknownPropertyError   = 0x77686F3F;  // 'who?'
constexpr HalStatus kHalBadObjectError         = 0x216F626A;  // '!obj'
constexpr HalStatus kHalIllegalOperationError  = 0x6E6F7065;  // 'nope'
constexpr HalStatus kHalUnsupportedError       = 0x756E6F70;  // 'unop'

// Renders a status as 'abcd' when it is a printable four-char code,
// otherwise as a decimal number.
inline std::string halStatusToString(HalStatus status) {
    auto code = static_cast<uint32_t>(status);
    char chars[4] = {
        static_cast<char>((code >> 24) & 0xFF),
        static_cast<char>((code >> 16) & 0xFF),
        static_cast<char>((code >> 8) & 0xFF),
        static_cast<char>(code & 0xFF)
    };
    bool printable = status != 0;
    for (char c : chars) {
        if (c < 0x20 || c > 0x7E) { printable = false; break; }
    }
    if (printable)
        return "'" + std::string(chars, 4) + "'";
    return std::to_string(status);
}

enum class SampleEncoding {
    Float32,
    Float64,
    Int16,
    Int24,   // packed, 3 bytes per sample
    Int32
};

inline uint32_t bytesPerSample(SampleEncoding e) {
    switch (e) {
        case SampleEncoding::Float32: return 4;
        case SampleEncoding::Float64: return 8;
        case SampleEncoding::Int16:   return 2;
        case SampleEncoding::Int24:   return 3;
        case SampleEncoding::Int32:   return 4;
    }
    return 0;
}

inline const char* encodingToString(SampleEncoding e) {
    switch (e) {
        case SampleEncoding::Float32: return "float32";
        case SampleEncoding::Float64: return "float64";
        case SampleEncoding::Int16:   return "int16";
        case SampleEncoding::Int24:   return "int24";
        case SampleEncoding::Int32:   return "int32";
    }
    return "unknown";
}

// Format negotiated with a tap. Immutable for the lifetime of the tap.
struct StreamFormat {
    double         sampleRate   = 0.0;
    uint32_t       channelCount = 0;
    SampleEncoding encoding     = SampleEncoding::Float32;
    bool           interleaved  = true;

    bool isValid() const { return sampleRate > 0.0 && channelCount >= 1; }

    // Bytes of one frame within a single buffer: all channels when
    // interleaved, one channel per buffer otherwise.
    uint32_t bytesPerBufferFrame() const {
        return bytesPerSample(encoding) * (interleaved ? channelCount : 1);
    }

    uint32_t bufferCount() const { return interleaved ? 1 : channelCount; }

    std::string describe() const {
        return std::to_string(channelCount) + " ch, " +
               std::to_string(static_cast<int>(sampleRate)) + " Hz, " +
               encodingToString(encoding) +
               (interleaved ? ", interleaved" : ", non-interleaved");
    }
};

enum class MuteBehavior {
    Unmuted,          // tapped process keeps playing on its device
    MutedWhenTapped,  // silent on its device while the tap is read
    Muted             // silent on its device while the tap exists
};

struct TapDescription {
    std::string              name;
    std::string              uuid;
    std::vector<HalObjectId> processes;
    bool                     exclusive    = false;  // true: everything except `processes`
    MuteBehavior             muteBehavior = MuteBehavior::Unmuted;
    bool                     isPrivate    = true;
};

struct SubTapDescription {
    std::string uid;
    bool        driftCompensation = true;
};

struct AggregateDeviceDescription {
    std::string                    name;
    std::string                    uid;
    std::string                    mainSubDeviceUid;
    bool                           isPrivate    = true;
    bool                           isStacked    = false;
    bool                           tapAutoStart = true;
    std::vector<std::string>       subDeviceUids;
    std::vector<SubTapDescription> taps;
};

// One buffer of a delivery. `data` is only valid during the I/O block.
struct HalBuffer {
    uint32_t    channelCount = 0;
    uint32_t    byteSize     = 0;
    const void* data         = nullptr;
};

constexpr uint32_t kHalMaxBuffers = 32;

// Fixed capacity so the real-time side never allocates.
struct HalBufferList {
    uint32_t                              count = 0;
    std::array<HalBuffer, kHalMaxBuffers> buffers{};
};

struct HalTimestamp {
    double   sampleTime = 0.0;
    uint64_t hostTime   = 0;
};

using IOBlock = std::function<void(const HalBufferList& input,
                                   const HalTimestamp& time)>;

// Called from an arbitrary backend thread when a device stops being usable.
using DeviceDeathListener = std::function<void(HalObjectId device)>;
