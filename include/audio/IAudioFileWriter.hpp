#pragma once
#include "PcmBufferView.hpp"
#include "hal/HalTypes.hpp"
#include <filesystem>
#include <functional>
#include <memory>

enum class AudioContainer { Wav, Caf };

inline const char* containerExtension(AudioContainer c) {
    return c == AudioContainer::Caf ? "caf" : "wav";
}

struct AudioFileSettings {
    double         sampleRate   = 48000;
    uint32_t       channelCount = 2;
    SampleEncoding encoding     = SampleEncoding::Float32;
    bool           interleaved  = true;
    AudioContainer container    = AudioContainer::Wav;

    static AudioFileSettings fromFormat(const StreamFormat& format,
                                        AudioContainer container = AudioContainer::Wav) {
        AudioFileSettings s;
        s.sampleRate   = format.sampleRate;
        s.channelCount = format.channelCount;
        s.encoding     = format.encoding;
        s.interleaved  = format.interleaved;
        s.container    = container;
        return s;
    }
};

// Incremental audio file output, one write per delivered buffer.
// Implementations: SndfileWriter (libsndfile).
class IAudioFileWriter {
public:
    virtual ~IAudioFileWriter() = default;

    // Appends every frame of `buffer`. Throws std::runtime_error on failure
    // or when the file is already closed.
    virtual void write(const PcmBufferView& buffer) = 0;

    // Flushes and closes. Safe to call more than once.
    virtual void close() = 0;

    virtual uint64_t framesWritten() const = 0;
};

// Opens a writer for `path`. Throws std::runtime_error when the file
// cannot be created.
using AudioFileWriterFactory = std::function<std::unique_ptr<IAudioFileWriter>(
    const std::filesystem::path& path, const AudioFileSettings& settings)>;
