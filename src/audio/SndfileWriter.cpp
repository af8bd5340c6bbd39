#include "audio/SndfileWriter.hpp"
#include <sndfile.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

int SndfileWriter::formatFor(const AudioFileSettings& settings) {
    int major = settings.container == AudioContainer::Caf ? SF_FORMAT_CAF : SF_FORMAT_WAV;
    int subtype = SF_FORMAT_FLOAT;
    switch (settings.encoding) {
        case SampleEncoding::Float32: subtype = SF_FORMAT_FLOAT;  break;
        case SampleEncoding::Float64: subtype = SF_FORMAT_DOUBLE; break;
        case SampleEncoding::Int16:   subtype = SF_FORMAT_PCM_16; break;
        case SampleEncoding::Int24:   subtype = SF_FORMAT_PCM_24; break;
        case SampleEncoding::Int32:   subtype = SF_FORMAT_PCM_32; break;
    }
    return major | subtype;
}

SndfileWriter::SndfileWriter(const std::filesystem::path& path,
                             const AudioFileSettings& settings)
    : path_(path), settings_(settings)
{
    SF_INFO info{};
    info.samplerate = static_cast<int>(settings.sampleRate);
    info.channels   = static_cast<int>(settings.channelCount);
    info.format     = formatFor(settings);

    if (!sf_format_check(&info)) {
        throw std::runtime_error("Unsupported audio file format for " + path.string());
    }

    file_ = sf_open(path.string().c_str(), SFM_WRITE, &info);
    if (!file_) {
        throw std::runtime_error("Failed to open " + path.string() + ": " +
                                 sf_strerror(nullptr));
    }

    spdlog::debug("Opened {} ({} ch, {} Hz, format 0x{:x})",
                  path.string(), info.channels, info.samplerate, info.format);
}

SndfileWriter::~SndfileWriter() {
    close();
}

void SndfileWriter::write(const PcmBufferView& buffer) {
    if (!file_)
        throw std::runtime_error("Write to closed file " + path_.string());

    const sf_count_t frames = buffer.frameLength();
    if (frames == 0) return;

    const float* data = buffer.interleavedFloat32();
    if (!data) {
        const size_t samples = static_cast<size_t>(frames) * buffer.channelCount();
        if (scratch_.size() < samples) scratch_.resize(samples);

        for (uint32_t f = 0; f < buffer.frameLength(); f++) {
            for (uint32_t ch = 0; ch < buffer.channelCount(); ch++) {
                scratch_[static_cast<size_t>(f) * buffer.channelCount() + ch] =
                    buffer.sample(ch, f);
            }
        }
        data = scratch_.data();
    }

    sf_count_t written = sf_writef_float(file_, data, frames);
    if (written != frames) {
        throw std::runtime_error("Short write to " + path_.string() + ": " +
                                 sf_strerror(file_));
    }
    framesWritten_ += static_cast<uint64_t>(written);
}

void SndfileWriter::close() {
    if (!file_) return;
    sf_write_sync(file_);
    int err = sf_close(file_);
    file_ = nullptr;
    if (err != 0) {
        spdlog::warn("Closing {} reported: {}", path_.string(), sf_error_number(err));
    }
}

AudioFileWriterFactory SndfileWriter::factory() {
    return [](const std::filesystem::path& path, const AudioFileSettings& settings)
        -> std::unique_ptr<IAudioFileWriter> {
        return std::make_unique<SndfileWriter>(path, settings);
    };
}
