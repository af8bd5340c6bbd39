#pragma once
#include "IAudioFileWriter.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// Forward declare libsndfile's handle to keep sndfile.h out of the header
typedef struct sf_private_tag SNDFILE;

// libsndfile-backed writer. The file subtype mirrors the tap encoding.
class SndfileWriter : public IAudioFileWriter {
public:
    // Throws std::runtime_error with libsndfile's message on failure.
    SndfileWriter(const std::filesystem::path& path, const AudioFileSettings& settings);
    ~SndfileWriter() override;

    SndfileWriter(const SndfileWriter&) = delete;
    SndfileWriter& operator=(const SndfileWriter&) = delete;

    void write(const PcmBufferView& buffer) override;
    void close() override;
    uint64_t framesWritten() const override { return framesWritten_; }

    const std::filesystem::path& path() const { return path_; }

    static AudioFileWriterFactory factory();

    // libsndfile SF_FORMAT_* value for these settings (major | subtype).
    static int formatFor(const AudioFileSettings& settings);

private:
    std::filesystem::path path_;
    AudioFileSettings     settings_;
    SNDFILE*              file_ = nullptr;
    uint64_t              framesWritten_ = 0;
    std::vector<float>    scratch_;  // interleaving/conversion, only grows
};
