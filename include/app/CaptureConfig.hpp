#pragma once
#include "audio/IAudioFileWriter.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

// Settings of the proctap CLI, read from config/proctap.json.
// Missing keys keep their defaults; keys with the wrong type are logged
// and keep their defaults too.
struct CaptureConfig {
    std::filesystem::path outputDirectory = "recordings";
    std::optional<int>    pid;                 // nullopt: system output mix
    std::string           processName;         // display name for a PID target
    bool                  muteWhenRunning  = false;
    int                   durationSeconds  = 0;   // 0 = until interrupted
    AudioContainer        container        = AudioContainer::Wav;
    std::string           loopbackDevice   = "monitor";
    int                   framesPerBuffer  = 512;
    std::string           logLevel;            // empty: PROCTAP_LOG_LEVEL or info
    int                   meterIntervalMs  = 500;

    bool isSystemTarget() const { return !pid.has_value(); }

    static CaptureConfig fromJson(const nlohmann::json& j);

    // Throws std::runtime_error when the file cannot be opened or parsed.
    static CaptureConfig load(const std::filesystem::path& path);
};
