#pragma once
#include "audio/IAudioFileWriter.hpp"
#include <chrono>
#include <filesystem>
#include <string>

// File name for one recording: "<display name>-<unix seconds>.<ext>".
// Path separators and control characters in the name become '_'.
inline std::filesystem::path makeRecordingPath(
    const std::filesystem::path& directory,
    const std::string& displayName,
    std::chrono::system_clock::time_point now,
    AudioContainer container = AudioContainer::Wav)
{
    std::string name = displayName.empty() ? std::string("Recording") : displayName;
    for (auto& c : name) {
        if (c == '/' || c == '\\' || c == ':' || static_cast<unsigned char>(c) < 0x20)
            c = '_';
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    return directory / (name + "-" + std::to_string(seconds) + "." +
                        containerExtension(container));
}
