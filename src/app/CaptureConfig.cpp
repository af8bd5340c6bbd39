#include "app/CaptureConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace {

template <typename T>
bool hasType(const nlohmann::json& v);

template <> bool hasType<bool>(const nlohmann::json& v)        { return v.is_boolean(); }
template <> bool hasType<int>(const nlohmann::json& v)         { return v.is_number_integer(); }
template <> bool hasType<std::string>(const nlohmann::json& v) { return v.is_string(); }

template <typename T>
T readKey(const nlohmann::json& j, const char* key, const T& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (!hasType<T>(*it)) {
        spdlog::warn("Config key '{}' has the wrong type ({}), using default",
                     key, it->type_name());
        return fallback;
    }
    return it->template get<T>();
}

} // namespace

CaptureConfig CaptureConfig::fromJson(const nlohmann::json& j) {
    CaptureConfig c;
    if (!j.is_object()) {
        spdlog::warn("Config root is not an object, using defaults");
        return c;
    }

    c.outputDirectory = readKey<std::string>(j, "output_directory", c.outputDirectory.string());
    c.processName     = readKey(j, "process_name", c.processName);
    c.muteWhenRunning = readKey(j, "mute_when_running", c.muteWhenRunning);
    c.durationSeconds = std::max(0, readKey(j, "duration_seconds", c.durationSeconds));
    c.loopbackDevice  = readKey(j, "loopback_device", c.loopbackDevice);
    c.framesPerBuffer = readKey(j, "frames_per_buffer", c.framesPerBuffer);
    c.logLevel        = readKey(j, "log_level", c.logLevel);
    c.meterIntervalMs = readKey(j, "meter_interval_ms", c.meterIntervalMs);

    if (c.framesPerBuffer <= 0) {
        spdlog::warn("frames_per_buffer must be positive, using 512");
        c.framesPerBuffer = 512;
    }
    if (c.meterIntervalMs <= 0) {
        spdlog::warn("meter_interval_ms must be positive, using 500");
        c.meterIntervalMs = 500;
    }

    // "target": "system" or a PID
    if (auto it = j.find("target"); it != j.end() && !it->is_null()) {
        if (it->is_number_integer() && it->get<int>() > 0) {
            c.pid = it->get<int>();
        } else if (!(it->is_string() && it->get<std::string>() == "system")) {
            spdlog::warn("Config key 'target' must be \"system\" or a PID, using system");
        }
    }

    std::string container = readKey<std::string>(j, "container", "wav");
    if (container == "caf")
        c.container = AudioContainer::Caf;
    else if (container != "wav")
        spdlog::warn("Unknown container '{}', using wav", container);

    return c;
}

CaptureConfig CaptureConfig::load(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open config file: " + path.string());

    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error("Invalid JSON in config file: " + path.string());

    return fromJson(j);
}
