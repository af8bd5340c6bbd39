#include "app/CaptureConfig.hpp"
#include "audio/LoudnessMeter.hpp"
#include "audio/SndfileWriter.hpp"
#include "capture/CaptureSession.hpp"
#include "capture/RecordingPaths.hpp"
#include "core/CaptureError.hpp"
#include "core/TaskQueue.hpp"
#include "tap/HardwareDeviceEnumerator.hpp"
#include "tap/TapManager.hpp"
#ifdef __APPLE__
#include "hal/CoreAudioHardware.hpp"
#else
#include "hal/PortAudioHardware.hpp"
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <memory>
#include <optional>

static std::atomic<bool> g_stopRequested{false};

static void signalHandler(int) {
    g_stopRequested = true;
}

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}

static void applyLogLevel(const std::string& level) {
    if (level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (level == "error") spdlog::set_level(spdlog::level::err);
    else                       spdlog::set_level(spdlog::level::info);
}

static void printUsage() {
    spdlog::info("usage: proctap [config.json] [--pid N | --system] [--list-devices]");
}

static int listDevices(IAudioHardware& hardware) {
    HardwareDeviceEnumerator enumerator(hardware);

    HalObjectId defaultDevice = kHalUnknownObject;
    try {
        defaultDevice = enumerator.defaultSystemOutputDevice();
    } catch (const CaptureError& e) {
        spdlog::warn("{}", e.what());
    }

    try {
        for (HalObjectId device : enumerator.listOutputCapableDevices()) {
            std::string uid = enumerator.readDeviceUID(device);
            uint32_t channels = enumerator.readChannelCount(device);
            spdlog::info("{} #{} {} ({} ch)", device == defaultDevice ? "*" : " ",
                         device, uid, channels);
        }
    } catch (const CaptureError& e) {
        spdlog::error("Device query failed: {}", e.what());
        return 1;
    }
    return 0;
}

static std::string meterBar(float level) {
    constexpr int kWidth = 20;
    int filled = static_cast<int>(level * kWidth + 0.5f);
    return std::string(filled, '#') + std::string(kWidth - filled, '.');
}

int main(int argc, char* argv[]) {
    // Load .env file
    loadDotEnv(".env");

    // Setup logging
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "proctap.log", 1048576 * 5, 3);  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "proctap",
        spdlog::sinks_init_list{consoleSink, fileSink});
    spdlog::set_default_logger(logger);

    const std::string envLogLevel = getEnv("PROCTAP_LOG_LEVEL");
    applyLogLevel(envLogLevel);

    spdlog::info("proctap v0.1.0 starting");

    // Command line
    std::string configPath = "config/proctap.json";
    bool explicitConfig = false;
    bool listOnly = false;
    std::optional<int> pidOverride;
    bool systemOverride = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--list-devices") == 0) {
            listOnly = true;
        } else if (std::strcmp(argv[i], "--system") == 0) {
            systemOverride = true;
        } else if (std::strcmp(argv[i], "--pid") == 0 && i + 1 < argc) {
            int pid = std::atoi(argv[++i]);
            if (pid <= 0) {
                spdlog::error("Invalid PID: {}", argv[i]);
                return 1;
            }
            pidOverride = pid;
        } else if (argv[i][0] == '-') {
            spdlog::error("Unknown option: {}", argv[i]);
            printUsage();
            return 1;
        } else {
            configPath = argv[i];
            explicitConfig = true;
        }
    }

    // Load capture config
    CaptureConfig config;
    try {
        if (explicitConfig || std::filesystem::exists(configPath)) {
            config = CaptureConfig::load(configPath);
            spdlog::info("Loaded config: {}", configPath);
        } else {
            spdlog::warn("No config at {}, using defaults", configPath);
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    if (envLogLevel.empty() && !config.logLevel.empty())
        applyLogLevel(config.logLevel);

    if (pidOverride) config.pid = pidOverride;
    if (systemOverride) config.pid.reset();

    // Audio hardware
#ifdef __APPLE__
    CoreAudioHardware::Config halConfig;
    halConfig.framesPerBuffer = config.framesPerBuffer;
    CoreAudioHardware hardware(halConfig);
#else
    PortAudioHardware::Config halConfig;
    halConfig.loopbackDeviceMatch = config.loopbackDevice;
    halConfig.framesPerBuffer     = config.framesPerBuffer;
    PortAudioHardware hardware(halConfig);
    if (!hardware.isInitialized()) return 1;
#endif
    spdlog::info("Audio backend: {}", hardware.backendName());

    if (listOnly) return listDevices(hardware);

    // Capture target
    std::optional<CaptureTarget> target;
    if (config.pid) {
        HalObjectId process = kHalUnknownObject;
        HalStatus err = hardware.translatePidToProcessObject(*config.pid, process);
        if (err != kHalNoError) {
            spdlog::error("PID {} has no audio process object ({})",
                          *config.pid, halStatusToString(err));
            return 1;
        }
        std::string name = config.processName.empty()
            ? "pid-" + std::to_string(*config.pid)
            : config.processName;
        target = CaptureTarget::singleProcess(process, name);
    } else {
        std::vector<HalObjectId> processes;
        HalStatus err = hardware.listProcessObjects(processes);
        if (err != kHalNoError)
            spdlog::warn("Process list unavailable ({})", halStatusToString(err));
        target = CaptureTarget::systemOutputMix(std::move(processes));
    }

    // Setup signal handlers
    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    TaskQueue mainQueue;
    auto tap = std::make_shared<TapManager>(hardware, mainQueue, *target,
                                            config.muteWhenRunning);

    const auto container = config.container;
    const auto sndfile = SndfileWriter::factory();
    AudioFileWriterFactory writerFactory =
        [container, sndfile](const std::filesystem::path& path, const AudioFileSettings& settings) {
            AudioFileSettings s = settings;
            s.container = container;
            return sndfile(path, s);
        };

    const auto fileUrl = makeRecordingPath(config.outputDirectory, tap->displayName(),
                                           std::chrono::system_clock::now(), container);

    CaptureSession session(tap, fileUrl, mainQueue, writerFactory);

    try {
        session.start();
    } catch (const CaptureError& e) {
        spdlog::error("Recording failed ({}): {}", errorKindToString(e.kind()), e.what());
        return 1;
    } catch (const std::logic_error& e) {
        spdlog::error("Recording failed: {}", e.what());
        return 1;
    }

    spdlog::info("Recording {} to {}, press Ctrl+C to stop",
                 session.displayName(), fileUrl.string());

    using Clock = std::chrono::steady_clock;
    const auto startedAt = Clock::now();
    const auto meterInterval = std::chrono::milliseconds(config.meterIntervalMs);
    auto nextMeter = startedAt + meterInterval;

    while (!g_stopRequested && session.isRecording()) {
        mainQueue.waitFor(std::chrono::milliseconds(50));
        mainQueue.drain();

        auto now = Clock::now();
        if (now >= nextMeter) {
            float level = session.currentLoudness();
            spdlog::info("[{}] {:.3f}{}", meterBar(level), level,
                         LoudnessMeter::isHot(level) ? " *" : "");
            nextMeter = now + meterInterval;
        }

        if (config.durationSeconds > 0 &&
            now - startedAt >= std::chrono::seconds(config.durationSeconds)) {
            spdlog::info("Duration limit of {} s reached", config.durationSeconds);
            break;
        }
    }

    const bool lostTap = !session.isRecording();
    session.stop();
    mainQueue.drain();

    spdlog::info("Wrote {} frames to {}", session.framesWritten(), fileUrl.string());
    if (session.failedWrites() > 0)
        spdlog::warn("{} buffers could not be written", session.failedWrites());

    if (lostTap) {
        spdlog::error("Recording ended because the tap was invalidated");
        return 1;
    }

    spdlog::info("proctap exited cleanly");
    return 0;
}
