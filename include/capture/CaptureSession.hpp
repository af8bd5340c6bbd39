#pragma once
#include "audio/IAudioFileWriter.hpp"
#include "core/SerialQueue.hpp"
#include "hal/HalTypes.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace spdlog { class logger; }
class TapManager;
class TaskQueue;

// Records the audio of one TapManager into one file.
//
// State machine: Idle -> start() -> Recording -> stop() -> Idle, and
// Recording -> Idle when the tap is invalidated underneath the session.
//
// The session does not own its TapManager: it holds a weak_ptr, and every
// access handles the manager being gone. start()/stop() and all observable
// state belong to the coordinating TaskQueue's thread; audio buffers are
// processed on the session's own SerialQueue.
class CaptureSession {
public:
    CaptureSession(std::weak_ptr<TapManager> tap,
                   std::filesystem::path fileUrl,
                   TaskQueue& mainQueue,
                   AudioFileWriterFactory writerFactory);
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    // Throws CaptureError (or std::logic_error from a misused tap) and
    // returns to Idle on any failure. No-op while already recording.
    void start();

    // No-op unless recording.
    void stop();

    // Observable state
    bool isRecording() const { return recording_; }
    float currentLoudness() const { return currentLoudness_; }
    const std::filesystem::path& fileUrl() const { return fileUrl_; }
    const std::string& displayName() const { return displayName_; }
    const std::string& iconId() const { return iconId_; }
    uint64_t framesWritten() const { return framesWritten_.load(std::memory_order_relaxed); }
    uint64_t failedWrites() const { return failedWrites_.load(std::memory_order_relaxed); }

    // Fired on the coordinating thread after an observable change.
    std::function<void()> onChange;

private:
    // Worker queue
    void processBuffer(const HalBufferList& input);
    void publishLoudness(float level);

    // Coordinating thread
    void applyLoudness(float level);
    void handleInvalidation();
    void closeFile();
    void notifyChange();

    std::weak_ptr<TapManager>       tap_;
    std::filesystem::path           fileUrl_;
    TaskQueue&                      mainQueue_;
    AudioFileWriterFactory          writerFactory_;
    std::string                     displayName_;
    std::string                     iconId_;
    std::shared_ptr<spdlog::logger> log_;

    bool                            recording_ = false;
    float                           currentLoudness_ = 0.0f;
    StreamFormat                    format_;

    // Written by the coordinating thread, read by the worker queue.
    std::shared_ptr<IAudioFileWriter> currentFile_;

    std::atomic<float>              pendingLoudness_{0.0f};
    std::atomic<bool>               loudnessPublishPending_{false};
    std::atomic<uint64_t>           framesWritten_{0};
    std::atomic<uint64_t>           failedWrites_{0};

    std::shared_ptr<int>            alive_ = std::make_shared<int>(0);

    // Last member: destroyed first, so queued work finishes while the
    // rest of the session is still intact.
    SerialQueue                     queue_{"CaptureSession"};
};
