#include "capture/CaptureSession.hpp"
#include "audio/LoudnessMeter.hpp"
#include "audio/PcmBufferView.hpp"
#include "core/CaptureError.hpp"
#include "core/TaskQueue.hpp"
#include "tap/TapManager.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

CaptureSession::CaptureSession(std::weak_ptr<TapManager> tap,
                               std::filesystem::path fileUrl,
                               TaskQueue& mainQueue,
                               AudioFileWriterFactory writerFactory)
    : tap_(std::move(tap))
    , fileUrl_(std::move(fileUrl))
    , mainQueue_(mainQueue)
    , writerFactory_(std::move(writerFactory))
    , log_(spdlog::default_logger()->clone(
          "CaptureSession(" + fileUrl_.filename().string() + ")"))
{
    if (auto t = tap_.lock()) {
        displayName_ = t->displayName();
        iconId_      = t->target().iconId();
    }
}

CaptureSession::~CaptureSession() {
    stop();
}

void CaptureSession::start() {
    log_->debug("start");

    if (recording_) {
        log_->warn("start while already recording");
        return;
    }

    recording_ = true;

    auto tap = tap_.lock();
    if (!tap) {
        recording_ = false;
        throw CaptureError(CaptureErrorKind::TapUnavailable, "Process tap unavailable");
    }

    if (!tap->activated()) tap->activate();

    if (tap->activationFailed()) {
        const std::string message = tap->errorMessage().value_or("Tap activation failed");
        log_->error("Tap activation error: {}", message);
        recording_ = false;
        throw CaptureError(tap->errorKind().value_or(CaptureErrorKind::TapCreation), message);
    }

    const auto& format = tap->streamFormat();
    if (!format) {
        log_->error("Tap stream format not available");
        recording_ = false;
        throw CaptureError(CaptureErrorKind::FormatUnavailable,
                           "Tap stream format not available");
    }

    log_->info("Using audio format: {}", format->describe());
    const AudioFileSettings settings = AudioFileSettings::fromFormat(*format);

    std::error_code ec;
    const auto directory = fileUrl_.parent_path();
    if (!directory.empty()) std::filesystem::create_directories(directory, ec);
    if (ec) {
        log_->error("Failed to create {}: {}", directory.string(), ec.message());
        recording_ = false;
        throw CaptureError(CaptureErrorKind::FileCreation,
                           "Failed to create directory " + directory.string() +
                               ": " + ec.message());
    }

    std::shared_ptr<IAudioFileWriter> file;
    try {
        file = writerFactory_(fileUrl_, settings);
    } catch (const std::exception& e) {
        log_->error("Failed to create audio file for writing: {}", e.what());
        recording_ = false;
        throw CaptureError(CaptureErrorKind::FileCreation,
                           std::string("Failed to create audio file for writing: ") + e.what());
    }

    format_ = *format;
    framesWritten_.store(0, std::memory_order_relaxed);
    failedWrites_.store(0, std::memory_order_relaxed);
    std::atomic_store(&currentFile_, file);

    std::weak_ptr<int> alive = alive_;
    try {
        tap->run(
            queue_,
            [this](const HalBufferList& input, const HalTimestamp&) {
                processBuffer(input);
            },
            [this, alive](TapManager&) {
                if (alive.expired()) return;
                // Through the worker queue first so every buffer queued
                // before the invalidation has been handled.
                queue_.async([this, alive] {
                    mainQueue_.post([this, alive] {
                        if (alive.expired()) return;
                        handleInvalidation();
                    });
                });
            });
    } catch (const std::exception& e) {
        log_->error("Failed to run tap: {}", e.what());
        recording_ = false;
        std::atomic_store(&currentFile_, std::shared_ptr<IAudioFileWriter>());
        file->close();
        throw;
    }

    log_->info("Recording started");
    notifyChange();
}

void CaptureSession::stop() {
    log_->debug("stop");
    if (!recording_) return;

    currentLoudness_ = 0.0f;
    recording_ = false;

    auto tap = tap_.lock();
    if (!tap) {
        log_->warn("Tap unavailable during stop, cleaning up recorder state");
        std::atomic_store(&currentFile_, std::shared_ptr<IAudioFileWriter>());
        notifyChange();
        return;
    }

    tap->invalidate();
    closeFile();
    notifyChange();
}

void CaptureSession::processBuffer(const HalBufferList& input) {
    auto file = std::atomic_load(&currentFile_);
    if (!file) {
        publishLoudness(0.0f);
        return;
    }

    PcmBufferView buffer;
    if (!PcmBufferView::wrap(format_, input, buffer)) {
        log_->error("Failed to create PCM buffer from delivered audio");
        publishLoudness(0.0f);
        return;
    }

    float level = LoudnessMeter::level(buffer);

    if (buffer.frameLength() == 0)
        log_->warn("Received zero frames");

    try {
        file->write(buffer);
        framesWritten_.fetch_add(buffer.frameLength(), std::memory_order_relaxed);
    } catch (const std::exception& e) {
        log_->error("Buffer write error: {}", e.what());
        failedWrites_.fetch_add(1, std::memory_order_relaxed);
        level = 0.0f;
    }

    publishLoudness(level);
}

void CaptureSession::publishLoudness(float level) {
    pendingLoudness_.store(level, std::memory_order_relaxed);
    if (loudnessPublishPending_.exchange(true)) return;

    std::weak_ptr<int> alive = alive_;
    mainQueue_.post([this, alive] {
        if (alive.expired()) return;
        loudnessPublishPending_.store(false);
        applyLoudness(pendingLoudness_.load(std::memory_order_relaxed));
    });
}

void CaptureSession::applyLoudness(float level) {
    if (!recording_) level = 0.0f;
    if (level == currentLoudness_) return;
    currentLoudness_ = level;
    notifyChange();
}

void CaptureSession::handleInvalidation() {
    log_->debug("Handling tap invalidation");
    if (!recording_) return;

    log_->info("Tap invalidated while recording, stopping recording");
    closeFile();
    recording_ = false;
    currentLoudness_ = 0.0f;
    notifyChange();
}

void CaptureSession::closeFile() {
    auto file = std::atomic_exchange(&currentFile_, std::shared_ptr<IAudioFileWriter>());
    if (!file) return;
    file->close();
    log_->info("Closed {} ({} frames)", fileUrl_.string(), file->framesWritten());
}

void CaptureSession::notifyChange() {
    if (onChange) onChange();
}
