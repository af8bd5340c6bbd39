#include "hal/IOProcPump.hpp"
#include "core/SerialQueue.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace {
// Two seconds of audio between the real-time side and the pump
constexpr double kRingSeconds = 2.0;
}

IOProcPump::IOProcPump(uint32_t channels, double sampleRate, uint32_t framesPerChunk,
                       SerialQueue& queue, IOBlock block)
    : ring_(static_cast<size_t>(std::max(sampleRate, 1.0) * kRingSeconds), channels)
    , framesPerChunk_(std::max<uint32_t>(framesPerChunk, 1))
    , sampleRate_(sampleRate)
    , queue_(queue)
    , block_(std::move(block))
    , chunk_(static_cast<size_t>(framesPerChunk_) * ring_.channels())
{
}

IOProcPump::~IOProcPump() {
    stop();
}

void IOProcPump::start() {
    if (running_.exchange(true)) return;
    ring_.reset();
    sourceLost_.store(false);
    thread_ = std::thread(&IOProcPump::pumpLoop, this);
}

void IOProcPump::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
}

void IOProcPump::pumpLoop() {
    const auto chunkDuration = std::chrono::microseconds(
        static_cast<int64_t>(1e6 * framesPerChunk_ / std::max(sampleRate_, 1.0)));
    const auto idle = std::max(chunkDuration / 2, std::chrono::microseconds(500));

    while (running_.load()) {
        if (sourceLost_.exchange(false)) {
            spdlog::warn("Audio source lost on queue '{}'", queue_.label());
            if (onSourceLost) onSourceLost();
            return;
        }

        uint64_t dropped = ring_.takeDroppedFrames();
        if (dropped > 0)
            spdlog::warn("Dropped {} frames: '{}' is not keeping up",
                         dropped, queue_.label());

        if (ring_.availableFrames() < framesPerChunk_) {
            std::this_thread::sleep_for(idle);
            continue;
        }

        deliver(framesPerChunk_);
    }

    // Stopped: hand over the backlog, ending with a partial chunk.
    size_t remaining = ring_.availableFrames();
    if (remaining > 0)
        spdlog::debug("Flushing {} frames to '{}'", remaining, queue_.label());
    while (remaining > 0) {
        size_t frames = deliver(std::min<size_t>(remaining, framesPerChunk_));
        if (frames == 0) break;
        remaining -= std::min(frames, remaining);
    }
}

size_t IOProcPump::deliver(size_t maxFrames) {
    size_t frames = ring_.readFrames(chunk_.data(), maxFrames);
    if (frames == 0) return 0;

    HalBufferList list;
    list.count = 1;
    list.buffers[0].channelCount = ring_.channels();
    list.buffers[0].byteSize =
        static_cast<uint32_t>(frames * ring_.channels() * sizeof(float));
    list.buffers[0].data = chunk_.data();

    HalTimestamp time;
    time.sampleTime = sampleTime_;
    time.hostTime = static_cast<uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
    sampleTime_ += static_cast<double>(frames);

    try {
        queue_.sync([this, &list, &time] { block_(list, time); });
    } catch (const std::exception& e) {
        spdlog::error("I/O block on '{}' threw: {}", queue_.label(), e.what());
    }
    return frames;
}
