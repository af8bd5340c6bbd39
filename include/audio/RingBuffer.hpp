#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <vector>

// Lock-free single-producer single-consumer ring buffer of interleaved
// float frames.
// Producer: backend real-time callback (no allocs, no locks).
// Consumer: the I/O proc pump thread.
class RingBuffer {
public:
    RingBuffer(size_t capacityFrames, uint32_t channels)
        : channels_(std::max<uint32_t>(channels, 1))
        , capacity_(std::max<size_t>(capacityFrames, 1) * channels_)
        , buf_(capacity_) {}

    uint32_t channels() const { return channels_; }
    size_t capacityFrames() const { return capacity_ / channels_; }

    // Producer: append interleaved frames. Frames that do not fit are
    // dropped and counted. Returns frames written.
    size_t writeFrames(const float* interleaved, size_t frames) {
        size_t written = writeSamples(interleaved, frames * channels_) / channels_;
        if (written < frames)
            dropped_.fetch_add(frames - written, std::memory_order_relaxed);
        return written;
    }

    // Producer: append planar channel data, interleaving on the way in.
    size_t writePlanar(const float* const* planes, size_t frames) {
        size_t wr = writePos_.load(std::memory_order_relaxed);
        size_t rd = readPos_.load(std::memory_order_acquire);

        size_t freeFrames = (capacity_ - (wr - rd)) / channels_;
        size_t toWrite = std::min(frames, freeFrames);

        for (size_t f = 0; f < toWrite; f++) {
            for (uint32_t ch = 0; ch < channels_; ch++) {
                buf_[(wr + f * channels_ + ch) % capacity_] = planes[ch][f];
            }
        }

        writePos_.store(wr + toWrite * channels_, std::memory_order_release);
        if (toWrite < frames)
            dropped_.fetch_add(frames - toWrite, std::memory_order_relaxed);
        return toWrite;
    }

    // Consumer: read up to `frames` interleaved frames into `out`.
    size_t readFrames(float* out, size_t frames) {
        return readSamples(out, frames * channels_) / channels_;
    }

    size_t availableFrames() const {
        return (writePos_.load(std::memory_order_acquire)
              - readPos_.load(std::memory_order_relaxed)) / channels_;
    }

    // Frames lost to overflow since the last call.
    uint64_t takeDroppedFrames() {
        return dropped_.exchange(0, std::memory_order_relaxed);
    }

    void reset() {
        writePos_.store(0, std::memory_order_relaxed);
        readPos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    // Whole frames only, so the two positions stay frame-aligned.
    size_t writeSamples(const float* data, size_t count) {
        size_t wr = writePos_.load(std::memory_order_relaxed);
        size_t rd = readPos_.load(std::memory_order_acquire);

        size_t available = capacity_ - (wr - rd);
        size_t toWrite = std::min(count, available);
        toWrite -= toWrite % channels_;
        if (toWrite == 0) return 0;

        size_t wrIdx = wr % capacity_;
        size_t firstChunk = std::min(toWrite, capacity_ - wrIdx);
        std::memcpy(&buf_[wrIdx], data, firstChunk * sizeof(float));

        if (toWrite > firstChunk) {
            std::memcpy(&buf_[0], data + firstChunk,
                        (toWrite - firstChunk) * sizeof(float));
        }

        writePos_.store(wr + toWrite, std::memory_order_release);
        return toWrite;
    }

    size_t readSamples(float* out, size_t count) {
        size_t rd = readPos_.load(std::memory_order_relaxed);
        size_t wr = writePos_.load(std::memory_order_acquire);

        size_t available = wr - rd;
        size_t toRead = std::min(count, available);
        toRead -= toRead % channels_;
        if (toRead == 0) return 0;

        size_t rdIdx = rd % capacity_;
        size_t firstChunk = std::min(toRead, capacity_ - rdIdx);
        std::memcpy(out, &buf_[rdIdx], firstChunk * sizeof(float));

        if (toRead > firstChunk) {
            std::memcpy(out + firstChunk, &buf_[0],
                        (toRead - firstChunk) * sizeof(float));
        }

        readPos_.store(rd + toRead, std::memory_order_release);
        return toRead;
    }

    uint32_t              channels_;
    size_t                capacity_;  // in samples, a multiple of channels_
    std::vector<float>    buf_;
    std::atomic<size_t>   writePos_{0};
    std::atomic<size_t>   readPos_{0};
    std::atomic<uint64_t> dropped_{0};
};
