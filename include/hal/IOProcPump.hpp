#pragma once
#include "HalTypes.hpp"
#include "audio/RingBuffer.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

class SerialQueue;

// Moves audio from a backend's real-time callback to a SerialQueue.
//
//   backend real-time callback
//       -> push()/pushPlanar() into a RingBuffer (no locks, no allocs)
//           -> pump thread reads fixed-size chunks
//               -> IOBlock runs on the session queue (synchronously)
//
// Running the block synchronously lets the pump reuse one chunk buffer;
// if the queue falls behind, the ring fills and the real-time side drops
// frames instead of blocking.
class IOProcPump {
public:
    // Delivered buffers are interleaved float32 with `channels` channels.
    IOProcPump(uint32_t channels, double sampleRate, uint32_t framesPerChunk,
               SerialQueue& queue, IOBlock block);
    ~IOProcPump();

    IOProcPump(const IOProcPump&) = delete;
    IOProcPump& operator=(const IOProcPump&) = delete;

    void start();
    // Delivers whatever is still buffered, including a final partial
    // chunk, then joins the pump thread. Stop the backend's callback
    // first. After return the block is never called again.
    void stop();
    bool isRunning() const { return running_.load(); }

    // Real-time side
    void push(const float* interleaved, uint32_t frames) { ring_.writeFrames(interleaved, frames); }
    void pushPlanar(const float* const* planes, uint32_t frames) { ring_.writePlanar(planes, frames); }

    // Real-time safe. The pump calls `onSourceLost` once, from its own
    // thread, and stops delivering.
    void markSourceLost() { sourceLost_.store(true); }
    std::function<void()> onSourceLost;

    uint32_t channels() const { return ring_.channels(); }

private:
    void pumpLoop();
    // Reads up to `maxFrames` and runs the block on them. Returns frames read.
    size_t deliver(size_t maxFrames);

    RingBuffer         ring_;
    uint32_t           framesPerChunk_;
    double             sampleRate_;
    SerialQueue&       queue_;
    IOBlock            block_;
    std::vector<float> chunk_;
    double             sampleTime_ = 0.0;

    std::atomic<bool>  running_{false};
    std::atomic<bool>  sourceLost_{false};
    std::thread        thread_;
};
