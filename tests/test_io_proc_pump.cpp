#include <gtest/gtest.h>
#include "core/SerialQueue.hpp"
#include "hal/IOProcPump.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

struct Collector {
    std::mutex         mtx;
    std::vector<float> samples;
    std::atomic<int>   blocks{0};
    bool               onQueue = true;
};

} // namespace

TEST(IOProcPumpTest, DeliversInterleavedChunksOnQueue) {
    SerialQueue queue("pump-test");
    Collector c;

    IOProcPump pump(2, 48000.0, 64, queue,
        [&](const HalBufferList& list, const HalTimestamp&) {
            std::lock_guard lock(c.mtx);
            if (!queue.isCurrent()) c.onQueue = false;
            EXPECT_EQ(list.count, 1u);
            EXPECT_EQ(list.buffers[0].channelCount, 2u);
            auto* data = static_cast<const float*>(list.buffers[0].data);
            c.samples.insert(c.samples.end(), data,
                             data + list.buffers[0].byteSize / sizeof(float));
            c.blocks++;
        });
    pump.start();

    std::vector<float> input(256 * 2);
    for (size_t i = 0; i < input.size(); i++) input[i] = static_cast<float>(i);
    pump.push(input.data(), 256);

    ASSERT_TRUE(waitUntil([&] { return c.blocks.load() >= 4; }));
    pump.stop();

    std::lock_guard lock(c.mtx);
    EXPECT_TRUE(c.onQueue);
    ASSERT_EQ(c.samples.size(), input.size());
    EXPECT_EQ(c.samples, input);
}

TEST(IOProcPumpTest, PlanarInputArrivesInterleaved) {
    SerialQueue queue("pump-planar");
    Collector c;

    IOProcPump pump(2, 48000.0, 32, queue,
        [&](const HalBufferList& list, const HalTimestamp&) {
            std::lock_guard lock(c.mtx);
            auto* data = static_cast<const float*>(list.buffers[0].data);
            c.samples.insert(c.samples.end(), data,
                             data + list.buffers[0].byteSize / sizeof(float));
            c.blocks++;
        });
    pump.start();

    std::vector<float> left(32, 1.0f), right(32, -1.0f);
    const float* planes[] = {left.data(), right.data()};
    pump.pushPlanar(planes, 32);

    ASSERT_TRUE(waitUntil([&] { return c.blocks.load() >= 1; }));
    pump.stop();

    std::lock_guard lock(c.mtx);
    ASSERT_EQ(c.samples.size(), 64u);
    EXPECT_FLOAT_EQ(c.samples[0], 1.0f);
    EXPECT_FLOAT_EQ(c.samples[1], -1.0f);
}

TEST(IOProcPumpTest, StopFlushesEveryPushedFrame) {
    SerialQueue queue("pump-flush");
    std::atomic<size_t> frames{0};
    std::atomic<int>    blocks{0};
    std::atomic<size_t> lastBlock{0};

    IOProcPump pump(1, 48000.0, 512, queue,
        [&](const HalBufferList& list, const HalTimestamp&) {
            size_t n = list.buffers[0].byteSize / sizeof(float);
            frames += n;
            lastBlock = n;
            blocks++;
        });
    pump.start();

    std::vector<float> input(1000, 0.5f);
    pump.push(input.data(), 1000);

    // Only whole chunks go out while running
    ASSERT_TRUE(waitUntil([&] { return blocks.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(frames.load(), 512u);

    pump.stop();
    EXPECT_EQ(frames.load(), 1000u);
    EXPECT_EQ(blocks.load(), 2);
    EXPECT_EQ(lastBlock.load(), 488u);
}

TEST(IOProcPumpTest, StopFlushesBacklogOfSlowQueue) {
    SerialQueue queue("pump-backlog");
    std::atomic<size_t> frames{0};

    IOProcPump pump(2, 48000.0, 64, queue,
        [&](const HalBufferList& list, const HalTimestamp&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            frames += list.buffers[0].byteSize / (2 * sizeof(float));
        });
    pump.start();

    std::vector<float> input(4000 * 2, 0.1f);
    pump.push(input.data(), 4000);
    pump.stop();

    EXPECT_EQ(frames.load(), 4000u);
}

TEST(IOProcPumpTest, SourceLostIsReportedOnce) {
    SerialQueue queue("pump-lost");
    std::atomic<int> lost{0};

    IOProcPump pump(2, 48000.0, 64, queue,
                    [](const HalBufferList&, const HalTimestamp&) {});
    pump.onSourceLost = [&] { lost++; };
    pump.start();

    pump.markSourceLost();
    EXPECT_TRUE(waitUntil([&] { return lost.load() == 1; }));
    pump.stop();
    EXPECT_EQ(lost.load(), 1);
}

TEST(IOProcPumpTest, ThrowingBlockKeepsPumping) {
    SerialQueue queue("pump-throws");
    std::atomic<int> calls{0};

    IOProcPump pump(1, 48000.0, 16, queue,
        [&](const HalBufferList&, const HalTimestamp&) {
            if (calls++ == 0) throw std::runtime_error("first block fails");
        });
    pump.start();

    std::vector<float> input(32, 0.0f);
    pump.push(input.data(), 32);
    EXPECT_TRUE(waitUntil([&] { return calls.load() == 2; }));
    pump.stop();
}

TEST(IOProcPumpTest, StopIsIdempotent) {
    SerialQueue queue("pump-stop");
    IOProcPump pump(2, 48000.0, 64, queue,
                    [](const HalBufferList&, const HalTimestamp&) {});
    pump.stop();
    pump.start();
    EXPECT_TRUE(pump.isRunning());
    pump.stop();
    pump.stop();
    EXPECT_FALSE(pump.isRunning());
}
