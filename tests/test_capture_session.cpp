#include <gtest/gtest.h>
#include "FakeAudioHardware.hpp"
#include "MemoryFileWriter.hpp"
#include "capture/CaptureSession.hpp"
#include "core/CaptureError.hpp"
#include "tap/TapManager.hpp"
#include <fstream>
#include <random>

namespace {

std::vector<float> constant(float value, uint32_t frames, uint32_t channels = 2) {
    return std::vector<float>(static_cast<size_t>(frames) * channels, value);
}

class CaptureSessionTest : public ::testing::Test {
protected:
    FakeAudioHardware hw;
    TaskQueue         mainQueue;
    int               changes = 0;
    std::shared_ptr<std::vector<std::shared_ptr<MemoryFileLog>>> logs =
        std::make_shared<std::vector<std::shared_ptr<MemoryFileLog>>>();
    std::shared_ptr<TapManager>     tap;
    std::unique_ptr<CaptureSession> session;

    void SetUp() override {
        tap = std::make_shared<TapManager>(
            hw, mainQueue, CaptureTarget::singleProcess(42, "Music", "com.apple.Music"));
        session = makeSession("Music-1.wav", MemoryFileWriter::factory(logs));
    }

    std::unique_ptr<CaptureSession> makeSession(const std::filesystem::path& path,
                                                AudioFileWriterFactory factory) {
        auto s = std::make_unique<CaptureSession>(tap, path, mainQueue, std::move(factory));
        s->onChange = [this] { changes++; };
        return s;
    }

    MemoryFileLog& file() { return *logs->at(0); }
};

std::filesystem::path uniqueTempDir() {
    std::random_device rd;
    return std::filesystem::temp_directory_path() /
           ("proctap-test-" + std::to_string(rd()));
}

} // namespace

TEST_F(CaptureSessionTest, StartActivatesTapAndOpensFile) {
    session->start();

    EXPECT_TRUE(session->isRecording());
    EXPECT_TRUE(tap->activated());
    EXPECT_TRUE(tap->isRunning());
    ASSERT_EQ(logs->size(), 1u);
    EXPECT_EQ(file().path, std::filesystem::path("Music-1.wav"));
    EXPECT_DOUBLE_EQ(file().settings.sampleRate, 48000.0);
    EXPECT_EQ(file().settings.channelCount, 2u);
    EXPECT_EQ(file().settings.encoding, SampleEncoding::Float32);
    EXPECT_TRUE(file().settings.interleaved);
    EXPECT_EQ(hw.ioProcsCreated, 1);
    EXPECT_GE(changes, 1);
}

TEST_F(CaptureSessionTest, ExposesTargetIdentity) {
    EXPECT_EQ(session->displayName(), "Music");
    EXPECT_EQ(session->iconId(), "com.apple.Music");
    EXPECT_EQ(session->fileUrl(), std::filesystem::path("Music-1.wav"));
    EXPECT_FALSE(session->isRecording());
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);
}

TEST_F(CaptureSessionTest, WritesEveryBufferAndPublishesLoudness) {
    session->start();

    for (int i = 0; i < 3; i++) hw.deliver(constant(0.25f, 128), 2);
    mainQueue.drain();

    EXPECT_EQ(file().frames, 384u);
    EXPECT_EQ(file().writes, 3);
    EXPECT_EQ(session->framesWritten(), 384u);
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.5f);
    EXPECT_FLOAT_EQ(file().samples.front(), 0.25f);
}

TEST_F(CaptureSessionTest, LoudnessPublicationsCoalesce) {
    session->start();

    hw.deliver(constant(0.4f, 64), 2);
    hw.deliver(constant(0.3f, 64), 2);
    hw.deliver(constant(0.1f, 64), 2);
    EXPECT_EQ(mainQueue.pending(), 1u);

    mainQueue.drain();
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.2f);
}

TEST_F(CaptureSessionTest, StartWhileRecordingIsNoOp) {
    session->start();
    session->start();

    EXPECT_TRUE(session->isRecording());
    EXPECT_EQ(logs->size(), 1u);
    EXPECT_EQ(hw.ioProcsCreated, 1);
}

TEST_F(CaptureSessionTest, StopWhileIdleIsNoOp) {
    session->stop();

    EXPECT_FALSE(session->isRecording());
    EXPECT_TRUE(hw.events.empty());
    EXPECT_EQ(changes, 0);
}

TEST_F(CaptureSessionTest, StopClosesFileAndInvalidatesTap) {
    session->start();
    hw.deliver(constant(0.25f, 128), 2);
    mainQueue.drain();
    session->stop();

    EXPECT_FALSE(session->isRecording());
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);
    EXPECT_TRUE(file().closed);
    EXPECT_EQ(tap->state(), TapManager::State::Invalidated);
    EXPECT_EQ(hw.liveIOProcs, 0);
    EXPECT_EQ(hw.liveTaps, 0);
}

TEST_F(CaptureSessionTest, LateBufferAfterStopIsDropped) {
    session->start();
    for (int i = 0; i < 3; i++) hw.deliver(constant(0.25f, 128), 2);
    session->stop();

    EXPECT_NO_THROW(hw.deliverLate(constant(0.9f, 128), 2));
    mainQueue.drain();

    EXPECT_EQ(file().writes, 3);
    EXPECT_EQ(file().writesAfterClose.load(), 0);
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);
}

TEST_F(CaptureSessionTest, DeviceDeathEndsRecording) {
    session->start();
    hw.deliver(constant(0.25f, 128), 2);
    mainQueue.drain();
    ASSERT_GT(session->currentLoudness(), 0.0f);

    hw.fireDeviceDeath(tap->aggregateDeviceId());
    ASSERT_TRUE(drainUntil(mainQueue, [&] { return !session->isRecording(); }));

    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);
    EXPECT_TRUE(file().closed);
    EXPECT_EQ(file().writes, 1);
    EXPECT_EQ(tap->state(), TapManager::State::Invalidated);

    hw.deliverLate(constant(0.5f, 128), 2);
    mainQueue.drain();
    EXPECT_EQ(file().writes, 1);
    EXPECT_EQ(file().writesAfterClose.load(), 0);
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);
}

TEST_F(CaptureSessionTest, ExternalInvalidateEndsRecording) {
    session->start();
    tap->invalidate();
    EXPECT_TRUE(session->isRecording());  // handled asynchronously

    ASSERT_TRUE(drainUntil(mainQueue, [&] { return !session->isRecording(); }));
    EXPECT_TRUE(file().closed);

    // Stopping afterwards is a no-op
    session->stop();
    EXPECT_FALSE(session->isRecording());
}

TEST_F(CaptureSessionTest, ExpiredTapFailsStart) {
    tap.reset();

    try {
        session->start();
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::TapUnavailable);
    }
    EXPECT_FALSE(session->isRecording());
    EXPECT_TRUE(logs->empty());
}

TEST_F(CaptureSessionTest, StopWithExpiredTapCleansUp) {
    session->start();
    tap.reset();

    EXPECT_NO_THROW(session->stop());
    EXPECT_FALSE(session->isRecording());
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);
    EXPECT_EQ(hw.liveTaps, 0);

    // The invalidation notice posted by the dying tap finds nothing to do
    drainUntil(mainQueue, [] { return false; }, std::chrono::milliseconds(50));
    EXPECT_FALSE(session->isRecording());
}

TEST_F(CaptureSessionTest, ActivationErrorPropagates) {
    hw.devices = {{10, "Mic", 0}};

    try {
        session->start();
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::NoOutputDevices);
        EXPECT_STREQ(e.what(), "No hardware output devices found");
    }
    EXPECT_FALSE(session->isRecording());
    EXPECT_TRUE(logs->empty());
    EXPECT_EQ(hw.ioProcsCreated, 0);
}

TEST_F(CaptureSessionTest, TapCreationErrorPropagates) {
    hw.createTapStatus = kHalUnsupportedError;

    try {
        session->start();
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::TapCreation);
    }
    EXPECT_FALSE(session->isRecording());
}

TEST_F(CaptureSessionTest, FileCreationFailure) {
    session = makeSession("Music-2.wav",
        [](const std::filesystem::path&, const AudioFileSettings&)
            -> std::unique_ptr<IAudioFileWriter> {
            throw std::runtime_error("permission denied");
        });

    try {
        session->start();
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::FileCreation);
        EXPECT_NE(std::string(e.what()).find("permission denied"), std::string::npos);
    }
    EXPECT_FALSE(session->isRecording());
    EXPECT_EQ(hw.ioProcsCreated, 0);
}

TEST_F(CaptureSessionTest, DeviceStartFailureClosesFile) {
    hw.startStatus = kHalIllegalOperationError;

    try {
        session->start();
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::DeviceStart);
    }
    EXPECT_FALSE(session->isRecording());
    ASSERT_EQ(logs->size(), 1u);
    EXPECT_TRUE(file().closed);
    EXPECT_EQ(hw.liveIOProcs, 0);
}

TEST_F(CaptureSessionTest, StartCanBeRetriedAfterDeviceStartFailure) {
    hw.startStatus = kHalIllegalOperationError;
    EXPECT_THROW(session->start(), CaptureError);
    EXPECT_FALSE(session->isRecording());
    EXPECT_EQ(tap->errorKind(), CaptureErrorKind::DeviceStart);
    EXPECT_FALSE(tap->activationFailed());

    hw.startStatus = kHalNoError;
    session->start();
    EXPECT_TRUE(session->isRecording());
    EXPECT_TRUE(tap->isRunning());
    EXPECT_FALSE(tap->errorMessage().has_value());
    ASSERT_EQ(logs->size(), 2u);
    EXPECT_TRUE(logs->at(0)->closed);
    EXPECT_FALSE(logs->at(1)->closed);
    EXPECT_EQ(hw.liveIOProcs, 1);

    hw.deliver(constant(0.25f, 64), 2);
    EXPECT_EQ(logs->at(1)->frames, 64u);

    session->stop();
    EXPECT_TRUE(logs->at(1)->closed);
}

TEST_F(CaptureSessionTest, CreatesDestinationDirectory) {
    auto dir = uniqueTempDir();
    auto path = dir / "nested" / "deeper" / "Music-3.wav";
    session = makeSession(path, MemoryFileWriter::factory(logs));

    session->start();
    EXPECT_TRUE(std::filesystem::is_directory(path.parent_path()));
    session->stop();

    std::filesystem::remove_all(dir);
}

TEST_F(CaptureSessionTest, DirectoryCreationFailure) {
    auto dir = uniqueTempDir();
    std::filesystem::create_directories(dir);
    auto blocker = dir / "blocker";
    std::ofstream(blocker) << "not a directory";

    session = makeSession(blocker / "sub" / "Music-4.wav", MemoryFileWriter::factory(logs));
    try {
        session->start();
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::FileCreation);
    }
    EXPECT_FALSE(session->isRecording());
    EXPECT_TRUE(logs->empty());

    std::filesystem::remove_all(dir);
}

TEST_F(CaptureSessionTest, WriteFailureKeepsRecording) {
    session->start();
    file().failWrites = 1;

    hw.deliver(constant(0.25f, 64), 2);
    mainQueue.drain();
    EXPECT_TRUE(session->isRecording());
    EXPECT_EQ(session->failedWrites(), 1u);
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);

    hw.deliver(constant(0.25f, 64), 2);
    mainQueue.drain();
    EXPECT_EQ(file().writes, 1);
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.5f);
}

TEST_F(CaptureSessionTest, MalformedBufferIsSkipped) {
    session->start();
    hw.deliver(constant(0.25f, 64), 2);
    mainQueue.drain();
    ASSERT_FLOAT_EQ(session->currentLoudness(), 0.5f);

    std::vector<float> mono(64, 0.9f);
    HalBufferList list;
    list.count = 1;
    list.buffers[0] = {1, 256, mono.data()};
    hw.deliverRaw(list);
    mainQueue.drain();

    EXPECT_TRUE(session->isRecording());
    EXPECT_EQ(file().writes, 1);
    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);
}

TEST_F(CaptureSessionTest, ZeroFrameBufferReadsSilent) {
    session->start();
    hw.deliver(constant(0.25f, 64), 2);
    mainQueue.drain();

    hw.deliver({}, 2);
    mainQueue.drain();

    EXPECT_FLOAT_EQ(session->currentLoudness(), 0.0f);
    EXPECT_EQ(file().frames, 64u);
    EXPECT_TRUE(session->isRecording());
}

TEST_F(CaptureSessionTest, InvalidatedTapCannotRecordAgain) {
    session->start();
    session->stop();

    try {
        session->start();
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::FormatUnavailable);
    }
    EXPECT_FALSE(session->isRecording());
    EXPECT_EQ(logs->size(), 1u);
}

TEST_F(CaptureSessionTest, DestructorStopsRecording) {
    session->start();
    hw.deliver(constant(0.25f, 64), 2);
    session.reset();
    mainQueue.drain();

    EXPECT_TRUE(file().closed);
    EXPECT_EQ(tap->state(), TapManager::State::Invalidated);
    EXPECT_EQ(hw.liveIOProcs, 0);
}
