#include <gtest/gtest.h>
#include "audio/SndfileWriter.hpp"
#include <sndfile.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace {

fs::path tempFile(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() / ("proctap-sndfile-" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir / name;
}

struct ReadBack {
    SF_INFO            info{};
    std::vector<float> samples;
};

ReadBack readBack(const fs::path& path) {
    ReadBack r;
    SNDFILE* f = sf_open(path.string().c_str(), SFM_READ, &r.info);
    if (!f) throw std::runtime_error(sf_strerror(nullptr));
    r.samples.resize(static_cast<size_t>(r.info.frames) * r.info.channels);
    sf_readf_float(f, r.samples.data(), r.info.frames);
    sf_close(f);
    return r;
}

} // namespace

TEST(SndfileWriterTest, WritesInterleavedFloatFrames) {
    auto path = tempFile("stereo.wav");
    StreamFormat format{48000.0, 2, SampleEncoding::Float32, true};

    std::vector<float> samples = {0.5f, -0.5f, 0.25f, -0.25f, 0.0f, 1.0f};
    HalBufferList list;
    list.count = 1;
    list.buffers[0] = {2, static_cast<uint32_t>(samples.size() * sizeof(float)), samples.data()};

    PcmBufferView view;
    ASSERT_TRUE(PcmBufferView::wrap(format, list, view));

    {
        SndfileWriter writer(path, AudioFileSettings::fromFormat(format));
        writer.write(view);
        writer.write(view);
        EXPECT_EQ(writer.framesWritten(), 6u);
        writer.close();
    }

    auto r = readBack(path);
    EXPECT_EQ(r.info.channels, 2);
    EXPECT_EQ(r.info.samplerate, 48000);
    EXPECT_EQ(r.info.frames, 6);
    EXPECT_EQ(r.info.format & SF_FORMAT_SUBMASK, SF_FORMAT_FLOAT);
    ASSERT_EQ(r.samples.size(), 12u);
    EXPECT_FLOAT_EQ(r.samples[0], 0.5f);
    EXPECT_FLOAT_EQ(r.samples[3], -0.25f);
    EXPECT_FLOAT_EQ(r.samples[11], 1.0f);

    fs::remove_all(path.parent_path());
}

TEST(SndfileWriterTest, PlanarInputIsInterleavedOnDisk) {
    auto path = tempFile("planar.wav");
    StreamFormat format{44100.0, 2, SampleEncoding::Float32, false};

    std::vector<float> left  = {0.1f, 0.2f, 0.3f};
    std::vector<float> right = {-0.1f, -0.2f, -0.3f};
    HalBufferList list;
    list.count = 2;
    list.buffers[0] = {1, 12, left.data()};
    list.buffers[1] = {1, 12, right.data()};

    PcmBufferView view;
    ASSERT_TRUE(PcmBufferView::wrap(format, list, view));

    SndfileWriter writer(path, AudioFileSettings::fromFormat(format));
    writer.write(view);
    writer.close();

    auto r = readBack(path);
    EXPECT_EQ(r.info.frames, 3);
    ASSERT_EQ(r.samples.size(), 6u);
    EXPECT_FLOAT_EQ(r.samples[0], 0.1f);
    EXPECT_FLOAT_EQ(r.samples[1], -0.1f);
    EXPECT_FLOAT_EQ(r.samples[4], 0.3f);
    EXPECT_FLOAT_EQ(r.samples[5], -0.3f);

    fs::remove_all(path.parent_path());
}

TEST(SndfileWriterTest, FormatFollowsEncodingAndContainer) {
    AudioFileSettings s;
    EXPECT_EQ(SndfileWriter::formatFor(s), SF_FORMAT_WAV | SF_FORMAT_FLOAT);

    s.encoding = SampleEncoding::Int16;
    EXPECT_EQ(SndfileWriter::formatFor(s), SF_FORMAT_WAV | SF_FORMAT_PCM_16);

    s.encoding  = SampleEncoding::Int24;
    s.container = AudioContainer::Caf;
    EXPECT_EQ(SndfileWriter::formatFor(s), SF_FORMAT_CAF | SF_FORMAT_PCM_24);

    s.encoding = SampleEncoding::Float64;
    EXPECT_EQ(SndfileWriter::formatFor(s), SF_FORMAT_CAF | SF_FORMAT_DOUBLE);
}

TEST(SndfileWriterTest, WriteAfterCloseThrows) {
    auto path = tempFile("closed.wav");
    StreamFormat format{48000.0, 1, SampleEncoding::Float32, true};
    std::vector<float> samples(8, 0.0f);
    HalBufferList list;
    list.count = 1;
    list.buffers[0] = {1, 32, samples.data()};
    PcmBufferView view;
    ASSERT_TRUE(PcmBufferView::wrap(format, list, view));

    SndfileWriter writer(path, AudioFileSettings::fromFormat(format));
    writer.close();
    writer.close();
    EXPECT_THROW(writer.write(view), std::runtime_error);

    fs::remove_all(path.parent_path());
}

TEST(SndfileWriterTest, UnwritablePathThrows) {
    auto path = tempFile("unused.wav").parent_path() / "missing" / "out.wav";
    EXPECT_THROW({ SndfileWriter writer(path, AudioFileSettings{}); }, std::runtime_error);
    fs::remove_all(path.parent_path().parent_path());
}

TEST(SndfileWriterTest, FactoryOpensWriter) {
    auto path = tempFile("factory.caf");
    AudioFileSettings s;
    s.container = AudioContainer::Caf;

    auto writer = SndfileWriter::factory()(path, s);
    ASSERT_NE(writer, nullptr);
    EXPECT_EQ(writer->framesWritten(), 0u);
    writer->close();
    EXPECT_TRUE(fs::exists(path));

    fs::remove_all(path.parent_path());
}
