#include "audio/PcmBufferView.hpp"
#include <cstring>

bool PcmBufferView::wrap(const StreamFormat& format, const HalBufferList& input,
                         PcmBufferView& out) {
    if (!format.isValid()) return false;
    if (input.count != format.bufferCount() || input.count > kHalMaxBuffers)
        return false;

    const uint32_t expectedChannels = format.interleaved ? format.channelCount : 1;
    const uint32_t frameBytes = format.bytesPerBufferFrame();
    if (frameBytes == 0) return false;

    uint32_t frames = 0;
    for (uint32_t i = 0; i < input.count; i++) {
        const HalBuffer& buf = input.buffers[i];
        if (buf.channelCount != expectedChannels) return false;
        if (buf.byteSize % frameBytes != 0) return false;
        if (buf.byteSize > 0 && buf.data == nullptr) return false;

        uint32_t bufFrames = buf.byteSize / frameBytes;
        if (i == 0)
            frames = bufFrames;
        else if (bufFrames != frames)
            return false;
    }

    out.format_ = format;
    out.list_   = &input;
    out.frames_ = frames;
    return true;
}

float PcmBufferView::sample(uint32_t channel, uint32_t frame) const {
    const uint32_t bps = bytesPerSample(format_.encoding);
    const uint8_t* base;
    size_t offset;
    if (format_.interleaved) {
        base   = static_cast<const uint8_t*>(list_->buffers[0].data);
        offset = (static_cast<size_t>(frame) * format_.channelCount + channel) * bps;
    } else {
        base   = static_cast<const uint8_t*>(list_->buffers[channel].data);
        offset = static_cast<size_t>(frame) * bps;
    }
    const uint8_t* p = base + offset;

    switch (format_.encoding) {
        case SampleEncoding::Float32: {
            float v;
            std::memcpy(&v, p, sizeof(v));
            return v;
        }
        case SampleEncoding::Float64: {
            double v;
            std::memcpy(&v, p, sizeof(v));
            return static_cast<float>(v);
        }
        case SampleEncoding::Int16: {
            int16_t v;
            std::memcpy(&v, p, sizeof(v));
            return v / 32768.0f;
        }
        case SampleEncoding::Int24: {
            // little-endian packed
            int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
            if (v & 0x800000) v |= ~0xFFFFFF;
            return v / 8388608.0f;
        }
        case SampleEncoding::Int32: {
            int32_t v;
            std::memcpy(&v, p, sizeof(v));
            return static_cast<float>(v / 2147483648.0);
        }
    }
    return 0.0f;
}

const float* PcmBufferView::interleavedFloat32() const {
    if (!list_ || format_.encoding != SampleEncoding::Float32) return nullptr;
    if (!format_.interleaved && format_.channelCount != 1) return nullptr;
    return static_cast<const float*>(list_->buffers[0].data);
}
