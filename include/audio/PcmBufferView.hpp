#pragma once
#include "hal/HalTypes.hpp"
#include <cstdint>

// Non-owning view of one delivered buffer list, interpreted with a
// negotiated StreamFormat. Never copies sample data.
class PcmBufferView {
public:
    PcmBufferView() = default;

    // Returns false when `input` does not match `format`: wrong number of
    // buffers, wrong channels per buffer, a byte size that is not a whole
    // number of frames, or planar buffers of different lengths.
    static bool wrap(const StreamFormat& format, const HalBufferList& input,
                     PcmBufferView& out);

    const StreamFormat& format() const { return format_; }
    uint32_t frameLength() const { return frames_; }
    uint32_t channelCount() const { return format_.channelCount; }
    bool interleaved() const { return format_.interleaved; }

    // Raw pointer of buffer `index` (0 for interleaved data).
    const void* bufferData(uint32_t index) const { return list_->buffers[index].data; }

    // Sample of `channel` at `frame`, converted to [-1, 1] float.
    float sample(uint32_t channel, uint32_t frame) const;

    // Interleaved float32 data without conversion, or nullptr when the
    // layout is anything else.
    const float* interleavedFloat32() const;

private:
    StreamFormat         format_;
    const HalBufferList* list_   = nullptr;
    uint32_t             frames_ = 0;
};
