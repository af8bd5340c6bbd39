#pragma once
#include "PcmBufferView.hpp"
#include <algorithm>
#include <cmath>

// Live level indicator for the recording UI.
// RMS of the first channel, scaled by a fixed gain and clamped to [0, 1].
class LoudnessMeter {
public:
    static constexpr float kGain         = 2.0f;
    static constexpr float kHotThreshold = 0.03f;

    static float level(const PcmBufferView& buffer) {
        const uint32_t frames = buffer.frameLength();
        if (frames == 0 || buffer.channelCount() == 0) return 0.0f;

        double sumOfSquares = 0.0;
        if (const float* data = buffer.interleavedFloat32()) {
            const uint32_t stride = buffer.interleaved() ? buffer.channelCount() : 1;
            for (uint32_t i = 0; i < frames; i++) {
                double s = data[static_cast<size_t>(i) * stride];
                sumOfSquares += s * s;
            }
        } else {
            for (uint32_t i = 0; i < frames; i++) {
                double s = buffer.sample(0, i);
                sumOfSquares += s * s;
            }
        }

        float rms = static_cast<float>(std::sqrt(sumOfSquares / frames));
        return std::clamp(rms * kGain, 0.0f, 1.0f);
    }

    // Level high enough to show as live signal.
    static bool isHot(float level) { return level > kHotThreshold; }
};
