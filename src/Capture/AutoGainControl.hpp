#pragma once

#include <cstddef>
#include <cstdint>

namespace meetcapture {

// Peak-tracking automatic gain. The envelope follows peaks with a fast
// attack and a slow release; gain steers the envelope toward the target
// level, clamped to [kMinGain, kMaxGain].
class AutoGainControl {
public:
    explicit AutoGainControl(float targetPeak = 16000.0f);

    void Process(int16_t* samples, size_t count);

    float CurrentGain() const { return _gain; }
    void Reset();

private:
    static constexpr float kMinGain = 0.25f;
    static constexpr float kMaxGain = 8.0f;
    static constexpr float kAttack = 0.2f;
    static constexpr float kRelease = 0.005f;
    static constexpr float kGainSmoothing = 0.05f;
    // Below this envelope the input is treated as silence and gain is held.
    static constexpr float kNoiseFloor = 200.0f;

    float _targetPeak;
    float _envelope;
    float _gain;
};

} // namespace meetcapture
