#include "AutoGainControl.hpp"

#include <algorithm>
#include <cmath>

namespace meetcapture {

AutoGainControl::AutoGainControl(float targetPeak)
    : _targetPeak(targetPeak)
    , _envelope(0.0f)
    , _gain(1.0f) {}

void AutoGainControl::Reset() {
    _envelope = 0.0f;
    _gain = 1.0f;
}

void AutoGainControl::Process(int16_t* samples, size_t count) {
    if (count == 0) {
        return;
    }

    float peak = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        peak = std::max(peak, std::fabs(static_cast<float>(samples[i])));
    }

    const float rate = peak > _envelope ? kAttack : kRelease;
    _envelope += (peak - _envelope) * rate;

    if (_envelope > kNoiseFloor) {
        const float desired = std::max(kMinGain, std::min(kMaxGain, _targetPeak / _envelope));
        _gain += (desired - _gain) * kGainSmoothing;
    }

    for (size_t i = 0; i < count; ++i) {
        const float scaled = static_cast<float>(samples[i]) * _gain;
        samples[i] = static_cast<int16_t>(std::max(-32768.0f, std::min(32767.0f, scaled)));
    }
}

} // namespace meetcapture
