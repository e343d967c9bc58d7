#pragma once

#include <atomic>

namespace meetcapture {

// Scalar gain stage. The value can be changed from any thread while the
// render thread is reading it.
class GainNode {
public:
    explicit GainNode(float gain = 1.0f) : _gain(gain) {}

    float Gain() const { return _gain.load(std::memory_order_relaxed); }
    void SetGain(float gain) { _gain.store(gain, std::memory_order_relaxed); }

private:
    std::atomic<float> _gain;
};

} // namespace meetcapture
