#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace meetcapture {

// Linear-interpolating sample rate converter for interleaved audio.
// Keeps its fractional read position and the previous input frame between
// calls so consecutive buffers resample without drift or seams.
class LinearResampler {
public:
    LinearResampler(unsigned int inputRate, unsigned int outputRate, unsigned int channels);

    unsigned int InputRate() const { return _inputRate; }
    unsigned int OutputRate() const { return _outputRate; }
    unsigned int Channels() const { return _channels; }
    bool IsPassthrough() const { return _inputRate == _outputRate; }

    std::vector<float> Process(const float* input, size_t frames);
    std::vector<int16_t> Process(const int16_t* input, size_t frames);

    void Reset();

private:
    unsigned int _inputRate;
    unsigned int _outputRate;
    unsigned int _channels;
    double _step;
    double _position;
    bool _hasLast;
    std::vector<float> _last;
};

} // namespace meetcapture
