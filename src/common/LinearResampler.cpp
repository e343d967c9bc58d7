#include "LinearResampler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace meetcapture {

LinearResampler::LinearResampler(unsigned int inputRate, unsigned int outputRate, unsigned int channels)
    : _inputRate(inputRate)
    , _outputRate(outputRate)
    , _channels(channels)
    , _step(0.0)
    , _position(0.0)
    , _hasLast(false)
    , _last(channels, 0.0f) {
    if (inputRate == 0 || outputRate == 0 || channels == 0) {
        throw std::invalid_argument("LinearResampler: rates and channel count must be positive");
    }
    _step = static_cast<double>(inputRate) / static_cast<double>(outputRate);
}

void LinearResampler::Reset() {
    _position = 0.0;
    _hasLast = false;
    std::fill(_last.begin(), _last.end(), 0.0f);
}

std::vector<float> LinearResampler::Process(const float* input, size_t frames) {
    if (frames == 0) {
        return {};
    }
    if (IsPassthrough()) {
        return std::vector<float>(input, input + frames * _channels);
    }

    std::vector<float> output;
    output.reserve(static_cast<size_t>(std::ceil(frames / _step)) * _channels + _channels);

    const double lastIndex = static_cast<double>(frames - 1);
    // _position may sit in [-1, 0) which interpolates against the previous buffer's tail.
    while (_position <= lastIndex) {
        const double floorPos = std::floor(_position);
        const long index0 = static_cast<long>(floorPos);
        const double t = _position - floorPos;

        for (unsigned int c = 0; c < _channels; ++c) {
            const float s0 = index0 < 0
                ? (_hasLast ? _last[c] : input[c])
                : input[static_cast<size_t>(index0) * _channels + c];
            float sample = s0;
            if (t > 0.0) {
                const float s1 = input[static_cast<size_t>(index0 + 1) * _channels + c];
                sample = static_cast<float>(s0 + (s1 - s0) * t);
            }
            output.push_back(sample);
        }
        _position += _step;
    }

    _position -= static_cast<double>(frames);
    for (unsigned int c = 0; c < _channels; ++c) {
        _last[c] = input[(frames - 1) * _channels + c];
    }
    _hasLast = true;
    return output;
}

std::vector<int16_t> LinearResampler::Process(const int16_t* input, size_t frames) {
    if (IsPassthrough()) {
        return std::vector<int16_t>(input, input + frames * _channels);
    }

    std::vector<float> asFloat(input, input + frames * _channels);
    std::vector<float> resampled = Process(asFloat.data(), frames);

    std::vector<int16_t> output(resampled.size());
    for (size_t i = 0; i < resampled.size(); ++i) {
        const float clamped = std::max(-32768.0f, std::min(32767.0f, std::round(resampled[i])));
        output[i] = static_cast<int16_t>(clamped);
    }
    return output;
}

} // namespace meetcapture
