#include "NoiseSuppressor.hpp"
#include "rnnoise.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace meetcapture {

void DenoiseDeleter::operator()(DenoiseState* ptr) const noexcept {
    if (ptr) {
        rnnoise_destroy(ptr);
    }
}

NoiseSuppressor::NoiseSuppressor(unsigned int sampleRate)
    : _denoiseState(rnnoise_create(nullptr))
    , _enabled(false)
    , _sampleRate(sampleRate)
    , _toRnnoise(sampleRate, kRnnoiseRate, 1)
    , _fromRnnoise(kRnnoiseRate, sampleRate, 1)
    , _lastVad(0.0f) {
    if (!_denoiseState) {
        throw std::runtime_error("rnnoise_create failed");
    }
    _inputBuffer.reserve(kFrameSize * 4);
}

NoiseSuppressor::~NoiseSuppressor() = default;

void NoiseSuppressor::SetEnabled(bool enabled) {
    _enabled = enabled;
    if (!enabled) {
        _inputBuffer.clear();
        _toRnnoise.Reset();
        _fromRnnoise.Reset();
    }
}

bool NoiseSuppressor::IsEnabled() const {
    return _enabled;
}

void NoiseSuppressor::ProcessFrame(float* frame) {
    // rnnoise expects samples in int16 scale, not [-1, 1].
    _lastVad = rnnoise_process_frame(_denoiseState.get(), frame, frame);
}

std::vector<int16_t> NoiseSuppressor::ProcessSamples(const int16_t* samples, size_t numSamples) {
    if (numSamples == 0) {
        return std::vector<int16_t>();
    }

    if (!_enabled) {
        return std::vector<int16_t>(samples, samples + numSamples);
    }

    std::vector<float> floatInput(samples, samples + numSamples);
    std::vector<float> upsampled = _toRnnoise.Process(floatInput.data(), numSamples);
    _inputBuffer.insert(_inputBuffer.end(), upsampled.begin(), upsampled.end());

    std::vector<float> processedFrames;
    size_t consumed = 0;
    while (_inputBuffer.size() - consumed >= kFrameSize) {
        float frame[kFrameSize];
        std::memcpy(frame, _inputBuffer.data() + consumed, kFrameSize * sizeof(float));
        consumed += kFrameSize;
        ProcessFrame(frame);
        processedFrames.insert(processedFrames.end(), frame, frame + kFrameSize);
    }
    _inputBuffer.erase(_inputBuffer.begin(), _inputBuffer.begin() + consumed);

    // Not enough for a full frame yet; the remainder waits for the next call.
    if (processedFrames.empty()) {
        return std::vector<int16_t>();
    }

    std::vector<float> outputFloat = _fromRnnoise.Process(processedFrames.data(), processedFrames.size());
    std::vector<int16_t> result(outputFloat.size());
    for (size_t i = 0; i < outputFloat.size(); ++i) {
        const float sample = std::max(-32768.0f, std::min(32767.0f, std::round(outputFloat[i])));
        result[i] = static_cast<int16_t>(sample);
    }
    return result;
}

} // namespace meetcapture
