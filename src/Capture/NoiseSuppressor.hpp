#pragma once

#include <vector>
#include <cstdint>
#include <memory>

#include "../common/LinearResampler.hpp"

struct DenoiseState;

namespace meetcapture {

struct DenoiseDeleter {
    void operator()(DenoiseState* ptr) const noexcept;
};

// rnnoise denoiser for one mono channel. rnnoise works on 480-sample frames
// at 48 kHz, so input is resampled up, denoised and resampled back. Output
// lags input by up to one rnnoise frame.
class NoiseSuppressor {
public:
    explicit NoiseSuppressor(unsigned int sampleRate);
    ~NoiseSuppressor();

    void SetEnabled(bool enabled);
    bool IsEnabled() const;

    unsigned int SampleRate() const { return _sampleRate; }

    std::vector<int16_t> ProcessSamples(const int16_t* samples, size_t numSamples);

    // Voice activity probability reported for the last processed frame.
    float LastVadProbability() const { return _lastVad; }

private:
    static constexpr unsigned int kRnnoiseRate = 48000;
    static constexpr size_t kFrameSize = 480;

    void ProcessFrame(float* frame);

    std::unique_ptr<DenoiseState, DenoiseDeleter> _denoiseState;
    bool _enabled;
    unsigned int _sampleRate;
    LinearResampler _toRnnoise;
    LinearResampler _fromRnnoise;
    std::vector<float> _inputBuffer;
    float _lastVad;
};

} // namespace meetcapture
