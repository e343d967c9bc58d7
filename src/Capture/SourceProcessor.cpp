#include "SourceProcessor.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>

namespace meetcapture {

SourceProcessor::SourceProcessor(const CaptureConstraints& constraints,
                                 unsigned int sampleRate,
                                 unsigned int channels)
    : _channels(channels) {
    if (constraints.noiseSuppression) {
        for (unsigned int c = 0; c < channels; ++c) {
            auto suppressor = std::make_unique<NoiseSuppressor>(sampleRate);
            suppressor->SetEnabled(true);
            _suppressors.push_back(std::move(suppressor));
        }
    }
    if (constraints.autoGainControl) {
        _agc = std::make_unique<AutoGainControl>();
    }
    if (constraints.echoCancellation) {
        MEETCAPTURE_LOG("Echo cancellation requested but not available for this device" << MEETCAPTURE_LOG_ENDL);
    }
}

std::vector<int16_t> SourceProcessor::Process(const int16_t* samples, size_t frames) {
    std::vector<int16_t> output;

    if (_suppressors.empty()) {
        output.assign(samples, samples + frames * _channels);
    } else {
        std::vector<std::vector<int16_t>> denoised(_channels);
        std::vector<int16_t> channel(frames);
        for (unsigned int c = 0; c < _channels; ++c) {
            for (size_t i = 0; i < frames; ++i) {
                channel[i] = samples[i * _channels + c];
            }
            denoised[c] = _suppressors[c]->ProcessSamples(channel.data(), frames);
        }

        size_t outFrames = denoised[0].size();
        for (const auto& d : denoised) {
            outFrames = std::min(outFrames, d.size());
        }
        output.resize(outFrames * _channels);
        for (size_t i = 0; i < outFrames; ++i) {
            for (unsigned int c = 0; c < _channels; ++c) {
                output[i * _channels + c] = denoised[c][i];
            }
        }
    }

    if (_agc && !output.empty()) {
        _agc->Process(output.data(), output.size());
    }
    return output;
}

} // namespace meetcapture
