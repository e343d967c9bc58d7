#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "AutoGainControl.hpp"
#include "ICaptureBackend.hpp"
#include "NoiseSuppressor.hpp"

namespace meetcapture {

// Applies the per-source processing a capture constraint set asks for to
// interleaved device buffers: rnnoise per channel, then automatic gain.
class SourceProcessor {
public:
    SourceProcessor(const CaptureConstraints& constraints, unsigned int sampleRate, unsigned int channels);

    bool IsPassthrough() const { return _suppressors.empty() && !_agc; }

    std::vector<int16_t> Process(const int16_t* samples, size_t frames);

private:
    unsigned int _channels;
    std::vector<std::unique_ptr<NoiseSuppressor>> _suppressors;
    std::unique_ptr<AutoGainControl> _agc;
};

} // namespace meetcapture
