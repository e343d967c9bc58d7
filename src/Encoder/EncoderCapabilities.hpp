#pragma once

#include <memory>

#include "../Events/EventSink.hpp"
#include "../common/RecorderConfig.hpp"
#include "IEncoderStrategy.hpp"

namespace meetcapture {

struct EncoderCapabilities {
    bool frameEncoder = false;
    bool container = false;
};

EncoderCapabilities ProbeEncoderCapabilities(const RecorderConfig& config, StreamFormat input);

// Frame encoder first, container second. Throws RecorderError(EncoderUnavailable)
// when neither is available.
EncoderPath SelectEncoderPath(const EncoderCapabilities& capabilities);

std::unique_ptr<IEncoderStrategy> CreateEncoderStrategy(EncoderPath path, const RecorderConfig& config,
                                                        StreamFormat input, IRecordingEventSink* sink);

} // namespace meetcapture
