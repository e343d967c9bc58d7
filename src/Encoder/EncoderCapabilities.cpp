#include "EncoderCapabilities.hpp"
#include "../common/RecorderError.hpp"
#include "../common/debug_log.hpp"
#include "ContainerRecorderStrategy.hpp"
#include "FrameEncoderStrategy.hpp"
#include "OpusFrameEncoder.hpp"

namespace meetcapture {

EncoderCapabilities ProbeEncoderCapabilities(const RecorderConfig& config, StreamFormat input) {
    EncoderCapabilities capabilities;
    capabilities.frameEncoder =
        config.encoder.enableFrameEncoder && OpusFrameEncoder::IsSupported(config.encoder.sampleRate, input.channels);
    capabilities.container = ContainerRecorderStrategy::IsSupported(input.sampleRate, input.channels);

    MEETCAPTURE_LOG("Encoder probe: frame=" << capabilities.frameEncoder << " container=" << capabilities.container
                                            << MEETCAPTURE_LOG_ENDL);
    return capabilities;
}

EncoderPath SelectEncoderPath(const EncoderCapabilities& capabilities) {
    if (capabilities.frameEncoder) {
        return EncoderPath::Frame;
    }
    if (capabilities.container) {
        return EncoderPath::Container;
    }
    throw RecorderError(ErrorCode::EncoderUnavailable, "No Opus encoder is available");
}

std::unique_ptr<IEncoderStrategy> CreateEncoderStrategy(EncoderPath path, const RecorderConfig& config,
                                                        StreamFormat input, IRecordingEventSink* sink) {
    if (path == EncoderPath::Frame) {
        return std::make_unique<FrameEncoderStrategy>(config.encoder, config.chunking, input, sink);
    }
    return std::make_unique<ContainerRecorderStrategy>(config.encoder, input, sink);
}

} // namespace meetcapture
