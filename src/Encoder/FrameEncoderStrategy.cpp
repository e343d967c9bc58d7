#include "FrameEncoderStrategy.hpp"
#include "../common/RecorderError.hpp"
#include "../common/debug_log.hpp"

namespace meetcapture {

FrameEncoderStrategy::FrameEncoderStrategy(const EncoderConfig& encoder, const ChunkingConfig& chunking,
                                           StreamFormat input, IRecordingEventSink* sink)
    : _input(input)
    , _sink(sink)
    , _paused(false)
    , _stopped(false) {
    StreamFormat encoded{encoder.sampleRate, input.channels};
    _assembler = std::make_unique<ChunkAssembler>(chunking, encoded, sink);

    if (input.sampleRate != encoder.sampleRate) {
        MEETCAPTURE_LOG("Resampling " << input.sampleRate << " Hz to " << encoder.sampleRate
                                      << " Hz for encoding" << MEETCAPTURE_LOG_ENDL);
        _resampler = std::make_unique<LinearResampler>(input.sampleRate, encoder.sampleRate, input.channels);
    }

    ChunkAssembler* assembler = _assembler.get();
    _encoder = std::make_unique<OpusFrameEncoder>(encoder.sampleRate, input.channels, encoder.bitrate,
                                                  encoder.frameDurationMs,
                                                  [assembler](CompressedFrame packet) {
                                                      const int64_t ts = packet.timestampUs;
                                                      if (!assembler->Submit(std::move(packet))) {
                                                          MEETCAPTURE_ERROR_LOG("Opus packet at " << ts
                                                                                << " us rejected by the chunk assembler");
                                                      }
                                                  });
}

void FrameEncoderStrategy::Submit(const AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(_encoderMutex);
    if (_stopped || _paused) {
        return;
    }
    if (frame.channels != _input.channels) {
        throw RecorderError(ErrorCode::EncodeFrameFailed,
                            "Unexpected channel count " + std::to_string(frame.channels));
    }

    if (_resampler) {
        std::vector<int16_t> resampled = _resampler->Process(frame.samples.data(), frame.FrameCount());
        _encoder->Encode(resampled.data(), resampled.size() / _input.channels, frame.timestampUs);
    } else {
        _encoder->Encode(frame.samples.data(), frame.FrameCount(), frame.timestampUs);
    }
}

void FrameEncoderStrategy::Pause() {
    // Held across the assembler pause so no packet is encoded between the
    // codec flush and the pause chunk.
    std::lock_guard<std::mutex> lock(_encoderMutex);
    if (_paused || _stopped) {
        return;
    }
    FlushCodec();
    _paused = true;
    _assembler->Pause();
}

void FrameEncoderStrategy::Resume() {
    std::lock_guard<std::mutex> lock(_encoderMutex);
    if (!_paused || _stopped) {
        return;
    }
    _assembler->Resume();
    _paused = false;
}

void FrameEncoderStrategy::Flush() {
    std::lock_guard<std::mutex> lock(_encoderMutex);
    FlushCodec();
}

size_t FrameEncoderStrategy::Stop() {
    {
        std::lock_guard<std::mutex> lock(_encoderMutex);
        if (!_stopped) {
            FlushCodec();
            _stopped = true;
        }
    }
    _assembler->Stop();
    return _assembler->ChunkCount();
}

size_t FrameEncoderStrategy::ChunkCount() const {
    return _assembler->ChunkCount();
}

void FrameEncoderStrategy::FlushCodec() {
    try {
        _encoder->Flush();
    } catch (const RecorderError& e) {
        ReportError(_sink, e.Code(), e.what());
    }
}

} // namespace meetcapture
