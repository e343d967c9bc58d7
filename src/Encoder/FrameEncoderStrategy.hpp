#pragma once

#include <memory>
#include <mutex>

#include "../Chunking/ChunkAssembler.hpp"
#include "../Events/EventSink.hpp"
#include "../common/LinearResampler.hpp"
#include "../common/RecorderConfig.hpp"
#include "IEncoderStrategy.hpp"
#include "OpusFrameEncoder.hpp"

namespace meetcapture {

// Primary path: per-frame Opus packets grouped by the chunk assembler.
// Frames submitted while paused are dropped before they reach the codec.
class FrameEncoderStrategy : public IEncoderStrategy {
public:
    FrameEncoderStrategy(const EncoderConfig& encoder, const ChunkingConfig& chunking, StreamFormat input,
                         IRecordingEventSink* sink);

    EncoderPath Path() const override { return EncoderPath::Frame; }

    void Submit(const AudioFrame& frame) override;
    void Pause() override;
    void Resume() override;
    void Flush() override;
    size_t Stop() override;
    size_t ChunkCount() const override;

    const ChunkAssembler& Assembler() const { return *_assembler; }

private:
    void FlushCodec();

    StreamFormat _input;
    IRecordingEventSink* _sink;
    std::unique_ptr<ChunkAssembler> _assembler;
    std::unique_ptr<LinearResampler> _resampler;
    std::unique_ptr<OpusFrameEncoder> _encoder;
    std::mutex _encoderMutex;
    bool _paused;
    bool _stopped;
};

} // namespace meetcapture
