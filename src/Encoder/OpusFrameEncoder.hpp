#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "../common/Types.hpp"

struct OpusEncoder;

namespace meetcapture {

struct OpusEncoderDeleter {
    void operator()(OpusEncoder* ptr) const noexcept;
};

// Per-frame Opus encoder. Accepts PCM of any length, encodes every complete
// codec frame and hands each packet to the output callback as an owned
// CompressedFrame. Partial frames wait for more input or for Flush().
class OpusFrameEncoder {
public:
    using OutputCallback = std::function<void(CompressedFrame)>;

    OpusFrameEncoder(unsigned int sampleRate, unsigned int channels, unsigned int bitrate,
                     unsigned int frameDurationMs, OutputCallback output);
    ~OpusFrameEncoder();

    unsigned int SampleRate() const { return _sampleRate; }
    unsigned int Channels() const { return _channels; }
    size_t FrameSize() const { return _frameSize; }
    size_t PendingFrames() const { return _pending.size() / _channels; }

    // Throws RecorderError(EncodeFrameFailed) if any codec frame fails. The
    // input is consumed either way; the failed frame is dropped.
    void Encode(const int16_t* samples, size_t frames, int64_t timestampUs);

    // Pads the buffered partial frame with silence and encodes it.
    void Flush();

    // True if an encoder can be created for this format.
    static bool IsSupported(unsigned int sampleRate, unsigned int channels);

private:
    void EncodeFrame(const int16_t* frame);

    std::unique_ptr<OpusEncoder, OpusEncoderDeleter> _encoder;
    unsigned int _sampleRate;
    unsigned int _channels;
    size_t _frameSize;
    OutputCallback _output;
    std::vector<int16_t> _pending;
    int64_t _pendingTimestampUs;
    std::vector<unsigned char> _packetBuffer;
};

} // namespace meetcapture
