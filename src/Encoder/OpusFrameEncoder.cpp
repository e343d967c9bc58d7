#include "OpusFrameEncoder.hpp"
#include "../common/RecorderError.hpp"

#include <opus/opus.h>

#include <string>

namespace meetcapture {

namespace {
// Recommended upper bound for a single Opus packet.
constexpr size_t kMaxPacketBytes = 4000;
} // namespace

void OpusEncoderDeleter::operator()(OpusEncoder* ptr) const noexcept {
    if (ptr) {
        opus_encoder_destroy(ptr);
    }
}

OpusFrameEncoder::OpusFrameEncoder(unsigned int sampleRate, unsigned int channels, unsigned int bitrate,
                                   unsigned int frameDurationMs, OutputCallback output)
    : _sampleRate(sampleRate)
    , _channels(channels)
    , _frameSize(static_cast<size_t>(sampleRate) * frameDurationMs / 1000)
    , _output(std::move(output))
    , _pendingTimestampUs(0)
    , _packetBuffer(kMaxPacketBytes) {
    int error = OPUS_OK;
    OpusEncoder* encoder = opus_encoder_create(static_cast<opus_int32>(sampleRate), static_cast<int>(channels),
                                               OPUS_APPLICATION_VOIP, &error);
    if (error != OPUS_OK || !encoder) {
        throw RecorderError(ErrorCode::EncoderUnavailable,
                            std::string("opus_encoder_create failed: ") + opus_strerror(error));
    }
    _encoder.reset(encoder);

    if (opus_encoder_ctl(_encoder.get(), OPUS_SET_BITRATE(static_cast<opus_int32>(bitrate))) != OPUS_OK) {
        throw RecorderError(ErrorCode::EncoderUnavailable, "Unsupported Opus bitrate: " + std::to_string(bitrate));
    }
    opus_encoder_ctl(_encoder.get(), OPUS_SET_SIGNAL(OPUS_SIGNAL_VOICE));

    _pending.reserve(_frameSize * _channels * 2);
}

OpusFrameEncoder::~OpusFrameEncoder() = default;

bool OpusFrameEncoder::IsSupported(unsigned int sampleRate, unsigned int channels) {
    if (channels < 1 || channels > 2) {
        return false;
    }
    int error = OPUS_OK;
    OpusEncoder* probe = opus_encoder_create(static_cast<opus_int32>(sampleRate), static_cast<int>(channels),
                                             OPUS_APPLICATION_VOIP, &error);
    if (!probe) {
        return false;
    }
    opus_encoder_destroy(probe);
    return error == OPUS_OK;
}

void OpusFrameEncoder::Encode(const int16_t* samples, size_t frames, int64_t timestampUs) {
    if (frames == 0) {
        return;
    }
    if (_pending.empty()) {
        _pendingTimestampUs = timestampUs;
    }
    _pending.insert(_pending.end(), samples, samples + frames * _channels);

    const size_t frameSamples = _frameSize * _channels;
    size_t offset = 0;
    std::string failure;
    while (_pending.size() - offset >= frameSamples) {
        try {
            EncodeFrame(_pending.data() + offset);
        } catch (const RecorderError& e) {
            failure = e.what();
        }
        offset += frameSamples;
        _pendingTimestampUs += static_cast<int64_t>(_frameSize) * 1000000 / _sampleRate;
    }
    _pending.erase(_pending.begin(), _pending.begin() + static_cast<std::ptrdiff_t>(offset));

    if (!failure.empty()) {
        throw RecorderError(ErrorCode::EncodeFrameFailed, failure);
    }
}

void OpusFrameEncoder::EncodeFrame(const int16_t* frame) {
    const opus_int32 bytes = opus_encode(_encoder.get(), frame, static_cast<int>(_frameSize),
                                         _packetBuffer.data(), static_cast<opus_int32>(_packetBuffer.size()));
    if (bytes < 0) {
        throw RecorderError(ErrorCode::EncodeFrameFailed, std::string("Encode failed: ") + opus_strerror(bytes));
    }

    // Copy out of the scratch buffer, which the next call overwrites.
    CompressedFrame packet;
    packet.data.assign(_packetBuffer.begin(), _packetBuffer.begin() + bytes);
    packet.timestampUs = _pendingTimestampUs;
    if (_output) {
        _output(std::move(packet));
    }
}

void OpusFrameEncoder::Flush() {
    if (_pending.empty()) {
        return;
    }
    _pending.resize(_frameSize * _channels, 0);
    try {
        EncodeFrame(_pending.data());
    } catch (const RecorderError&) {
        _pending.clear();
        throw;
    }
    _pending.clear();
}

} // namespace meetcapture
