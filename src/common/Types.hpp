#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meetcapture {

enum class SourceKind {
    Microphone,
    System
};

inline const char* ToString(SourceKind kind) {
    return kind == SourceKind::Microphone ? "microphone" : "system";
}

struct StreamFormat {
    unsigned int sampleRate = 16000;
    unsigned int channels = 2;
};

// One block of interleaved PCM pulled from a media track.
struct AudioFrame {
    std::vector<int16_t> samples;
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
    int64_t timestampUs = 0;

    size_t FrameCount() const { return channels ? samples.size() / channels : 0; }
};

// One codec-encoded unit. The bytes are owned by the frame, never by the codec.
struct CompressedFrame {
    std::vector<uint8_t> data;
    int64_t timestampUs = 0;

    size_t Size() const { return data.size(); }
};

enum class FlushReason {
    Size,
    Timer,
    Pause,
    Stop,
    Legacy
};

inline const char* ToString(FlushReason reason) {
    switch (reason) {
        case FlushReason::Size: return "size";
        case FlushReason::Timer: return "timer";
        case FlushReason::Pause: return "pause";
        case FlushReason::Stop: return "stop";
        case FlushReason::Legacy: return "legacy";
    }
    return "unknown";
}

struct Chunk {
    std::string codec = "opus";
    std::vector<CompressedFrame> frames;
    int64_t timestampMs = 0;
    FlushReason reason = FlushReason::Timer;
    size_t totalBytes = 0;
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
};

} // namespace meetcapture
