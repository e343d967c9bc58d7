#pragma once

#include <cstddef>

#include "../common/Types.hpp"

namespace meetcapture {

enum class EncoderPath {
    Frame,
    Container
};

inline const char* ToString(EncoderPath path) {
    return path == EncoderPath::Frame ? "frame" : "container";
}

// One way of turning PCM frames into chunks. Selected once per session by
// the encoding engine and driven from its read loop.
class IEncoderStrategy {
public:
    virtual ~IEncoderStrategy() = default;

    virtual EncoderPath Path() const = 0;

    // Throws RecorderError(EncodeFrameFailed) when the frame could not be
    // encoded. The strategy stays usable afterwards.
    virtual void Submit(const AudioFrame& frame) = 0;

    virtual void Pause() = 0;
    virtual void Resume() = 0;

    // Pushes codec-buffered audio downstream without closing the session.
    virtual void Flush() = 0;

    // Final flush. Returns the total number of chunks emitted.
    virtual size_t Stop() = 0;

    virtual size_t ChunkCount() const = 0;
};

} // namespace meetcapture
