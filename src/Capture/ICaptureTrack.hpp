#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace meetcapture {

enum class TrackKind {
    Audio,
    Video
};

enum class TrackState {
    Live,
    Ended
};

// A live capture track handed out by a capture backend.
class ICaptureTrack {
public:
    // (interleaved samples, frame count). Called from the device thread.
    using BufferCallback = std::function<void(const int16_t*, size_t)>;
    // Called once when the track ends without Stop() (device lost).
    using EndedCallback = std::function<void(const std::string&)>;

    virtual ~ICaptureTrack() = default;

    virtual TrackKind Kind() const = 0;
    virtual std::string Label() const = 0;
    virtual unsigned int SampleRate() const = 0;
    virtual unsigned int Channels() const = 0;

    virtual TrackState State() const = 0;
    bool IsLive() const { return State() == TrackState::Live; }

    // A disabled track keeps running but delivers no buffers.
    virtual void SetEnabled(bool enabled) = 0;
    virtual bool IsEnabled() const = 0;

    virtual void SetOnBufferCallback(BufferCallback cb) = 0;
    virtual void SetOnEndedCallback(EndedCallback cb) = 0;

    // Releases the device. Safe to call more than once and on ended tracks.
    virtual void Stop() = 0;
};

} // namespace meetcapture
