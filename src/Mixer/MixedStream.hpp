#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../common/CancellationToken.hpp"
#include "../common/Types.hpp"

namespace meetcapture {

enum class ReadStatus {
    Frame,
    Timeout,
    Cancelled,
    Ended,
    Failed
};

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::unique_ptr<AudioFrame> frame;
    std::string error;
};

// Output track of the mixer. Frames are queued until a reader pulls them;
// when the queue is full the oldest frame is dropped so a stalled reader
// never grows memory without bound.
class MediaTrack {
public:
    MediaTrack(StreamFormat format, size_t maxQueuedFrames);

    StreamFormat Format() const { return _format; }
    bool IsLive() const;

    void Push(std::unique_ptr<AudioFrame> frame);

    // Blocks until a frame is available, the track ends or fails, the
    // token is cancelled, or the timeout expires. Queued frames are still
    // delivered after End(); Fail() takes effect immediately.
    ReadResult Read(std::chrono::milliseconds timeout, const CancellationToken& token);

    void End();
    void Fail(const std::string& error);
    // Wakes blocked readers so they re-check their cancellation token.
    void WakeReaders();

    size_t QueuedFrames() const;
    size_t DroppedFrames() const;

private:
    StreamFormat _format;
    size_t _maxQueuedFrames;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<std::unique_ptr<AudioFrame>> _frames;
    bool _ended;
    bool _failed;
    std::string _error;
    size_t _dropped;
};

// The single mixed destination every downstream consumer reads from.
class MixedStream {
public:
    MixedStream(StreamFormat format, size_t maxQueuedFrames);

    StreamFormat Format() const { return _format; }
    const std::vector<std::shared_ptr<MediaTrack>>& Tracks() const { return _tracks; }
    std::shared_ptr<MediaTrack> FirstLiveTrack() const;

private:
    StreamFormat _format;
    std::vector<std::shared_ptr<MediaTrack>> _tracks;
};

} // namespace meetcapture
