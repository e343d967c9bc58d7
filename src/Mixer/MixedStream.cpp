#include "MixedStream.hpp"

namespace meetcapture {

MediaTrack::MediaTrack(StreamFormat format, size_t maxQueuedFrames)
    : _format(format)
    , _maxQueuedFrames(maxQueuedFrames ? maxQueuedFrames : 1)
    , _ended(false)
    , _failed(false)
    , _dropped(0) {}

bool MediaTrack::IsLive() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return !_ended && !_failed;
}

void MediaTrack::Push(std::unique_ptr<AudioFrame> frame) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_ended || _failed || !frame) {
            return;
        }
        while (_frames.size() >= _maxQueuedFrames) {
            _frames.pop_front();
            ++_dropped;
        }
        _frames.push_back(std::move(frame));
    }
    _cv.notify_one();
}

ReadResult MediaTrack::Read(std::chrono::milliseconds timeout, const CancellationToken& token) {
    ReadResult result;
    std::unique_lock<std::mutex> lock(_mutex);

    _cv.wait_for(lock, timeout, [this, &token] {
        return token.IsCancelled() || _failed || _ended || !_frames.empty();
    });

    if (token.IsCancelled()) {
        result.status = ReadStatus::Cancelled;
    } else if (_failed) {
        result.status = ReadStatus::Failed;
        result.error = _error;
    } else if (!_frames.empty()) {
        result.status = ReadStatus::Frame;
        result.frame = std::move(_frames.front());
        _frames.pop_front();
    } else if (_ended) {
        result.status = ReadStatus::Ended;
    } else {
        result.status = ReadStatus::Timeout;
    }
    return result;
}

void MediaTrack::End() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _ended = true;
    }
    _cv.notify_all();
}

void MediaTrack::Fail(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_failed || _ended) {
            return;
        }
        _failed = true;
        _error = error;
        _frames.clear();
    }
    _cv.notify_all();
}

void MediaTrack::WakeReaders() {
    // Taking the lock orders the wake-up after any waiter's predicate check.
    { std::lock_guard<std::mutex> lock(_mutex); }
    _cv.notify_all();
}

size_t MediaTrack::QueuedFrames() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _frames.size();
}

size_t MediaTrack::DroppedFrames() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _dropped;
}

MixedStream::MixedStream(StreamFormat format, size_t maxQueuedFrames)
    : _format(format) {
    _tracks.push_back(std::make_shared<MediaTrack>(format, maxQueuedFrames));
}

std::shared_ptr<MediaTrack> MixedStream::FirstLiveTrack() const {
    for (const auto& track : _tracks) {
        if (track->IsLive()) {
            return track;
        }
    }
    return nullptr;
}

} // namespace meetcapture
