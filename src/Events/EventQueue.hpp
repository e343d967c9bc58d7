#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

#include "EventSink.hpp"

namespace meetcapture {

// Thread-safe channel of recording events. Producers never block; the
// consumer pops in arrival order.
class EventQueue : public IRecordingEventSink {
public:
    void OnChunk(const Chunk& chunk) override { Push(chunk); }
    void OnError(const ErrorEvent& error) override { Push(error); }
    void OnComplete(size_t totalChunks) override { Push(CompleteEvent{totalChunks}); }

    // Waits up to timeout for an event. Returns false if none arrived.
    template <typename Duration>
    bool Pop(RecordingEvent& event, Duration timeout) {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_cv.wait_for(lock, timeout, [this] { return !_events.empty(); })) {
            return false;
        }
        event = std::move(_events.front());
        _events.pop_front();
        return true;
    }

    std::vector<RecordingEvent> Drain() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<RecordingEvent> out(std::make_move_iterator(_events.begin()),
                                        std::make_move_iterator(_events.end()));
        _events.clear();
        return out;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _events.size();
    }

private:
    void Push(RecordingEvent event) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _events.push_back(std::move(event));
        }
        _cv.notify_one();
    }

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<RecordingEvent> _events;
};

} // namespace meetcapture
