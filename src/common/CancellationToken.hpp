#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace meetcapture {

// Cooperative cancellation flag shared between a loop and whoever stops it.
// Waiters blocked on WaitFor() are woken up by Cancel().
class CancellationToken {
public:
    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _cancelled = true;
        }
        _cv.notify_all();
    }

    bool IsCancelled() const { return _cancelled.load(); }

    // Returns true if cancelled before the timeout expired.
    template <typename Duration>
    bool WaitFor(Duration timeout) {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cv.wait_for(lock, timeout, [this] { return _cancelled.load(); });
    }

private:
    std::atomic<bool> _cancelled{false};
    std::mutex _mutex;
    std::condition_variable _cv;
};

} // namespace meetcapture
