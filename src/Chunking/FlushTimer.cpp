#include "FlushTimer.hpp"
#include "../common/debug_log.hpp"

#include <exception>

namespace meetcapture {

FlushTimer::FlushTimer()
    : _scheduled(false)
    , _shutdown(false) {
    _thread = std::make_unique<std::thread>(&FlushTimer::TimerThread, this);
}

FlushTimer::~FlushTimer() {
    Shutdown();
}

void FlushTimer::Schedule(std::chrono::milliseconds delay, Callback callback) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_shutdown) {
            return;
        }
        _deadline = std::chrono::steady_clock::now() + delay;
        _callback = std::move(callback);
        _scheduled = true;
    }
    _cv.notify_all();
}

void FlushTimer::Cancel() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _scheduled = false;
        _callback = nullptr;
    }
    _cv.notify_all();
}

bool FlushTimer::IsScheduled() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _scheduled;
}

void FlushTimer::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _shutdown = true;
        _scheduled = false;
        _callback = nullptr;
    }
    _cv.notify_all();
    if (_thread && _thread->joinable()) {
        _thread->join();
    }
}

void FlushTimer::TimerThread() {
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_shutdown) {
        if (!_scheduled) {
            _cv.wait(lock, [this] { return _shutdown || _scheduled; });
            continue;
        }

        const auto deadline = _deadline;
        if (_cv.wait_until(lock, deadline, [this, deadline] {
                return _shutdown || !_scheduled || _deadline != deadline;
            })) {
            // Cancelled, rescheduled or shutting down.
            continue;
        }

        Callback callback = std::move(_callback);
        _callback = nullptr;
        _scheduled = false;
        lock.unlock();
        if (callback) {
            try {
                callback();
            } catch (const std::exception& e) {
                MEETCAPTURE_ERROR_LOG("Flush timer callback failed: " << e.what());
            }
        }
        lock.lock();
    }
}

} // namespace meetcapture
