#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace meetcapture {

// Single-shot timer on its own thread. Scheduling again replaces any pending
// deadline. The callback runs on the timer thread without the timer lock held.
class FlushTimer {
public:
    using Callback = std::function<void()>;

    FlushTimer();
    ~FlushTimer();

    FlushTimer(const FlushTimer&) = delete;
    FlushTimer& operator=(const FlushTimer&) = delete;

    void Schedule(std::chrono::milliseconds delay, Callback callback);
    void Cancel();
    bool IsScheduled() const;

    // Stops the thread. Must not be called from inside a callback.
    void Shutdown();

private:
    void TimerThread();

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::unique_ptr<std::thread> _thread;
    std::chrono::steady_clock::time_point _deadline;
    Callback _callback;
    bool _scheduled;
    bool _shutdown;
};

} // namespace meetcapture
