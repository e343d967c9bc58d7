#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "../Events/EventSink.hpp"
#include "../Mixer/MixedStream.hpp"
#include "../common/CancellationToken.hpp"
#include "../common/RecorderConfig.hpp"
#include "IEncoderStrategy.hpp"

namespace meetcapture {

// Pulls frames from the mixed stream on its own thread and drives the
// selected encoder strategy. One engine serves exactly one session.
class EncodingEngine {
public:
    using StrategyFactory = std::function<std::unique_ptr<IEncoderStrategy>(StreamFormat, IRecordingEventSink*)>;

    EncodingEngine(const RecorderConfig& config, IRecordingEventSink* sink);
    // The factory replaces the capability probe.
    EncodingEngine(const RecorderConfig& config, IRecordingEventSink* sink, StrategyFactory factory);
    ~EncodingEngine();

    EncodingEngine(const EncodingEngine&) = delete;
    EncodingEngine& operator=(const EncodingEngine&) = delete;

    // Throws RecorderError(AlreadyActive) on a second call,
    // RecorderError(EncoderUnavailable) when no encoder can be created.
    EncoderPath Start(const MixedStream& stream);

    void Pause();
    void Resume();

    // Cancels the reader, flushes everything and emits the complete event.
    // Only the first call has any effect.
    void Stop();

    // Cancels the reader without flushing or emitting anything.
    void Abort();

    bool IsRunning() const;
    bool IsPaused() const { return _paused.load(); }
    EncoderPath Path() const;
    size_t ChunkCount() const;

private:
    void ReadLoop();
    void JoinReader();

    RecorderConfig _config;
    IRecordingEventSink* _sink;
    StrategyFactory _factory;

    std::mutex _lifecycleMutex;
    std::unique_ptr<IEncoderStrategy> _strategy;
    std::shared_ptr<MediaTrack> _track;
    CancellationToken _token;
    std::unique_ptr<std::thread> _readerThread;
    std::atomic<bool> _started;
    std::atomic<bool> _finished;
    std::atomic<bool> _paused;
    std::atomic<bool> _readerDone;
};

} // namespace meetcapture
