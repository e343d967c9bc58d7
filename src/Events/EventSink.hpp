#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>

#include "../common/RecorderError.hpp"
#include "../common/Types.hpp"

namespace meetcapture {

struct ErrorEvent {
    ErrorCode code;
    std::string message;
};

struct CompleteEvent {
    size_t totalChunks = 0;
};

using RecordingEvent = std::variant<Chunk, ErrorEvent, CompleteEvent>;

// Receives everything a recording session produces. Called from capture,
// encoder and timer threads; implementations must be thread-safe. They may
// query AudioRecorder::GetStatus() but must not start, pause, resume or stop
// the recorder that feeds them.
class IRecordingEventSink {
public:
    virtual ~IRecordingEventSink() = default;

    virtual void OnChunk(const Chunk& chunk) = 0;
    virtual void OnError(const ErrorEvent& error) = 0;
    virtual void OnComplete(size_t totalChunks) = 0;
};

// Adapts plain callbacks. Unset callbacks are ignored.
class CallbackEventSink : public IRecordingEventSink {
public:
    using ChunkCallback = std::function<void(const Chunk&)>;
    using ErrorCallback = std::function<void(const ErrorEvent&)>;
    using CompleteCallback = std::function<void(size_t)>;

    CallbackEventSink(ChunkCallback onChunk, ErrorCallback onError, CompleteCallback onComplete)
        : _onChunk(std::move(onChunk))
        , _onError(std::move(onError))
        , _onComplete(std::move(onComplete)) {}

    void OnChunk(const Chunk& chunk) override {
        if (_onChunk) _onChunk(chunk);
    }
    void OnError(const ErrorEvent& error) override {
        if (_onError) _onError(error);
    }
    void OnComplete(size_t totalChunks) override {
        if (_onComplete) _onComplete(totalChunks);
    }

private:
    ChunkCallback _onChunk;
    ErrorCallback _onError;
    CompleteCallback _onComplete;
};

inline void ReportError(IRecordingEventSink* sink, ErrorCode code, const std::string& message) {
    if (sink) {
        sink->OnError(ErrorEvent{code, message});
    }
}

} // namespace meetcapture
