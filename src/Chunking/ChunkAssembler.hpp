#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include "../Events/EventSink.hpp"
#include "../common/RecorderConfig.hpp"
#include "../common/Types.hpp"
#include "FlushTimer.hpp"

namespace meetcapture {

// Groups compressed frames into chunks. A chunk is emitted when the pending
// bytes reach the size threshold, when the flush interval elapses after the
// first frame of a batch, or on an explicit flush. Emission happens under the
// assembler lock, so chunks reach the sink in order and never interleave.
class ChunkAssembler {
public:
    ChunkAssembler(const ChunkingConfig& config, StreamFormat format, IRecordingEventSink* sink);
    ~ChunkAssembler();

    ChunkAssembler(const ChunkAssembler&) = delete;
    ChunkAssembler& operator=(const ChunkAssembler&) = delete;

    // Returns false if the frame was rejected (paused or stopped).
    bool Submit(CompressedFrame frame);

    // Emits the pending frames as one chunk. No-op on an empty buffer.
    bool Flush(FlushReason reason);

    void Pause();
    void Resume();
    // Final flush; further frames are rejected and the timer is shut down.
    void Stop();

    bool IsPaused() const;
    size_t PendingBytes() const;
    size_t PendingFrames() const;
    size_t ChunkCount() const;

private:
    bool FlushLocked(FlushReason reason);
    void ScheduleTimerLocked();
    void OnTimer(uint64_t generation);

    ChunkingConfig _config;
    StreamFormat _format;
    IRecordingEventSink* _sink;

    mutable std::mutex _mutex;
    std::vector<CompressedFrame> _pending;
    size_t _pendingBytes;
    size_t _chunkCount;
    uint64_t _generation;
    bool _paused;
    bool _stopped;

    FlushTimer _timer;
};

} // namespace meetcapture
