#include "ChunkAssembler.hpp"
#include "../common/debug_log.hpp"

#include <chrono>
#include <exception>

namespace meetcapture {

namespace {
int64_t NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}
} // namespace

ChunkAssembler::ChunkAssembler(const ChunkingConfig& config, StreamFormat format, IRecordingEventSink* sink)
    : _config(config)
    , _format(format)
    , _sink(sink)
    , _pendingBytes(0)
    , _chunkCount(0)
    , _generation(0)
    , _paused(false)
    , _stopped(false) {}

ChunkAssembler::~ChunkAssembler() {
    _timer.Shutdown();
}

bool ChunkAssembler::Submit(CompressedFrame frame) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_paused || _stopped) {
        return false;
    }

    const bool firstOfBatch = _pending.empty();
    _pendingBytes += frame.Size();
    _pending.push_back(std::move(frame));

    if (_pendingBytes >= _config.maxChunkBytes) {
        FlushLocked(FlushReason::Size);
    } else if (firstOfBatch) {
        ScheduleTimerLocked();
    }
    return true;
}

bool ChunkAssembler::Flush(FlushReason reason) {
    std::lock_guard<std::mutex> lock(_mutex);
    return FlushLocked(reason);
}

void ChunkAssembler::Pause() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_paused || _stopped) {
        return;
    }
    FlushLocked(FlushReason::Pause);
    _paused = true;
}

void ChunkAssembler::Resume() {
    std::lock_guard<std::mutex> lock(_mutex);
    _paused = false;
}

void ChunkAssembler::Stop() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopped) {
            return;
        }
        FlushLocked(FlushReason::Stop);
        _stopped = true;
    }
    _timer.Shutdown();
}

bool ChunkAssembler::IsPaused() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _paused;
}

size_t ChunkAssembler::PendingBytes() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pendingBytes;
}

size_t ChunkAssembler::PendingFrames() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending.size();
}

size_t ChunkAssembler::ChunkCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _chunkCount;
}

bool ChunkAssembler::FlushLocked(FlushReason reason) {
    // Any timer armed for this batch is now stale.
    ++_generation;
    _timer.Cancel();

    if (_pending.empty()) {
        return false;
    }

    Chunk chunk;
    chunk.frames.swap(_pending);
    chunk.totalBytes = _pendingBytes;
    chunk.timestampMs = NowMs();
    chunk.reason = reason;
    chunk.sampleRate = _format.sampleRate;
    chunk.channels = _format.channels;
    _pendingBytes = 0;
    ++_chunkCount;

    MEETCAPTURE_LOG("Chunk #" << _chunkCount << " flushed (" << ToString(reason) << "): " << chunk.frames.size()
                              << " frames, " << chunk.totalBytes << " bytes" << MEETCAPTURE_LOG_ENDL);

    if (_sink) {
        try {
            _sink->OnChunk(chunk);
        } catch (const std::exception& e) {
            MEETCAPTURE_ERROR_LOG("Chunk sink failed: " << e.what());
        }
    }
    return true;
}

void ChunkAssembler::ScheduleTimerLocked() {
    const uint64_t generation = _generation;
    _timer.Schedule(std::chrono::milliseconds(_config.flushIntervalMs), [this, generation] { OnTimer(generation); });
}

void ChunkAssembler::OnTimer(uint64_t generation) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (generation != _generation || _stopped) {
        return;
    }
    FlushLocked(FlushReason::Timer);
}

} // namespace meetcapture
