#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include <sndfile.h>

#include "../Events/EventSink.hpp"
#include "../common/RecorderConfig.hpp"
#include "IEncoderStrategy.hpp"

namespace meetcapture {

// In-memory target for libsndfile's virtual IO.
class MemoryFile {
public:
    MemoryFile();

    SF_VIRTUAL_IO* VirtualIo() { return &_io; }
    std::vector<uint8_t> Take();
    size_t Size() const { return _data.size(); }

private:
    static sf_count_t GetLength(void* user);
    static sf_count_t Seek(sf_count_t offset, int whence, void* user);
    static sf_count_t Read(void* ptr, sf_count_t count, void* user);
    static sf_count_t Write(const void* ptr, sf_count_t count, void* user);
    static sf_count_t Tell(void* user);

    SF_VIRTUAL_IO _io;
    std::vector<uint8_t> _data;
    sf_count_t _position;
};

struct SndfileCloser {
    void operator()(SNDFILE* file) const noexcept;
};

// Fallback path: complete Ogg/Opus files, one per slice of audio, each
// forwarded unmodified as a single-frame chunk with reason "legacy".
class ContainerRecorderStrategy : public IEncoderStrategy {
public:
    ContainerRecorderStrategy(const EncoderConfig& encoder, StreamFormat input, IRecordingEventSink* sink);
    ~ContainerRecorderStrategy() override;

    EncoderPath Path() const override { return EncoderPath::Container; }

    void Submit(const AudioFrame& frame) override;
    void Pause() override;
    void Resume() override;
    void Flush() override;
    size_t Stop() override;
    size_t ChunkCount() const override;

    static bool IsSupported(unsigned int sampleRate, unsigned int channels);

private:
    void OpenSliceLocked();
    void CloseSliceLocked();

    EncoderConfig _config;
    StreamFormat _input;
    IRecordingEventSink* _sink;
    sf_count_t _sliceFrames;

    mutable std::mutex _mutex;
    std::unique_ptr<MemoryFile> _memory;
    std::unique_ptr<SNDFILE, SndfileCloser> _file;
    sf_count_t _framesInSlice;
    int64_t _sliceStartUs;
    size_t _chunkCount;
    bool _paused;
    bool _stopped;
};

} // namespace meetcapture
