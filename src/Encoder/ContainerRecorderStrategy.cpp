#include "ContainerRecorderStrategy.hpp"
#include "../common/RecorderError.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <exception>

namespace meetcapture {

namespace {
constexpr int kOggOpusFormat = SF_FORMAT_OGG | SF_FORMAT_OPUS;

// libsndfile's Opus writer maps compression level 0..1 linearly onto a
// per-channel bitrate range of 256 kbps down to 6 kbps.
double CompressionLevelFor(unsigned int bitrate, unsigned int channels) {
    const double perChannel = static_cast<double>(bitrate) / std::max(1u, channels);
    const double level = 1.0 - (perChannel - 6000.0) / (256000.0 - 6000.0);
    return std::min(1.0, std::max(0.0, level));
}
} // namespace

MemoryFile::MemoryFile()
    : _position(0) {
    _io.get_filelen = &MemoryFile::GetLength;
    _io.seek = &MemoryFile::Seek;
    _io.read = &MemoryFile::Read;
    _io.write = &MemoryFile::Write;
    _io.tell = &MemoryFile::Tell;
}

std::vector<uint8_t> MemoryFile::Take() {
    std::vector<uint8_t> out;
    out.swap(_data);
    _position = 0;
    return out;
}

sf_count_t MemoryFile::GetLength(void* user) {
    return static_cast<sf_count_t>(static_cast<MemoryFile*>(user)->_data.size());
}

sf_count_t MemoryFile::Seek(sf_count_t offset, int whence, void* user) {
    auto* self = static_cast<MemoryFile*>(user);
    sf_count_t target = offset;
    switch (whence) {
        case SEEK_CUR: target = self->_position + offset; break;
        case SEEK_END: target = static_cast<sf_count_t>(self->_data.size()) + offset; break;
        default: break;
    }
    if (target < 0) {
        return -1;
    }
    self->_position = target;
    return self->_position;
}

sf_count_t MemoryFile::Read(void* ptr, sf_count_t count, void* user) {
    auto* self = static_cast<MemoryFile*>(user);
    const sf_count_t size = static_cast<sf_count_t>(self->_data.size());
    if (self->_position >= size || count <= 0) {
        return 0;
    }
    const sf_count_t n = std::min(count, size - self->_position);
    std::memcpy(ptr, self->_data.data() + self->_position, static_cast<size_t>(n));
    self->_position += n;
    return n;
}

sf_count_t MemoryFile::Write(const void* ptr, sf_count_t count, void* user) {
    auto* self = static_cast<MemoryFile*>(user);
    if (count <= 0) {
        return 0;
    }
    const size_t end = static_cast<size_t>(self->_position + count);
    if (end > self->_data.size()) {
        self->_data.resize(end);
    }
    std::memcpy(self->_data.data() + self->_position, ptr, static_cast<size_t>(count));
    self->_position += count;
    return count;
}

sf_count_t MemoryFile::Tell(void* user) {
    return static_cast<MemoryFile*>(user)->_position;
}

void SndfileCloser::operator()(SNDFILE* file) const noexcept {
    if (file) {
        sf_close(file);
    }
}

ContainerRecorderStrategy::ContainerRecorderStrategy(const EncoderConfig& encoder, StreamFormat input,
                                                     IRecordingEventSink* sink)
    : _config(encoder)
    , _input(input)
    , _sink(sink)
    , _sliceFrames(static_cast<sf_count_t>(input.sampleRate) * encoder.containerSliceMs / 1000)
    , _framesInSlice(0)
    , _sliceStartUs(0)
    , _chunkCount(0)
    , _paused(false)
    , _stopped(false) {
    if (!IsSupported(input.sampleRate, input.channels)) {
        throw RecorderError(ErrorCode::EncoderUnavailable, "Ogg/Opus container not supported for " +
                                                               std::to_string(input.sampleRate) + " Hz, " +
                                                               std::to_string(input.channels) + " channels");
    }
    if (_sliceFrames <= 0) {
        throw RecorderError(ErrorCode::InvalidConfig, "Container slice must be positive");
    }
    std::lock_guard<std::mutex> lock(_mutex);
    OpenSliceLocked();
}

ContainerRecorderStrategy::~ContainerRecorderStrategy() {
    std::lock_guard<std::mutex> lock(_mutex);
    _file.reset();
}

bool ContainerRecorderStrategy::IsSupported(unsigned int sampleRate, unsigned int channels) {
    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    info.samplerate = static_cast<int>(sampleRate);
    info.channels = static_cast<int>(channels);
    info.format = kOggOpusFormat;
    return sf_format_check(&info) == SF_TRUE;
}

void ContainerRecorderStrategy::OpenSliceLocked() {
    _memory = std::make_unique<MemoryFile>();

    SF_INFO info;
    std::memset(&info, 0, sizeof(info));
    info.samplerate = static_cast<int>(_input.sampleRate);
    info.channels = static_cast<int>(_input.channels);
    info.format = kOggOpusFormat;

    SNDFILE* file = sf_open_virtual(_memory->VirtualIo(), SFM_WRITE, &info, _memory.get());
    if (!file) {
        throw RecorderError(ErrorCode::EncoderUnavailable,
                            std::string("Could not open Ogg/Opus writer: ") + sf_strerror(nullptr));
    }
    _file.reset(file);

    int mode = SF_BITRATE_MODE_CONSTANT;
    if (sf_command(file, SFC_SET_BITRATE_MODE, &mode, sizeof(mode)) != SF_TRUE) {
        MEETCAPTURE_LOG("Constant bitrate mode not available, using encoder default" << MEETCAPTURE_LOG_ENDL);
    }
    double level = CompressionLevelFor(_config.containerBitrate, _input.channels);
    if (sf_command(file, SFC_SET_COMPRESSION_LEVEL, &level, sizeof(level)) != SF_TRUE) {
        MEETCAPTURE_LOG("Could not set compression level " << level << MEETCAPTURE_LOG_ENDL);
    }

    _framesInSlice = 0;
}

void ContainerRecorderStrategy::CloseSliceLocked() {
    if (!_file) {
        return;
    }
    const bool hasAudio = _framesInSlice > 0;
    // Closing finalizes the container into the memory buffer.
    _file.reset();
    std::vector<uint8_t> bytes = _memory->Take();
    _memory.reset();
    _framesInSlice = 0;

    if (!hasAudio || bytes.empty()) {
        return;
    }

    Chunk chunk;
    chunk.reason = FlushReason::Legacy;
    chunk.sampleRate = _input.sampleRate;
    chunk.channels = _input.channels;
    chunk.totalBytes = bytes.size();
    chunk.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    CompressedFrame slice;
    slice.data = std::move(bytes);
    slice.timestampUs = _sliceStartUs;
    chunk.frames.push_back(std::move(slice));
    ++_chunkCount;

    MEETCAPTURE_LOG("Container slice #" << _chunkCount << ": " << chunk.totalBytes << " bytes" << MEETCAPTURE_LOG_ENDL);

    if (_sink) {
        try {
            _sink->OnChunk(chunk);
        } catch (const std::exception& e) {
            MEETCAPTURE_ERROR_LOG("Chunk sink failed: " << e.what());
        }
    }
}

void ContainerRecorderStrategy::Submit(const AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopped || _paused) {
        return;
    }
    if (frame.channels != _input.channels) {
        throw RecorderError(ErrorCode::EncodeFrameFailed,
                            "Unexpected channel count " + std::to_string(frame.channels));
    }

    const int16_t* samples = frame.samples.data();
    sf_count_t remaining = static_cast<sf_count_t>(frame.FrameCount());
    int64_t timestampUs = frame.timestampUs;
    while (remaining > 0) {
        if (!_file) {
            OpenSliceLocked();
        }
        if (_framesInSlice == 0) {
            _sliceStartUs = timestampUs;
        }

        const sf_count_t n = std::min(remaining, _sliceFrames - _framesInSlice);
        const sf_count_t written = sf_writef_short(_file.get(), samples, n);
        if (written != n) {
            throw RecorderError(ErrorCode::EncodeFrameFailed,
                                std::string("Container write failed: ") + sf_strerror(_file.get()));
        }
        _framesInSlice += n;
        samples += n * _input.channels;
        remaining -= n;
        timestampUs += n * 1000000 / _input.sampleRate;

        if (_framesInSlice >= _sliceFrames) {
            CloseSliceLocked();
        }
    }
}

void ContainerRecorderStrategy::Pause() {
    std::lock_guard<std::mutex> lock(_mutex);
    _paused = true;
}

void ContainerRecorderStrategy::Resume() {
    std::lock_guard<std::mutex> lock(_mutex);
    _paused = false;
}

void ContainerRecorderStrategy::Flush() {
    // The container keeps its own buffering until the slice closes.
}

size_t ContainerRecorderStrategy::Stop() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_stopped) {
        _stopped = true;
        CloseSliceLocked();
    }
    return _chunkCount;
}

size_t ContainerRecorderStrategy::ChunkCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _chunkCount;
}

} // namespace meetcapture
