#pragma once

#include "Capture/ICaptureBackend.hpp"
#include "Encoder/IEncoderStrategy.hpp"
#include "Events/EventSink.hpp"
#include "common/RecorderError.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace test_utils {

using namespace meetcapture;

class TestAudioGenerator {
public:
    TestAudioGenerator(unsigned int sampleRate, unsigned int channels, double frequency = 440.0)
        : _sampleRate(sampleRate)
        , _channels(channels)
        , _frequency(frequency)
        , _phase(0.0)
        , _amplitude(0.3)
    {}

    std::vector<int16_t> Generate(size_t frames) {
        const double phaseIncrement = 2.0 * M_PI * _frequency / _sampleRate;
        std::vector<int16_t> out(frames * _channels);
        for (size_t i = 0; i < frames; ++i) {
            const auto sample = static_cast<int16_t>(std::sin(_phase) * _amplitude * 32767.0);
            for (unsigned int c = 0; c < _channels; ++c) {
                out[i * _channels + c] = sample;
            }
            _phase += phaseIncrement;
            if (_phase > 2.0 * M_PI) {
                _phase -= 2.0 * M_PI;
            }
        }
        return out;
    }

    void SetAmplitude(double amplitude) { _amplitude = std::max(0.0, std::min(1.0, amplitude)); }

private:
    unsigned int _sampleRate;
    unsigned int _channels;
    double _frequency;
    double _phase;
    double _amplitude;
};

// In-memory capture track. Emit() plays the role of the device thread.
class FakeTrack : public ICaptureTrack {
public:
    FakeTrack(TrackKind kind, std::string label, unsigned int sampleRate = 16000, unsigned int channels = 2)
        : _kind(kind), _label(std::move(label)), _sampleRate(sampleRate), _channels(channels) {}

    TrackKind Kind() const override { return _kind; }
    std::string Label() const override { return _label; }
    unsigned int SampleRate() const override { return _sampleRate; }
    unsigned int Channels() const override { return _channels; }
    TrackState State() const override { return _state.load(); }

    void SetEnabled(bool enabled) override {
        _enabled = enabled;
        if (!enabled) {
            ++disableCalls;
        }
    }
    bool IsEnabled() const override { return _enabled.load(); }

    void SetOnBufferCallback(BufferCallback cb) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _onBuffer = std::move(cb);
    }
    void SetOnEndedCallback(EndedCallback cb) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _onEnded = std::move(cb);
    }

    void Stop() override {
        ++stopCalls;
        std::lock_guard<std::mutex> lock(_mutex);
        callbacksSetAtStop = static_cast<bool>(_onBuffer) || static_cast<bool>(_onEnded);
        const bool wasLive = _state.exchange(TrackState::Ended) == TrackState::Live;
        // Devices may report an error while their stream is being stopped.
        if (endOnStop && wasLive && _onEnded) {
            _onEnded("stream stopped");
        }
    }

    void Emit(const std::vector<int16_t>& samples) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_onBuffer && _enabled && _state == TrackState::Live) {
            _onBuffer(samples.data(), samples.size() / _channels);
        }
    }

    // Simulates the device disappearing.
    void Lose(const std::string& reason) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state.exchange(TrackState::Ended) == TrackState::Ended) {
            return;
        }
        if (_onEnded) {
            _onEnded(reason);
        }
    }

    bool HasBufferCallback() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return static_cast<bool>(_onBuffer);
    }

    std::atomic<int> stopCalls{0};
    std::atomic<int> disableCalls{0};
    std::atomic<bool> endOnStop{false};
    std::atomic<bool> callbacksSetAtStop{false};

private:
    TrackKind _kind;
    std::string _label;
    unsigned int _sampleRate;
    unsigned int _channels;
    std::atomic<TrackState> _state{TrackState::Live};
    std::atomic<bool> _enabled{true};
    mutable std::mutex _mutex;
    BufferCallback _onBuffer;
    EndedCallback _onEnded;
};

class FakeBackend : public ICaptureBackend {
public:
    std::vector<std::shared_ptr<ICaptureTrack>> OpenInput(const CaptureConstraints& constraints) override {
        lastMicConstraints = constraints;
        if (micFailure) {
            throw RecorderError(*micFailure, "microphone refused");
        }
        mic = std::make_shared<FakeTrack>(TrackKind::Audio, "fake mic", micRate, micChannels);
        return {mic};
    }

    std::vector<std::shared_ptr<ICaptureTrack>> OpenLoopback(const CaptureConstraints& constraints) override {
        lastSystemConstraints = constraints;
        if (systemFailure) {
            throw RecorderError(*systemFailure, "loopback refused");
        }
        system = std::make_shared<FakeTrack>(TrackKind::Audio, "fake monitor", 16000, 2);
        std::vector<std::shared_ptr<ICaptureTrack>> tracks;
        if (withVideo) {
            video = std::make_shared<FakeTrack>(TrackKind::Video, "fake screen");
            tracks.push_back(video);
        }
        tracks.push_back(system);
        return tracks;
    }

    std::optional<ErrorCode> micFailure;
    std::optional<ErrorCode> systemFailure;
    bool withVideo = false;
    unsigned int micRate = 16000;
    unsigned int micChannels = 2;

    std::shared_ptr<FakeTrack> mic;
    std::shared_ptr<FakeTrack> system;
    std::shared_ptr<FakeTrack> video;
    CaptureConstraints lastMicConstraints;
    CaptureConstraints lastSystemConstraints;
};

class CollectingSink : public IRecordingEventSink {
public:
    void OnChunk(const Chunk& chunk) override {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _chunks.push_back(chunk);
        }
        _cv.notify_all();
    }
    void OnError(const ErrorEvent& error) override {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _errors.push_back(error);
        }
        _cv.notify_all();
    }
    void OnComplete(size_t totalChunks) override {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _completes.push_back(totalChunks);
        }
        _cv.notify_all();
    }

    std::vector<Chunk> Chunks() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _chunks;
    }
    std::vector<ErrorEvent> Errors() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _errors;
    }
    std::vector<size_t> Completes() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _completes;
    }

    bool HasError(ErrorCode code) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return std::any_of(_errors.begin(), _errors.end(), [code](const ErrorEvent& e) { return e.code == code; });
    }

    bool WaitForChunks(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cv.wait_for(lock, timeout, [&] { return _chunks.size() >= count; });
    }

    bool WaitForError(ErrorCode code, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cv.wait_for(lock, timeout, [&] {
            return std::any_of(_errors.begin(), _errors.end(), [code](const ErrorEvent& e) { return e.code == code; });
        });
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::vector<Chunk> _chunks;
    std::vector<ErrorEvent> _errors;
    std::vector<size_t> _completes;
};

// Encoder strategy that records what it is given. Every submitted frame
// becomes one pending compressed frame; Stop() emits them as one chunk.
class RecordingStrategy : public IEncoderStrategy {
public:
    explicit RecordingStrategy(IRecordingEventSink* sink) : _sink(sink) {}

    EncoderPath Path() const override { return EncoderPath::Frame; }

    void Submit(const AudioFrame& frame) override {
        ++submitted;
        if (failEvery > 0 && submitted % failEvery == 0) {
            throw RecorderError(ErrorCode::EncodeFrameFailed, "synthetic encode failure");
        }
        std::lock_guard<std::mutex> lock(_mutex);
        CompressedFrame out;
        out.data.assign(4, static_cast<uint8_t>(frame.samples.empty() ? 0 : 1));
        out.timestampUs = frame.timestampUs;
        _pending.push_back(std::move(out));
    }

    void Pause() override { ++pauses; }
    void Resume() override { ++resumes; }
    void Flush() override { ++flushes; }

    size_t Stop() override {
        ++stops;
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_pending.empty()) {
            Chunk chunk;
            chunk.reason = FlushReason::Stop;
            chunk.frames.swap(_pending);
            for (const auto& f : chunk.frames) {
                chunk.totalBytes += f.Size();
            }
            ++_chunks;
            if (_sink) {
                _sink->OnChunk(chunk);
            }
        }
        return _chunks;
    }

    size_t ChunkCount() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _chunks;
    }

    std::atomic<int> submitted{0};
    std::atomic<int> pauses{0};
    std::atomic<int> resumes{0};
    std::atomic<int> flushes{0};
    std::atomic<int> stops{0};
    int failEvery = 0;

private:
    IRecordingEventSink* _sink;
    mutable std::mutex _mutex;
    std::vector<CompressedFrame> _pending;
    size_t _chunks = 0;
};

inline CompressedFrame MakeCompressedFrame(size_t bytes, uint8_t fill = 0xAB) {
    CompressedFrame frame;
    frame.data.assign(bytes, fill);
    return frame;
}

inline std::vector<int16_t> ConstantSamples(size_t frames, unsigned int channels, int16_t value) {
    return std::vector<int16_t>(frames * channels, value);
}

} // namespace test_utils
