#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "../Capture/AudioSource.hpp"
#include "../Capture/ICaptureBackend.hpp"
#include "../Encoder/EncodingEngine.hpp"
#include "../Events/EventSink.hpp"
#include "../Mixer/AudioMixer.hpp"
#include "../common/RecorderConfig.hpp"
#include "RecordingStateMachine.hpp"

namespace meetcapture {

struct StartOptions {
    bool includeMic = true;
    bool includeSystem = true;
    IRecordingEventSink* sink = nullptr;
};

struct StartResult {
    bool success = false;
    bool hasMic = false;
    bool hasSystem = false;
    EncoderPath path = EncoderPath::Frame;
};

struct RecorderStatus {
    bool recording = false;
    bool paused = false;
    bool hasMic = false;
    bool hasSystem = false;
    RecordingState state = RecordingState::Idle;
};

// Owns one recording session at a time: acquisition, mixing and encoding.
// Every exit path releases the capture devices.
class AudioRecorder {
public:
    AudioRecorder(std::shared_ptr<ICaptureBackend> backend, const RecorderConfig& config);
    AudioRecorder(std::shared_ptr<ICaptureBackend> backend, const RecorderConfig& config,
                  EncodingEngine::StrategyFactory strategyFactory);
    ~AudioRecorder();

    AudioRecorder(const AudioRecorder&) = delete;
    AudioRecorder& operator=(const AudioRecorder&) = delete;

    // Throws RecorderError(AlreadyActive) unless idle. Any other failure
    // releases what was acquired and rethrows; the recorder stays idle.
    StartResult Start(const StartOptions& options);

    bool Pause();
    bool Resume();

    // Flushes and emits the complete event, then releases everything.
    // Safe in any state and idempotent.
    void Stop();

    // Releases everything without flushing or emitting.
    void ForceCleanup();

    RecorderStatus GetStatus() const;

private:
    struct Session {
        IRecordingEventSink* sink = nullptr;
        std::vector<AudioSource> sources;
        std::unique_ptr<AudioMixer> mixer;
        std::shared_ptr<MixedStream> stream;
        std::unique_ptr<EncodingEngine> engine;
        bool hasMic = false;
        bool hasSystem = false;
    };

    void Cleanup(Session& session, bool flush);

    std::shared_ptr<ICaptureBackend> _backend;
    RecorderConfig _config;
    EncodingEngine::StrategyFactory _strategyFactory;

    // Serializes Start/Pause/Resume/Stop. Components run and emit events
    // under this lock only, so sinks may call GetStatus() from any thread.
    std::mutex _lifecycleMutex;
    // Guards the state and the session pointer.
    mutable std::mutex _mutex;
    RecordingStateMachine _state;
    std::unique_ptr<Session> _session;
};

} // namespace meetcapture
