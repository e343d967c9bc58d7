#include "AudioRecorder.hpp"
#include "../Capture/SourceAcquirer.hpp"
#include "../common/RecorderError.hpp"
#include "../common/debug_log.hpp"

#include <exception>

namespace meetcapture {

AudioRecorder::AudioRecorder(std::shared_ptr<ICaptureBackend> backend, const RecorderConfig& config)
    : AudioRecorder(std::move(backend), config, nullptr) {}

AudioRecorder::AudioRecorder(std::shared_ptr<ICaptureBackend> backend, const RecorderConfig& config,
                             EncodingEngine::StrategyFactory strategyFactory)
    : _backend(std::move(backend))
    , _config(config)
    , _strategyFactory(std::move(strategyFactory)) {
    if (!_backend) {
        throw std::invalid_argument("AudioRecorder requires a capture backend");
    }
    Validate(_config);
}

AudioRecorder::~AudioRecorder() {
    ForceCleanup();
}

StartResult AudioRecorder::Start(const StartOptions& options) {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_state.CanStart()) {
            throw RecorderError(ErrorCode::AlreadyActive, "Recording already in progress");
        }
    }

    auto session = std::make_unique<Session>();
    session->sink = options.sink;
    StartResult result;

    try {
        SourceAcquirer acquirer(_backend, _config);
        AcquisitionResult acquired = acquirer.Acquire(options.includeMic, options.includeSystem, options.sink);
        session->hasMic = acquired.HasMic();
        session->hasSystem = acquired.HasSystem();
        session->sources = std::move(acquired.sources);

        session->mixer = std::make_unique<AudioMixer>(_config);
        session->stream = session->mixer->Mix(session->sources);

        session->engine = _strategyFactory
                              ? std::make_unique<EncodingEngine>(_config, options.sink, _strategyFactory)
                              : std::make_unique<EncodingEngine>(_config, options.sink);
        result.path = session->engine->Start(*session->stream);
    } catch (const std::exception& e) {
        MEETCAPTURE_ERROR_LOG("Failed to start recording: " << e.what());
        Cleanup(*session, false);
        throw;
    }

    result.success = true;
    result.hasMic = session->hasMic;
    result.hasSystem = session->hasSystem;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _session = std::move(session);
        _state.BeginRecording();
    }

    MEETCAPTURE_LOG("Recording started (mic=" << result.hasMic << ", system=" << result.hasSystem << ", "
                                              << ToString(result.path) << " path)" << MEETCAPTURE_LOG_ENDL);
    return result;
}

bool AudioRecorder::Pause() {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    EncodingEngine* engine = nullptr;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session || !_state.Pause()) {
            return false;
        }
        engine = _session->engine.get();
    }
    engine->Pause();
    MEETCAPTURE_LOG("Recording paused" << MEETCAPTURE_LOG_ENDL);
    return true;
}

bool AudioRecorder::Resume() {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    EncodingEngine* engine = nullptr;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session || !_state.Resume()) {
            return false;
        }
        engine = _session->engine.get();
    }
    engine->Resume();
    MEETCAPTURE_LOG("Recording resumed" << MEETCAPTURE_LOG_ENDL);
    return true;
}

void AudioRecorder::Stop() {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    std::unique_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        session = std::move(_session);
        if (_state.State() != RecordingState::Idle) {
            _state.Stop();
        }
    }
    if (session) {
        Cleanup(*session, true);
        MEETCAPTURE_LOG("Recording stopped" << MEETCAPTURE_LOG_ENDL);
    }
}

void AudioRecorder::ForceCleanup() {
    std::lock_guard<std::mutex> lifecycle(_lifecycleMutex);
    std::unique_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        session = std::move(_session);
        _state.Reset();
    }
    if (session) {
        Cleanup(*session, false);
        MEETCAPTURE_LOG("Recording force-cleaned" << MEETCAPTURE_LOG_ENDL);
    }
}

RecorderStatus AudioRecorder::GetStatus() const {
    std::lock_guard<std::mutex> lock(_mutex);
    RecorderStatus status;
    status.state = _state.State();
    status.recording = _state.IsActive();
    status.paused = _state.State() == RecordingState::Paused;
    if (_session) {
        status.hasMic = _session->hasMic;
        status.hasSystem = _session->hasSystem;
    }
    return status;
}

void AudioRecorder::Cleanup(Session& session, bool flush) {
    if (session.engine) {
        try {
            if (flush) {
                session.engine->Stop();
            } else {
                session.engine->Abort();
            }
        } catch (const RecorderError& e) {
            MEETCAPTURE_ERROR_LOG("Encoder shutdown failed: " << e.what());
            ReportError(session.sink, e.Code(), e.what());
        } catch (const std::exception& e) {
            MEETCAPTURE_ERROR_LOG("Encoder shutdown failed: " << e.what());
            ReportError(session.sink, ErrorCode::EncodeFrameFailed, e.what());
        }
        session.engine.reset();
    }

    if (session.mixer) {
        session.mixer->Close();
    }

    // Devices stop before the mixer goes away; a late device callback must
    // still find it alive.
    for (auto& source : session.sources) {
        source.Release();
    }
    session.sources.clear();
    session.mixer.reset();
    session.stream.reset();
}

} // namespace meetcapture
