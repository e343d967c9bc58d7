#include "EncodingEngine.hpp"
#include "../common/RecorderError.hpp"
#include "../common/debug_log.hpp"
#include "EncoderCapabilities.hpp"

#include <chrono>
#include <exception>

namespace meetcapture {

namespace {
constexpr std::chrono::milliseconds kReadTimeout(50);
} // namespace

EncodingEngine::EncodingEngine(const RecorderConfig& config, IRecordingEventSink* sink)
    : EncodingEngine(config, sink, nullptr) {}

EncodingEngine::EncodingEngine(const RecorderConfig& config, IRecordingEventSink* sink, StrategyFactory factory)
    : _config(config)
    , _sink(sink)
    , _factory(std::move(factory))
    , _started(false)
    , _finished(false)
    , _paused(false)
    , _readerDone(false) {}

EncodingEngine::~EncodingEngine() {
    Abort();
}

EncoderPath EncodingEngine::Start(const MixedStream& stream) {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_started) {
        throw RecorderError(ErrorCode::AlreadyActive, "Encoding engine already started");
    }
    _started = true;

    _track = stream.FirstLiveTrack();
    if (!_track) {
        throw RecorderError(ErrorCode::TrackReaderFailed, "Mixed stream has no live track");
    }

    const StreamFormat format = _track->Format();
    if (_factory) {
        _strategy = _factory(format, _sink);
    } else {
        const EncoderPath path = SelectEncoderPath(ProbeEncoderCapabilities(_config, format));
        try {
            _strategy = CreateEncoderStrategy(path, _config, format, _sink);
        } catch (const RecorderError& e) {
            if (path != EncoderPath::Frame || e.Code() != ErrorCode::EncoderUnavailable) {
                throw;
            }
            MEETCAPTURE_LOG("Frame encoder failed to initialize (" << e.what() << "), using container recorder"
                                                                   << MEETCAPTURE_LOG_ENDL);
            _strategy = CreateEncoderStrategy(EncoderPath::Container, _config, format, _sink);
        }
    }
    if (!_strategy) {
        throw RecorderError(ErrorCode::EncoderUnavailable, "No encoder strategy was created");
    }

    MEETCAPTURE_LOG("Encoding " << format.sampleRate << " Hz, " << format.channels << " ch via "
                                << ToString(_strategy->Path()) << " path" << MEETCAPTURE_LOG_ENDL);

    _readerThread = std::make_unique<std::thread>(&EncodingEngine::ReadLoop, this);
    return _strategy->Path();
}

void EncodingEngine::Pause() {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (!_strategy || _finished || _paused) {
        return;
    }
    _paused = true;
    _strategy->Pause();
}

void EncodingEngine::Resume() {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (!_strategy || _finished || !_paused) {
        return;
    }
    _strategy->Resume();
    _paused = false;
}

void EncodingEngine::Stop() {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_finished) {
        return;
    }
    _finished = true;
    JoinReader();

    if (!_strategy) {
        return;
    }
    const size_t total = _strategy->Stop();
    MEETCAPTURE_LOG("Encoding stopped after " << total << " chunks" << MEETCAPTURE_LOG_ENDL);
    if (_sink) {
        _sink->OnComplete(total);
    }
}

void EncodingEngine::Abort() {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_finished) {
        return;
    }
    _finished = true;
    JoinReader();
}

bool EncodingEngine::IsRunning() const {
    return _started && !_finished && !_readerDone;
}

EncoderPath EncodingEngine::Path() const {
    return _strategy ? _strategy->Path() : EncoderPath::Frame;
}

size_t EncodingEngine::ChunkCount() const {
    return _strategy ? _strategy->ChunkCount() : 0;
}

void EncodingEngine::JoinReader() {
    _token.Cancel();
    if (_track) {
        _track->WakeReaders();
    }
    if (_readerThread && _readerThread->joinable()) {
        _readerThread->join();
    }
}

void EncodingEngine::ReadLoop() {
    while (!_token.IsCancelled()) {
        ReadResult result = _track->Read(kReadTimeout, _token);
        switch (result.status) {
            case ReadStatus::Frame:
                if (_paused) {
                    break;
                }
                try {
                    _strategy->Submit(*result.frame);
                } catch (const std::exception& e) {
                    ReportError(_sink, ErrorCode::EncodeFrameFailed, e.what());
                }
                // The PCM is released here whether or not encoding succeeded.
                result.frame.reset();
                break;
            case ReadStatus::Timeout:
                break;
            case ReadStatus::Cancelled:
                _readerDone = true;
                return;
            case ReadStatus::Ended:
                MEETCAPTURE_LOG("Mixed track ended" << MEETCAPTURE_LOG_ENDL);
                _strategy->Flush();
                _readerDone = true;
                return;
            case ReadStatus::Failed:
                ReportError(_sink, ErrorCode::TrackReaderFailed, result.error);
                _strategy->Flush();
                _readerDone = true;
                return;
        }
    }
    _readerDone = true;
}

} // namespace meetcapture
