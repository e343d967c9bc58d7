#include "RtAudioBackend.hpp"
#include "../common/RecorderError.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace meetcapture {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

} // namespace

int RtAudioTrack::Record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                         double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    RtAudioTrack* track = static_cast<RtAudioTrack*>(userData);

    if (status & RTAUDIO_INPUT_OVERFLOW) {
        MEETCAPTURE_LOG("Stream overflow detected on " << track->_label << MEETCAPTURE_LOG_ENDL);
    }

    if (inputBuffer && track->_enabled && track->_state == TrackState::Live) {
        track->OnInput(inputBuffer, nBufferFrames);
    }
    return 0;
}

RtAudioTrack::RtAudioTrack(DeviceRole role, const CaptureConstraints& constraints)
    : _audio(RtAudio::UNSPECIFIED,
             [this](RtAudioErrorType type, const std::string& errorText) { OnDeviceError(type, errorText); })
    , _format(RTAUDIO_SINT16)
    , _sampleRate(constraints.sampleRate)
    , _channels(1)
    , _bufferFrames(256)
    , _enabled(true)
    , _state(TrackState::Live)
    , _started(false)
    , _stopped(false) {
    _audio.showWarnings(false);

    _parameters.deviceId = SelectDevice(role, constraints.deviceName);
    OpenStream(constraints);

    _processor = std::make_unique<SourceProcessor>(constraints, _sampleRate, _channels);

    if (_audio.startStream()) {
        const std::string error = _audio.getErrorText();
        if (_audio.isStreamOpen()) {
            _audio.closeStream();
        }
        throw RecorderError(ErrorCode::PermissionDenied, "Error starting stream on " + _label + ": " + error);
    }
    _started = true;
    MEETCAPTURE_LOG("Capturing from " << _label << " at " << _sampleRate << " Hz, "
                    << _channels << " channel(s)" << MEETCAPTURE_LOG_ENDL);
}

RtAudioTrack::~RtAudioTrack() {
    Stop();
}

unsigned int RtAudioTrack::SelectDevice(DeviceRole role, const std::string& deviceName) {
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    if (deviceIds.empty()) {
        throw RecorderError(ErrorCode::DeviceNotFound, "No audio devices found");
    }

    MEETCAPTURE_LOG("Available audio devices:" << MEETCAPTURE_LOG_ENDL);
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
        MEETCAPTURE_LOG("  Device " << id << ": " << info.name
                        << " (input channels: " << info.inputChannels << ")" << MEETCAPTURE_LOG_ENDL);
    }

    if (!deviceName.empty()) {
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
            if (info.inputChannels > 0 && Contains(info.name, deviceName)) {
                _label = info.name;
                return id;
            }
        }
        throw RecorderError(ErrorCode::DeviceNotFound,
                            "No input device matching '" + deviceName + "'");
    }

    if (role == DeviceRole::Loopback) {
        throw RecorderError(ErrorCode::DeviceNotFound, "No loopback device configured");
    }

    unsigned int defaultDevice = _audio.getDefaultInputDevice();
    RtAudio::DeviceInfo defaultInfo = _audio.getDeviceInfo(defaultDevice);

    if (defaultInfo.inputChannels < 1) {
        MEETCAPTURE_LOG("Default device has no input channels! Searching for alternative..." << MEETCAPTURE_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo info = _audio.getDeviceInfo(id);
            if (info.inputChannels > 0) {
                defaultDevice = id;
                defaultInfo = info;
                break;
            }
        }
    }

    if (defaultInfo.inputChannels < 1) {
        throw RecorderError(ErrorCode::DeviceNotFound, "No input devices found");
    }
    _label = defaultInfo.name;
    return defaultDevice;
}

void RtAudioTrack::OpenStream(const CaptureConstraints& constraints) {
    RtAudio::DeviceInfo info = _audio.getDeviceInfo(_parameters.deviceId);

    _channels = std::max(1u, std::min(constraints.idealChannels, info.inputChannels));
    _parameters.nChannels = _channels;
    _parameters.firstChannel = 0;

    unsigned int sampleRate = constraints.sampleRate;
    const bool sampleRateSupported =
        std::find(info.sampleRates.begin(), info.sampleRates.end(), sampleRate) != info.sampleRates.end();
    if (!sampleRateSupported && info.preferredSampleRate > 0) {
        sampleRate = info.preferredSampleRate;
        MEETCAPTURE_LOG(constraints.sampleRate << " Hz not supported by " << _label
                        << ", using preferred rate: " << sampleRate << MEETCAPTURE_LOG_ENDL);
    }

    unsigned int bufferFrames = _bufferFrames;
    if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                          sampleRate, &bufferFrames, &Record, this) == RTAUDIO_NO_ERROR) {
        _format = RTAUDIO_SINT16;
    } else {
        MEETCAPTURE_LOG("Error opening SINT16 stream: " << _audio.getErrorText()
                        << ", trying FLOAT32..." << MEETCAPTURE_LOG_ENDL);
        bufferFrames = _bufferFrames;
        if (_audio.openStream(nullptr, &_parameters, RTAUDIO_FLOAT32,
                              sampleRate, &bufferFrames, &Record, this) == RTAUDIO_NO_ERROR) {
            _format = RTAUDIO_FLOAT32;
        } else if (info.preferredSampleRate > 0 && info.preferredSampleRate != sampleRate) {
            sampleRate = info.preferredSampleRate;
            bufferFrames = _bufferFrames;
            if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                                  sampleRate, &bufferFrames, &Record, this) != RTAUDIO_NO_ERROR) {
                throw RecorderError(ErrorCode::PermissionDenied,
                                    "Error opening " + _label + ": " + _audio.getErrorText());
            }
            _format = RTAUDIO_SINT16;
        } else {
            throw RecorderError(ErrorCode::PermissionDenied,
                                "Error opening " + _label + ": " + _audio.getErrorText());
        }
    }

    _sampleRate = sampleRate;
    _bufferFrames = bufferFrames;
    _convertBuffer.resize(static_cast<size_t>(bufferFrames) * _channels);
}

void RtAudioTrack::OnInput(const void* inputBuffer, unsigned int nBufferFrames) {
    const size_t count = static_cast<size_t>(nBufferFrames) * _channels;
    const int16_t* samples = nullptr;

    if (_format == RTAUDIO_FLOAT32) {
        if (_convertBuffer.size() < count) {
            _convertBuffer.resize(count);
        }
        const float* input = static_cast<const float*>(inputBuffer);
        for (size_t i = 0; i < count; ++i) {
            const float sample = std::max(-1.0f, std::min(1.0f, input[i]));
            _convertBuffer[i] = static_cast<int16_t>(sample * 32767.0f);
        }
        samples = _convertBuffer.data();
    } else {
        samples = static_cast<const int16_t*>(inputBuffer);
    }

    std::vector<int16_t> processed;
    if (!_processor->IsPassthrough()) {
        processed = _processor->Process(samples, nBufferFrames);
        samples = processed.data();
        nBufferFrames = static_cast<unsigned int>(processed.size() / _channels);
    }
    if (nBufferFrames == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(_callbackMutex);
    if (_onBuffer) {
        _onBuffer(samples, nBufferFrames);
    }
}

void RtAudioTrack::SetOnBufferCallback(BufferCallback cb) {
    std::lock_guard<std::mutex> lock(_callbackMutex);
    _onBuffer = std::move(cb);
}

void RtAudioTrack::SetOnEndedCallback(EndedCallback cb) {
    std::lock_guard<std::mutex> lock(_callbackMutex);
    _onEnded = std::move(cb);
}

void RtAudioTrack::OnDeviceError(RtAudioErrorType type, const std::string& errorText) {
    // Errors raised while opening are reported through the open path instead.
    if (type == RTAUDIO_WARNING || !_started) {
        MEETCAPTURE_LOG("RtAudio: " << errorText << MEETCAPTURE_LOG_ENDL);
        return;
    }
    MEETCAPTURE_ERROR_LOG("RtAudio error on " << _label << ": " << errorText);
    if (!_stopped) {
        MarkEnded(errorText);
    }
}

void RtAudioTrack::MarkEnded(const std::string& reason) {
    if (_state.exchange(TrackState::Ended) == TrackState::Ended) {
        return;
    }
    // Called under the lock so clearing the callback waits for a running one.
    std::lock_guard<std::mutex> lock(_callbackMutex);
    if (_onEnded) {
        _onEnded(reason);
    }
}

void RtAudioTrack::Stop() {
    _stopped = true;
    _enabled = false;
    _state = TrackState::Ended;

    std::lock_guard<std::mutex> lock(_streamMutex);
    if (_audio.isStreamRunning()) {
        if (_audio.stopStream() != RTAUDIO_NO_ERROR) {
            MEETCAPTURE_ERROR_LOG("Error stopping " << _label << ": " << _audio.getErrorText());
        }
    }
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
}

std::vector<std::shared_ptr<ICaptureTrack>> RtAudioBackend::OpenInput(const CaptureConstraints& constraints) {
    return {std::make_shared<RtAudioTrack>(RtAudioTrack::DeviceRole::Input, constraints)};
}

std::vector<std::shared_ptr<ICaptureTrack>> RtAudioBackend::OpenLoopback(const CaptureConstraints& constraints) {
    return {std::make_shared<RtAudioTrack>(RtAudioTrack::DeviceRole::Loopback, constraints)};
}

void RtAudioBackend::ListDevices() {
    RtAudio audio;
    for (unsigned int id : audio.getDeviceIds()) {
        RtAudio::DeviceInfo info = audio.getDeviceInfo(id);
        std::cout << id << ": " << info.name
                  << " (in: " << info.inputChannels << ", out: " << info.outputChannels
                  << ", preferred rate: " << info.preferredSampleRate << ")"
                  << (info.isDefaultInput ? " [default input]" : "") << std::endl;
    }
}

} // namespace meetcapture
