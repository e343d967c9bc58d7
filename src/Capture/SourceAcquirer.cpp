#include "SourceAcquirer.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>

namespace meetcapture {

bool AcquisitionResult::Has(SourceKind kind) const {
    return std::any_of(sources.begin(), sources.end(),
                       [kind](const AudioSource& s) { return s.Kind() == kind; });
}

void AcquisitionResult::ReleaseAll() noexcept {
    for (auto& source : sources) {
        source.Release();
    }
    sources.clear();
}

SourceAcquirer::SourceAcquirer(std::shared_ptr<ICaptureBackend> backend, const RecorderConfig& config)
    : _backend(std::move(backend))
    , _config(config) {}

CaptureConstraints SourceAcquirer::MicrophoneConstraints() const {
    CaptureConstraints constraints;
    constraints.echoCancellation = true;
    constraints.noiseSuppression = true;
    constraints.autoGainControl = true;
    constraints.sampleRate = _config.sampleRate;
    constraints.idealChannels = _config.micIdealChannels;
    constraints.deviceName = _config.micDevice;
    return constraints;
}

CaptureConstraints SourceAcquirer::SystemConstraints() const {
    // The loopback signal is kept untouched.
    CaptureConstraints constraints;
    constraints.echoCancellation = false;
    constraints.noiseSuppression = false;
    constraints.autoGainControl = false;
    constraints.sampleRate = _config.sampleRate;
    constraints.idealChannels = _config.systemIdealChannels;
    constraints.deviceName = _config.systemDevice;
    return constraints;
}

AcquisitionResult SourceAcquirer::Acquire(bool wantMic, bool wantSystem, IRecordingEventSink* sink) {
    AcquisitionResult result;

    if (wantMic) {
        AcquireOne(SourceKind::Microphone, result, sink);
    }
    if (wantSystem) {
        AcquireOne(SourceKind::System, result, sink);
    }

    if (result.sources.empty()) {
        std::string message = "No audio sources available";
        if (!wantMic && !wantSystem) {
            message += ": no source was requested";
        }
        for (const auto& failure : result.failures) {
            message += "; " + failure.message;
        }
        throw RecorderError(ErrorCode::NoAudioSourcesAvailable, message);
    }
    return result;
}

void SourceAcquirer::AcquireOne(SourceKind kind, AcquisitionResult& result, IRecordingEventSink* sink) {
    const bool isMic = kind == SourceKind::Microphone;
    const std::string what = isMic ? "Microphone" : "System audio";

    std::vector<std::shared_ptr<ICaptureTrack>> tracks;
    try {
        tracks = isMic ? _backend->OpenInput(MicrophoneConstraints())
                       : _backend->OpenLoopback(SystemConstraints());
    } catch (const RecorderError& e) {
        ErrorEvent failure{e.Code(), what + " access denied: " + e.what()};
        MEETCAPTURE_LOG(failure.message << MEETCAPTURE_LOG_ENDL);
        result.failures.push_back(failure);
        ReportError(sink, failure.code, failure.message);
        return;
    } catch (const std::exception& e) {
        ErrorEvent failure{ErrorCode::PermissionDenied, what + " access denied: " + e.what()};
        MEETCAPTURE_LOG(failure.message << MEETCAPTURE_LOG_ENDL);
        result.failures.push_back(failure);
        ReportError(sink, failure.code, failure.message);
        return;
    }

    // Only the first audio track is kept. Video tracks exist only because some
    // platforms tie loopback audio to screen capture; they are stopped at once.
    bool kept = false;
    for (auto& track : tracks) {
        if (!track) {
            continue;
        }
        if (track->Kind() == TrackKind::Audio && !kept) {
            result.sources.emplace_back(kind, track);
            kept = true;
        } else {
            ReleaseTrack(*track);
        }
    }

    if (!kept) {
        ErrorEvent failure{ErrorCode::DeviceNotFound, what + " returned no audio track"};
        result.failures.push_back(failure);
        ReportError(sink, failure.code, failure.message);
    }
}

} // namespace meetcapture
