#pragma once

#include <memory>
#include <vector>

#include "../Events/EventSink.hpp"
#include "../common/RecorderConfig.hpp"
#include "AudioSource.hpp"
#include "ICaptureBackend.hpp"

namespace meetcapture {

struct AcquisitionResult {
    std::vector<AudioSource> sources;
    std::vector<ErrorEvent> failures;

    bool HasMic() const { return Has(SourceKind::Microphone); }
    bool HasSystem() const { return Has(SourceKind::System); }
    bool Has(SourceKind kind) const;
    void ReleaseAll() noexcept;
};

// Opens the microphone and/or loopback source, each in its own failure
// domain. A failing source is reported to the sink and skipped.
class SourceAcquirer {
public:
    SourceAcquirer(std::shared_ptr<ICaptureBackend> backend, const RecorderConfig& config);

    // Throws RecorderError(NoAudioSourcesAvailable) when nothing could be
    // opened, including when nothing was requested.
    AcquisitionResult Acquire(bool wantMic, bool wantSystem, IRecordingEventSink* sink);

    CaptureConstraints MicrophoneConstraints() const;
    CaptureConstraints SystemConstraints() const;

private:
    void AcquireOne(SourceKind kind, AcquisitionResult& result, IRecordingEventSink* sink);

    std::shared_ptr<ICaptureBackend> _backend;
    RecorderConfig _config;
};

} // namespace meetcapture
