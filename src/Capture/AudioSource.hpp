#pragma once

#include <memory>

#include "../common/Types.hpp"
#include "ICaptureTrack.hpp"

namespace meetcapture {

// Owns one acquired capture track. Releasing disables and stops the track;
// both calls are always made, even on a track that has already ended.
class AudioSource {
public:
    AudioSource(SourceKind kind, std::shared_ptr<ICaptureTrack> track);
    ~AudioSource();

    AudioSource(AudioSource&& other) noexcept;
    AudioSource& operator=(AudioSource&& other) noexcept;
    AudioSource(const AudioSource&) = delete;
    AudioSource& operator=(const AudioSource&) = delete;

    SourceKind Kind() const { return _kind; }
    const std::shared_ptr<ICaptureTrack>& Track() const { return _track; }
    unsigned int SampleRate() const { return _track ? _track->SampleRate() : 0; }
    unsigned int Channels() const { return _track ? _track->Channels() : 0; }
    bool IsLive() const { return _track && _track->IsLive(); }

    void Release() noexcept;

private:
    SourceKind _kind;
    std::shared_ptr<ICaptureTrack> _track;
};

// Disables and stops any track, logging instead of throwing.
void ReleaseTrack(ICaptureTrack& track) noexcept;

} // namespace meetcapture
