#include "AudioSource.hpp"
#include "../common/debug_log.hpp"

#include <exception>

namespace meetcapture {

void ReleaseTrack(ICaptureTrack& track) noexcept {
    try {
        track.SetEnabled(false);
    } catch (const std::exception& e) {
        MEETCAPTURE_ERROR_LOG("Failed to disable track " << track.Label() << ": " << e.what());
    }
    try {
        track.Stop();
    } catch (const std::exception& e) {
        MEETCAPTURE_ERROR_LOG("Failed to stop track " << track.Label() << ": " << e.what());
    }
}

AudioSource::AudioSource(SourceKind kind, std::shared_ptr<ICaptureTrack> track)
    : _kind(kind)
    , _track(std::move(track)) {}

AudioSource::~AudioSource() {
    Release();
}

AudioSource::AudioSource(AudioSource&& other) noexcept
    : _kind(other._kind)
    , _track(std::move(other._track)) {}

AudioSource& AudioSource::operator=(AudioSource&& other) noexcept {
    if (this != &other) {
        Release();
        _kind = other._kind;
        _track = std::move(other._track);
    }
    return *this;
}

void AudioSource::Release() noexcept {
    if (!_track) {
        return;
    }
    std::shared_ptr<ICaptureTrack> track = std::move(_track);
    _track.reset();
    ReleaseTrack(*track);
}

} // namespace meetcapture
