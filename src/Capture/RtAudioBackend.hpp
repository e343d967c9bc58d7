#pragma once

#include <RtAudio.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ICaptureBackend.hpp"
#include "SourceProcessor.hpp"

namespace meetcapture {

// Capture track backed by one RtAudio input stream. The stream is opened
// and started by the constructor and closed by Stop() or the destructor.
class RtAudioTrack : public ICaptureTrack {
public:
    enum class DeviceRole {
        Input,
        Loopback
    };

    RtAudioTrack(DeviceRole role, const CaptureConstraints& constraints);
    ~RtAudioTrack() override;

    TrackKind Kind() const override { return TrackKind::Audio; }
    std::string Label() const override { return _label; }
    unsigned int SampleRate() const override { return _sampleRate; }
    unsigned int Channels() const override { return _channels; }

    TrackState State() const override { return _state.load(); }

    void SetEnabled(bool enabled) override { _enabled = enabled; }
    bool IsEnabled() const override { return _enabled.load(); }

    void SetOnBufferCallback(BufferCallback cb) override;
    void SetOnEndedCallback(EndedCallback cb) override;

    void Stop() override;

private:
    static int Record(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                      double streamTime, RtAudioStreamStatus status, void* userData);

    unsigned int SelectDevice(DeviceRole role, const std::string& deviceName);
    void OpenStream(const CaptureConstraints& constraints);
    void OnInput(const void* inputBuffer, unsigned int nBufferFrames);
    void OnDeviceError(RtAudioErrorType type, const std::string& errorText);
    void MarkEnded(const std::string& reason);

    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
    RtAudioFormat _format;
    std::string _label;
    unsigned int _sampleRate;
    unsigned int _channels;
    unsigned int _bufferFrames;

    std::atomic<bool> _enabled;
    std::atomic<TrackState> _state;
    std::atomic<bool> _started;
    std::atomic<bool> _stopped;

    std::unique_ptr<SourceProcessor> _processor;
    std::vector<int16_t> _convertBuffer;

    std::mutex _callbackMutex;
    BufferCallback _onBuffer;
    EndedCallback _onEnded;
    std::mutex _streamMutex;
};

// Default desktop backend. Loopback capture opens an input device whose name
// matches the configured pattern, e.g. a PulseAudio/PipeWire "Monitor of ..."
// source.
class RtAudioBackend : public ICaptureBackend {
public:
    std::vector<std::shared_ptr<ICaptureTrack>> OpenInput(const CaptureConstraints& constraints) override;
    std::vector<std::shared_ptr<ICaptureTrack>> OpenLoopback(const CaptureConstraints& constraints) override;

    // Prints every device RtAudio can see.
    static void ListDevices();
};

} // namespace meetcapture
