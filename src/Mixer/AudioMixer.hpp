#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "../Capture/AudioSource.hpp"
#include "../common/LinearResampler.hpp"
#include "../common/RecorderConfig.hpp"
#include "GainNode.hpp"
#include "MixedStream.hpp"

namespace meetcapture {

struct MixerStats {
    size_t renderedQuanta = 0;
    size_t underruns = 0;
    size_t overflowSamples = 0;
};

// Audio processing context: every live source goes through its own gain
// node into a master gain node that feeds a fixed-format destination.
//
// Sources push into per-source FIFOs at the context rate. A render clock
// pulls one quantum from every FIFO on absolute deadlines, so the output
// rate follows the clock, not the devices. A source that falls behind
// contributes silence; one that runs ahead loses its oldest samples.
class AudioMixer {
public:
    explicit AudioMixer(const RecorderConfig& config);
    ~AudioMixer();

    AudioMixer(const AudioMixer&) = delete;
    AudioMixer& operator=(const AudioMixer&) = delete;

    // Builds the graph. Throws RecorderError(NoAudioSourcesAvailable) if no
    // source has a live track. Starts the render clock unless startClock is
    // false, in which case RenderQuantum() drives the graph.
    std::shared_ptr<MixedStream> Mix(const std::vector<AudioSource>& sources, bool startClock = true);

    void RenderQuantum();

    void SetSourceGain(SourceKind kind, float gain);
    void SetMasterGain(float gain) { _masterGain.SetGain(gain); }

    size_t SourceCount() const { return _inputs.size(); }
    size_t QuantumFrames() const { return _quantumFrames; }
    StreamFormat Format() const { return _format; }
    MixerStats Stats() const;

    // Stops the clock, detaches every source and ends the destination.
    // Idempotent.
    void Close();
    bool IsClosed() const { return _closed.load(); }

private:
    struct SourceInput {
        SourceKind kind;
        std::shared_ptr<ICaptureTrack> track;
        GainNode gain;
        unsigned int trackChannels = 0;
        std::unique_ptr<LinearResampler> resampler;
        std::mutex mutex;
        std::deque<int16_t> fifo;
        size_t overflowSamples = 0;
        size_t underruns = 0;
        std::atomic<bool> ended{false};
    };

    void Connect(SourceInput& input);
    void OnSourceBuffer(SourceInput& input, const int16_t* samples, size_t frames);
    void OnSourceEnded(SourceInput& input, const std::string& reason);
    std::vector<int16_t> MapChannels(const int16_t* samples, size_t frames, unsigned int inChannels) const;
    void RenderLoop();

    StreamFormat _format;
    size_t _quantumFrames;
    size_t _fifoCapacitySamples;
    size_t _streamQueueFrames;
    unsigned int _quantumMs;

    GainNode _masterGain;
    std::vector<std::unique_ptr<SourceInput>> _inputs;
    std::shared_ptr<MixedStream> _stream;
    std::shared_ptr<MediaTrack> _destination;
    std::vector<float> _mixBuffer;
    int64_t _renderedFrames;
    size_t _renderedQuanta;

    std::thread _renderThread;
    std::mutex _clockMutex;
    std::condition_variable _clockCv;
    std::atomic<bool> _closed;
    std::mutex _closeMutex;
    mutable std::mutex _renderMutex;
};

} // namespace meetcapture
