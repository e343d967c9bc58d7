#include "AudioMixer.hpp"
#include "../common/RecorderError.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace meetcapture {

AudioMixer::AudioMixer(const RecorderConfig& config)
    : _format{config.sampleRate, config.mixChannels}
    , _quantumFrames(static_cast<size_t>(config.sampleRate) * config.renderQuantumMs / 1000)
    , _fifoCapacitySamples(static_cast<size_t>(config.sampleRate) * config.sourceFifoMs / 1000 * config.mixChannels)
    , _streamQueueFrames(config.streamQueueFrames)
    , _quantumMs(config.renderQuantumMs)
    , _masterGain(1.0f)
    , _renderedFrames(0)
    , _renderedQuanta(0)
    , _closed(false) {
    _mixBuffer.resize(_quantumFrames * _format.channels);
}

AudioMixer::~AudioMixer() {
    Close();
}

std::shared_ptr<MixedStream> AudioMixer::Mix(const std::vector<AudioSource>& sources, bool startClock) {
    if (_stream) {
        throw std::logic_error("AudioMixer::Mix called twice");
    }

    for (const auto& source : sources) {
        if (!source.IsLive()) {
            MEETCAPTURE_LOG("Skipping " << ToString(source.Kind()) << " source without a live track" << MEETCAPTURE_LOG_ENDL);
            continue;
        }
        auto input = std::make_unique<SourceInput>();
        input->kind = source.Kind();
        input->track = source.Track();
        input->trackChannels = source.Channels();
        if (source.SampleRate() != _format.sampleRate) {
            input->resampler = std::make_unique<LinearResampler>(source.SampleRate(), _format.sampleRate, _format.channels);
        }
        _inputs.push_back(std::move(input));
    }

    if (_inputs.empty()) {
        throw RecorderError(ErrorCode::NoAudioSourcesAvailable, "No audio sources available");
    }

    _stream = std::make_shared<MixedStream>(_format, _streamQueueFrames);
    _destination = _stream->Tracks().front();

    for (auto& input : _inputs) {
        Connect(*input);
    }

    if (startClock) {
        _renderThread = std::thread(&AudioMixer::RenderLoop, this);
    }
    return _stream;
}

void AudioMixer::Connect(SourceInput& input) {
    SourceInput* target = &input;
    input.track->SetOnBufferCallback([this, target](const int16_t* samples, size_t frames) {
        OnSourceBuffer(*target, samples, frames);
    });
    input.track->SetOnEndedCallback([this, target](const std::string& reason) {
        OnSourceEnded(*target, reason);
    });
    MEETCAPTURE_LOG("Mixing " << ToString(input.kind) << " (" << input.track->Label() << ", "
                    << input.track->SampleRate() << " Hz, " << input.trackChannels << " ch)" << MEETCAPTURE_LOG_ENDL);
}

std::vector<int16_t> AudioMixer::MapChannels(const int16_t* samples, size_t frames, unsigned int inChannels) const {
    const unsigned int outChannels = _format.channels;
    if (inChannels == outChannels) {
        return std::vector<int16_t>(samples, samples + frames * inChannels);
    }

    std::vector<int16_t> out(frames * outChannels);
    for (size_t i = 0; i < frames; ++i) {
        const int16_t* in = samples + i * inChannels;
        if (outChannels == 1) {
            int32_t sum = 0;
            for (unsigned int c = 0; c < inChannels; ++c) {
                sum += in[c];
            }
            out[i] = static_cast<int16_t>(sum / static_cast<int32_t>(inChannels));
        } else if (inChannels == 1) {
            for (unsigned int c = 0; c < outChannels; ++c) {
                out[i * outChannels + c] = in[0];
            }
        } else {
            for (unsigned int c = 0; c < outChannels; ++c) {
                out[i * outChannels + c] = in[std::min(c, inChannels - 1)];
            }
        }
    }
    return out;
}

void AudioMixer::OnSourceBuffer(SourceInput& input, const int16_t* samples, size_t frames) {
    if (_closed || frames == 0 || input.trackChannels == 0) {
        return;
    }

    std::vector<int16_t> mapped = MapChannels(samples, frames, input.trackChannels);
    if (input.resampler) {
        mapped = input.resampler->Process(mapped.data(), frames);
    }

    std::lock_guard<std::mutex> lock(input.mutex);
    input.fifo.insert(input.fifo.end(), mapped.begin(), mapped.end());
    if (input.fifo.size() > _fifoCapacitySamples) {
        // Drop whole frames so channels stay aligned.
        size_t excess = input.fifo.size() - _fifoCapacitySamples;
        excess += (_format.channels - excess % _format.channels) % _format.channels;
        input.fifo.erase(input.fifo.begin(), input.fifo.begin() + static_cast<std::ptrdiff_t>(excess));
        input.overflowSamples += excess;
    }
}

void AudioMixer::OnSourceEnded(SourceInput& input, const std::string& reason) {
    input.ended = true;
    MEETCAPTURE_ERROR_LOG(ToString(input.kind) << " source ended: " << reason);

    const bool allEnded = std::all_of(_inputs.begin(), _inputs.end(),
                                      [](const std::unique_ptr<SourceInput>& in) { return in->ended.load(); });
    if (allEnded && _destination) {
        _destination->Fail("All capture sources ended: " + reason);
    }
}

void AudioMixer::RenderQuantum() {
    std::lock_guard<std::mutex> renderLock(_renderMutex);
    if (!_destination || _closed) {
        return;
    }

    const size_t samplesPerQuantum = _quantumFrames * _format.channels;
    std::fill(_mixBuffer.begin(), _mixBuffer.end(), 0.0f);

    for (auto& input : _inputs) {
        const float gain = input->gain.Gain();
        std::lock_guard<std::mutex> lock(input->mutex);
        const size_t available = std::min(samplesPerQuantum, input->fifo.size());
        if (available < samplesPerQuantum) {
            ++input->underruns;
        }
        for (size_t i = 0; i < available; ++i) {
            _mixBuffer[i] += static_cast<float>(input->fifo[i]) * gain;
        }
        input->fifo.erase(input->fifo.begin(), input->fifo.begin() + static_cast<std::ptrdiff_t>(available));
    }

    auto frame = std::make_unique<AudioFrame>();
    frame->sampleRate = _format.sampleRate;
    frame->channels = _format.channels;
    frame->timestampUs = _renderedFrames * 1000000 / _format.sampleRate;
    frame->samples.resize(samplesPerQuantum);

    const float master = _masterGain.Gain();
    for (size_t i = 0; i < samplesPerQuantum; ++i) {
        const float value = std::max(-32768.0f, std::min(32767.0f, _mixBuffer[i] * master));
        frame->samples[i] = static_cast<int16_t>(value);
    }

    _renderedFrames += static_cast<int64_t>(_quantumFrames);
    ++_renderedQuanta;
    _destination->Push(std::move(frame));
}

void AudioMixer::RenderLoop() {
    using Clock = std::chrono::steady_clock;
    const auto quantum = std::chrono::microseconds(static_cast<int64_t>(_quantumMs) * 1000);
    auto deadline = Clock::now() + quantum;

    while (!_closed) {
        {
            std::unique_lock<std::mutex> lock(_clockMutex);
            if (_clockCv.wait_until(lock, deadline, [this] { return _closed.load(); })) {
                break;
            }
        }
        RenderQuantum();
        deadline += quantum;

        // After a long stall, restart the clock instead of rendering a burst.
        const auto now = Clock::now();
        if (now - deadline > quantum * 10) {
            MEETCAPTURE_LOG("Mixer clock fell behind, resynchronising" << MEETCAPTURE_LOG_ENDL);
            deadline = now + quantum;
        }
    }
}

void AudioMixer::SetSourceGain(SourceKind kind, float gain) {
    for (auto& input : _inputs) {
        if (input->kind == kind) {
            input->gain.SetGain(gain);
        }
    }
}

MixerStats AudioMixer::Stats() const {
    MixerStats stats;
    {
        std::lock_guard<std::mutex> lock(_renderMutex);
        stats.renderedQuanta = _renderedQuanta;
    }
    for (const auto& input : _inputs) {
        std::lock_guard<std::mutex> lock(input->mutex);
        stats.underruns += input->underruns;
        stats.overflowSamples += input->overflowSamples;
    }
    return stats;
}

void AudioMixer::Close() {
    std::lock_guard<std::mutex> closeLock(_closeMutex);
    if (_closed.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_clockMutex);
    }
    _clockCv.notify_all();
    if (_renderThread.joinable()) {
        _renderThread.join();
    }

    for (auto& input : _inputs) {
        if (input->track) {
            input->track->SetOnBufferCallback(nullptr);
            input->track->SetOnEndedCallback(nullptr);
        }
    }

    if (_destination) {
        _destination->End();
    }
    MEETCAPTURE_LOG("Audio context closed" << MEETCAPTURE_LOG_ENDL);
}

} // namespace meetcapture
