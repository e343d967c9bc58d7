#include "RecorderConfig.hpp"
#include "RecorderError.hpp"

#include <fstream>
#include <type_traits>

namespace meetcapture {

namespace {

constexpr unsigned int kMaxSampleRate = 192000;
constexpr unsigned int kMaxChannels = 8;
constexpr unsigned int kMaxRenderQuantumMs = 1000;
constexpr unsigned int kMaxSourceFifoMs = 60000;
constexpr size_t kMaxStreamQueueFrames = 100000;
constexpr unsigned int kMaxSliceMs = 600000;
constexpr size_t kMaxChunkBytes = 64 * 1024 * 1024;
constexpr unsigned int kMaxFlushIntervalMs = 600000;

bool IsOpusRate(unsigned int rate) {
    return rate == 8000 || rate == 12000 || rate == 16000 || rate == 24000 || rate == 48000;
}

template <typename T>
void Read(const nlohmann::json& json, const char* key, T& out) {
    auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    if (std::is_unsigned<T>::value && !std::is_same<T, bool>::value && !it->is_number_unsigned()) {
        throw RecorderError(ErrorCode::InvalidConfig,
                            std::string("Invalid value for '") + key + "': expected a non-negative integer");
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw RecorderError(ErrorCode::InvalidConfig,
                            std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

void Validate(const RecorderConfig& config) {
    auto fail = [](const std::string& message) {
        throw RecorderError(ErrorCode::InvalidConfig, message);
    };

    if (config.sampleRate == 0 || config.sampleRate > kMaxSampleRate) {
        fail("sample_rate must be within [1, 192000]");
    }
    if (config.mixChannels < 1 || config.mixChannels > 2) fail("mix_channels must be 1 or 2");
    if (config.micIdealChannels < 1 || config.systemIdealChannels < 1 ||
        config.micIdealChannels > kMaxChannels || config.systemIdealChannels > kMaxChannels) {
        fail("ideal channel counts must be within [1, 8]");
    }
    if (config.renderQuantumMs == 0 || config.renderQuantumMs > kMaxRenderQuantumMs) {
        fail("render_quantum_ms must be within [1, 1000]");
    }
    if (config.sourceFifoMs < config.renderQuantumMs || config.sourceFifoMs > kMaxSourceFifoMs) {
        fail("source_fifo_ms must hold at least one render quantum and at most 60000 ms");
    }
    if (config.streamQueueFrames == 0 || config.streamQueueFrames > kMaxStreamQueueFrames) {
        fail("stream_queue_frames must be within [1, 100000]");
    }
    if (!IsOpusRate(config.encoder.sampleRate)) {
        fail("encoder.sample_rate must be one of 8000, 12000, 16000, 24000, 48000");
    }
    const unsigned int duration = config.encoder.frameDurationMs;
    if (duration != 10 && duration != 20 && duration != 40 && duration != 60) {
        fail("encoder.frame_duration_ms must be 10, 20, 40 or 60");
    }
    if (config.encoder.bitrate < 6000 || config.encoder.bitrate > 510000) {
        fail("encoder.bitrate must be within [6000, 510000]");
    }
    if (config.encoder.containerBitrate < 6000 || config.encoder.containerBitrate > 510000) {
        fail("encoder.container_bitrate must be within [6000, 510000]");
    }
    if (config.encoder.containerSliceMs == 0 || config.encoder.containerSliceMs > kMaxSliceMs) {
        fail("encoder.container_slice_ms must be within [1, 600000]");
    }
    if (config.chunking.maxChunkBytes == 0 || config.chunking.maxChunkBytes > kMaxChunkBytes) {
        fail("chunking.max_chunk_bytes must be within [1, 64 MiB]");
    }
    if (config.chunking.flushIntervalMs == 0 || config.chunking.flushIntervalMs > kMaxFlushIntervalMs) {
        fail("chunking.flush_interval_ms must be within [1, 600000]");
    }
}

RecorderConfig FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw RecorderError(ErrorCode::InvalidConfig, "Recorder config must be a JSON object");
    }

    RecorderConfig config;
    Read(json, "sample_rate", config.sampleRate);
    Read(json, "mix_channels", config.mixChannels);
    Read(json, "mic_ideal_channels", config.micIdealChannels);
    Read(json, "system_ideal_channels", config.systemIdealChannels);
    Read(json, "mic_device", config.micDevice);
    Read(json, "system_device", config.systemDevice);
    Read(json, "render_quantum_ms", config.renderQuantumMs);
    Read(json, "source_fifo_ms", config.sourceFifoMs);
    Read(json, "stream_queue_frames", config.streamQueueFrames);

    // The encoding context always runs at the capture rate unless overridden.
    config.encoder.sampleRate = config.sampleRate;

    auto encoder = json.find("encoder");
    if (encoder != json.end() && encoder->is_object()) {
        Read(*encoder, "sample_rate", config.encoder.sampleRate);
        Read(*encoder, "bitrate", config.encoder.bitrate);
        Read(*encoder, "frame_duration_ms", config.encoder.frameDurationMs);
        Read(*encoder, "enable_frame_encoder", config.encoder.enableFrameEncoder);
        Read(*encoder, "container_bitrate", config.encoder.containerBitrate);
        Read(*encoder, "container_slice_ms", config.encoder.containerSliceMs);
    }

    auto chunking = json.find("chunking");
    if (chunking != json.end() && chunking->is_object()) {
        Read(*chunking, "max_chunk_bytes", config.chunking.maxChunkBytes);
        Read(*chunking, "flush_interval_ms", config.chunking.flushIntervalMs);
    }

    Validate(config);
    return config;
}

nlohmann::json ToJson(const RecorderConfig& config) {
    return {
        {"sample_rate", config.sampleRate},
        {"mix_channels", config.mixChannels},
        {"mic_ideal_channels", config.micIdealChannels},
        {"system_ideal_channels", config.systemIdealChannels},
        {"mic_device", config.micDevice},
        {"system_device", config.systemDevice},
        {"render_quantum_ms", config.renderQuantumMs},
        {"source_fifo_ms", config.sourceFifoMs},
        {"stream_queue_frames", config.streamQueueFrames},
        {"encoder", {
            {"sample_rate", config.encoder.sampleRate},
            {"bitrate", config.encoder.bitrate},
            {"frame_duration_ms", config.encoder.frameDurationMs},
            {"enable_frame_encoder", config.encoder.enableFrameEncoder},
            {"container_bitrate", config.encoder.containerBitrate},
            {"container_slice_ms", config.encoder.containerSliceMs}
        }},
        {"chunking", {
            {"max_chunk_bytes", config.chunking.maxChunkBytes},
            {"flush_interval_ms", config.chunking.flushIntervalMs}
        }}
    };
}

RecorderConfig LoadRecorderConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw RecorderError(ErrorCode::InvalidConfig, "Could not open config file: " + path);
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw RecorderError(ErrorCode::InvalidConfig,
                            "Could not parse config file " + path + ": " + e.what());
    }
    return FromJson(json);
}

} // namespace meetcapture
