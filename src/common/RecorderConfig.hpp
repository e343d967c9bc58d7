#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace meetcapture {

struct EncoderConfig {
    unsigned int sampleRate = 16000;
    unsigned int bitrate = 16000;
    unsigned int frameDurationMs = 20;
    bool enableFrameEncoder = true;
    unsigned int containerBitrate = 128000;
    unsigned int containerSliceMs = 5000;
};

struct ChunkingConfig {
    size_t maxChunkBytes = 120 * 1024;
    unsigned int flushIntervalMs = 5000;
};

struct RecorderConfig {
    unsigned int sampleRate = 16000;
    unsigned int mixChannels = 2;
    unsigned int micIdealChannels = 2;
    unsigned int systemIdealChannels = 2;
    std::string micDevice;
    std::string systemDevice = "monitor";
    unsigned int renderQuantumMs = 20;
    unsigned int sourceFifoMs = 500;
    size_t streamQueueFrames = 250;
    EncoderConfig encoder;
    ChunkingConfig chunking;
};

// Throws RecorderError(InvalidConfig) when a value is out of range.
void Validate(const RecorderConfig& config);

RecorderConfig FromJson(const nlohmann::json& json);
nlohmann::json ToJson(const RecorderConfig& config);
RecorderConfig LoadRecorderConfig(const std::string& path);

} // namespace meetcapture
