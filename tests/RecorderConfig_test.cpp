#include "common/RecorderConfig.hpp"
#include "common/RecorderError.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace meetcapture;

TEST(RecorderConfigTest, DefaultsMatchRecordingPipeline) {
    RecorderConfig config;
    EXPECT_NO_THROW(Validate(config));
    EXPECT_EQ(config.sampleRate, 16000u);
    EXPECT_EQ(config.mixChannels, 2u);
    EXPECT_EQ(config.systemDevice, "monitor");
    EXPECT_EQ(config.encoder.bitrate, 16000u);
    EXPECT_EQ(config.encoder.frameDurationMs, 20u);
    EXPECT_EQ(config.encoder.containerBitrate, 128000u);
    EXPECT_EQ(config.encoder.containerSliceMs, 5000u);
    EXPECT_EQ(config.chunking.maxChunkBytes, 120u * 1024);
    EXPECT_EQ(config.chunking.flushIntervalMs, 5000u);
}

TEST(RecorderConfigTest, JsonOverridesNestedKeys) {
    auto json = nlohmann::json::parse(R"({
        "sample_rate": 48000,
        "mic_device": "USB Mic",
        "unknown_key": [1, 2, 3],
        "encoder": {"bitrate": 24000, "enable_frame_encoder": false},
        "chunking": {"max_chunk_bytes": 65536, "flush_interval_ms": 2000}
    })");

    RecorderConfig config = FromJson(json);
    EXPECT_EQ(config.sampleRate, 48000u);
    EXPECT_EQ(config.encoder.sampleRate, 48000u);
    EXPECT_EQ(config.micDevice, "USB Mic");
    EXPECT_EQ(config.systemDevice, "monitor");
    EXPECT_EQ(config.encoder.bitrate, 24000u);
    EXPECT_FALSE(config.encoder.enableFrameEncoder);
    EXPECT_EQ(config.chunking.maxChunkBytes, 65536u);
    EXPECT_EQ(config.chunking.flushIntervalMs, 2000u);
}

TEST(RecorderConfigTest, ToJsonRoundTrip) {
    RecorderConfig config;
    config.micDevice = "Built-in";
    config.chunking.flushIntervalMs = 1234;

    RecorderConfig parsed = FromJson(ToJson(config));
    EXPECT_EQ(parsed.micDevice, "Built-in");
    EXPECT_EQ(parsed.chunking.flushIntervalMs, 1234u);
    EXPECT_EQ(ToJson(parsed), ToJson(config));
}

TEST(RecorderConfigTest, WrongTypeIsInvalidConfig) {
    auto json = nlohmann::json::parse(R"({"sample_rate": "fast"})");
    try {
        FromJson(json);
        FAIL() << "Expected InvalidConfig";
    } catch (const RecorderError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::InvalidConfig);
    }
    EXPECT_THROW(FromJson(nlohmann::json::array()), RecorderError);
}

TEST(RecorderConfigTest, OutOfRangeValuesAreRejected) {
    RecorderConfig config;
    config.mixChannels = 3;
    EXPECT_THROW(Validate(config), RecorderError);

    config = RecorderConfig{};
    config.encoder.sampleRate = 44100;
    EXPECT_THROW(Validate(config), RecorderError);

    config = RecorderConfig{};
    config.encoder.frameDurationMs = 25;
    EXPECT_THROW(Validate(config), RecorderError);

    config = RecorderConfig{};
    config.chunking.flushIntervalMs = 0;
    EXPECT_THROW(Validate(config), RecorderError);
}

TEST(RecorderConfigTest, NegativeValuesAreInvalidConfig) {
    const char* cases[] = {
        R"({"render_quantum_ms": -1, "source_fifo_ms": -1})",
        R"({"chunking": {"max_chunk_bytes": -1}})",
        R"({"encoder": {"bitrate": -16000}})",
        R"({"stream_queue_frames": -5})",
        R"({"sample_rate": 16000.5})",
    };
    for (const char* text : cases) {
        try {
            FromJson(nlohmann::json::parse(text));
            FAIL() << "Accepted " << text;
        } catch (const RecorderError& e) {
            EXPECT_EQ(e.Code(), ErrorCode::InvalidConfig) << text;
        }
    }
}

TEST(RecorderConfigTest, OversizedValuesAreRejected) {
    RecorderConfig config;
    config.renderQuantumMs = 5000;
    config.sourceFifoMs = 10000;
    EXPECT_THROW(Validate(config), RecorderError);

    config = RecorderConfig{};
    config.sourceFifoMs = 3600000;
    EXPECT_THROW(Validate(config), RecorderError);

    config = RecorderConfig{};
    config.chunking.maxChunkBytes = static_cast<size_t>(-1);
    EXPECT_THROW(Validate(config), RecorderError);

    config = RecorderConfig{};
    config.encoder.containerBitrate = 1000;
    EXPECT_THROW(Validate(config), RecorderError);

    auto json = nlohmann::json::parse(R"({"encoder": {"enable_frame_encoder": false}})");
    EXPECT_FALSE(FromJson(json).encoder.enableFrameEncoder);
}

TEST(RecorderConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "meetcapture_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"system_device": "Monitor of Speakers", "render_quantum_ms": 10})";
    }
    RecorderConfig config = LoadRecorderConfig(path);
    EXPECT_EQ(config.systemDevice, "Monitor of Speakers");
    EXPECT_EQ(config.renderQuantumMs, 10u);
    std::remove(path.c_str());

    EXPECT_THROW(LoadRecorderConfig(path), RecorderError);
}
