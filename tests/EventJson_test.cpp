#include "Events/EventJson.hpp"
#include "Events/EventQueue.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace meetcapture;
using namespace std::chrono_literals;

TEST(EventJsonTest, ChunkCarriesBinaryFrames) {
    Chunk chunk;
    chunk.frames = {test_utils::MakeCompressedFrame(3, 0x01), test_utils::MakeCompressedFrame(2, 0x02)};
    chunk.totalBytes = 5;
    chunk.timestampMs = 99;
    chunk.reason = FlushReason::Size;
    chunk.sampleRate = 16000;
    chunk.channels = 2;

    auto json = ToJson(RecordingEvent{chunk});
    EXPECT_EQ(json["type"], "chunk");
    EXPECT_EQ(json["codec"], "opus");
    EXPECT_EQ(json["reason"], "size");
    EXPECT_EQ(json["totalBytes"], 5);
    ASSERT_EQ(json["chunks"].size(), 2u);
    EXPECT_TRUE(json["chunks"][0].is_binary());
    EXPECT_EQ(json["chunks"][1].get_binary(), (std::vector<uint8_t>{0x02, 0x02}));

    auto decoded = nlohmann::json::from_msgpack(ToMessagePack(chunk));
    EXPECT_EQ(decoded["chunks"][0].get_binary(), chunk.frames[0].data);
}

TEST(EventJsonTest, ErrorAndComplete) {
    auto error = ToJson(RecordingEvent{ErrorEvent{ErrorCode::PermissionDenied, "Microphone access denied: x"}});
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["error"], "Microphone access denied: x");
    EXPECT_EQ(error["code"], ToString(ErrorCode::PermissionDenied));

    auto complete = ToJson(RecordingEvent{CompleteEvent{7}});
    EXPECT_EQ(complete["type"], "complete");
    EXPECT_EQ(complete["totalChunks"], 7);
}

TEST(EventQueueTest, PreservesArrivalOrderAcrossThreads) {
    EventQueue queue;
    std::thread producer([&queue] {
        Chunk chunk;
        chunk.timestampMs = 1;
        queue.OnChunk(chunk);
        queue.OnError(ErrorEvent{ErrorCode::EncodeFrameFailed, "bad frame"});
        queue.OnComplete(1);
    });

    std::vector<RecordingEvent> events;
    RecordingEvent event;
    while (events.size() < 3 && queue.Pop(event, 1s)) {
        events.push_back(event);
    }
    producer.join();

    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<Chunk>(events[0]));
    EXPECT_TRUE(std::holds_alternative<ErrorEvent>(events[1]));
    ASSERT_TRUE(std::holds_alternative<CompleteEvent>(events[2]));
    EXPECT_EQ(std::get<CompleteEvent>(events[2]).totalChunks, 1u);
    EXPECT_FALSE(queue.Pop(event, 10ms));
}
