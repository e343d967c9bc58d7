#include "Encoder/ContainerRecorderStrategy.hpp"
#include "Encoder/EncoderCapabilities.hpp"
#include "Encoder/EncodingEngine.hpp"
#include "Encoder/FrameEncoderStrategy.hpp"
#include "Encoder/OpusFrameEncoder.hpp"
#include "common/RecorderError.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace meetcapture;
using namespace std::chrono_literals;
using test_utils::CollectingSink;
using test_utils::RecordingStrategy;

namespace {

std::unique_ptr<AudioFrame> MakeFrame(size_t frames, int64_t timestampUs, int16_t value = 100) {
    auto frame = std::make_unique<AudioFrame>();
    frame->sampleRate = 16000;
    frame->channels = 2;
    frame->timestampUs = timestampUs;
    frame->samples.assign(frames * 2, value);
    return frame;
}

std::unique_ptr<AudioFrame> SineFrame(test_utils::TestAudioGenerator& generator, int64_t timestampUs) {
    auto frame = std::make_unique<AudioFrame>();
    frame->sampleRate = 16000;
    frame->channels = 2;
    frame->timestampUs = timestampUs;
    frame->samples = generator.Generate(320);
    return frame;
}

class EncodingEngineTest : public ::testing::Test {
protected:
    EncodingEngineTest() : stream(StreamFormat{16000, 2}, 1000) {}

    EncodingEngine::StrategyFactory Factory() {
        return [this](StreamFormat, IRecordingEventSink* s) {
            auto strategy = std::make_unique<RecordingStrategy>(s);
            strategy->failEvery = failEvery;
            recorded = strategy.get();
            return std::unique_ptr<IEncoderStrategy>(std::move(strategy));
        };
    }

    bool WaitForSubmitted(int count) {
        for (int i = 0; i < 200 && recorded->submitted.load() < count; ++i) {
            std::this_thread::sleep_for(5ms);
        }
        return recorded->submitted.load() >= count;
    }

    RecorderConfig config;
    CollectingSink sink;
    MixedStream stream;
    RecordingStrategy* recorded = nullptr;
    int failEvery = 0;
};

} // namespace

TEST_F(EncodingEngineTest, SubmitsEveryFrameAndCompletesOnStop) {
    EncodingEngine engine(config, &sink, Factory());
    EXPECT_EQ(engine.Start(stream), EncoderPath::Frame);

    auto track = stream.FirstLiveTrack();
    for (int i = 0; i < 10; ++i) {
        track->Push(MakeFrame(320, i * 20000));
    }
    ASSERT_TRUE(WaitForSubmitted(10));

    engine.Stop();
    EXPECT_EQ(recorded->stops.load(), 1);
    auto chunks = sink.Chunks();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].frames.size(), 10u);
    ASSERT_EQ(sink.Completes().size(), 1u);
    EXPECT_EQ(sink.Completes()[0], 1u);
}

TEST_F(EncodingEngineTest, SecondStartThrows) {
    EncodingEngine engine(config, &sink, Factory());
    engine.Start(stream);
    try {
        engine.Start(stream);
        FAIL() << "Expected AlreadyActive";
    } catch (const RecorderError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::AlreadyActive);
    }
}

TEST_F(EncodingEngineTest, StopIsIdempotent) {
    EncodingEngine engine(config, &sink, Factory());
    engine.Start(stream);
    engine.Stop();
    engine.Stop();
    EXPECT_EQ(recorded->stops.load(), 1);
    EXPECT_EQ(sink.Completes().size(), 1u);
    EXPECT_FALSE(engine.IsRunning());
}

TEST_F(EncodingEngineTest, EncodeFailureIsReportedAndLoopContinues) {
    failEvery = 3;
    EncodingEngine engine(config, &sink, Factory());
    engine.Start(stream);

    auto track = stream.FirstLiveTrack();
    for (int i = 0; i < 9; ++i) {
        track->Push(MakeFrame(320, i * 20000));
    }
    ASSERT_TRUE(WaitForSubmitted(9));
    engine.Stop();

    EXPECT_EQ(sink.Errors().size(), 3u);
    EXPECT_TRUE(sink.HasError(ErrorCode::EncodeFrameFailed));
    ASSERT_EQ(sink.Chunks().size(), 1u);
    EXPECT_EQ(sink.Chunks()[0].frames.size(), 6u);
}

TEST_F(EncodingEngineTest, ReaderFailureReportsAndFlushes) {
    EncodingEngine engine(config, &sink, Factory());
    engine.Start(stream);

    stream.FirstLiveTrack()->Fail("device lost");
    ASSERT_TRUE(sink.WaitForError(ErrorCode::TrackReaderFailed, 2s));
    for (int i = 0; i < 100 && engine.IsRunning(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_FALSE(engine.IsRunning());
    EXPECT_EQ(recorded->flushes.load(), 1);

    engine.Stop();
    EXPECT_EQ(sink.Completes().size(), 1u);
}

TEST_F(EncodingEngineTest, FramesWhilePausedAreDropped) {
    EncodingEngine engine(config, &sink, Factory());
    engine.Start(stream);
    auto track = stream.FirstLiveTrack();

    engine.Pause();
    EXPECT_TRUE(engine.IsPaused());
    EXPECT_EQ(recorded->pauses.load(), 1);
    for (int i = 0; i < 5; ++i) {
        track->Push(MakeFrame(320, i * 20000));
    }
    for (int i = 0; i < 100 && track->QueuedFrames() > 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(recorded->submitted.load(), 0);

    engine.Resume();
    EXPECT_EQ(recorded->resumes.load(), 1);
    track->Push(MakeFrame(320, 200000));
    ASSERT_TRUE(WaitForSubmitted(1));
    engine.Stop();
}

TEST_F(EncodingEngineTest, AbortSkipsFlushAndComplete) {
    EncodingEngine engine(config, &sink, Factory());
    engine.Start(stream);
    stream.FirstLiveTrack()->Push(MakeFrame(320, 0));
    ASSERT_TRUE(WaitForSubmitted(1));

    engine.Abort();
    engine.Stop();
    EXPECT_EQ(recorded->stops.load(), 0);
    EXPECT_TRUE(sink.Chunks().empty());
    EXPECT_TRUE(sink.Completes().empty());
}

TEST_F(EncodingEngineTest, EndedStreamWithoutLiveTrackIsRejected) {
    stream.FirstLiveTrack()->End();
    EncodingEngine engine(config, &sink, Factory());
    EXPECT_THROW(engine.Start(stream), RecorderError);
}

TEST(OpusFrameEncoderTest, EmitsOnePacketPerCodecFrame) {
    std::vector<CompressedFrame> packets;
    OpusFrameEncoder encoder(16000, 2, 16000, 20, [&packets](CompressedFrame p) { packets.push_back(std::move(p)); });
    ASSERT_EQ(encoder.FrameSize(), 320u);

    test_utils::TestAudioGenerator generator(16000, 2);
    auto pcm = generator.Generate(800);
    encoder.Encode(pcm.data(), 800, 0);
    EXPECT_EQ(packets.size(), 2u);
    EXPECT_EQ(encoder.PendingFrames(), 160u);
    EXPECT_EQ(packets[0].timestampUs, 0);
    EXPECT_EQ(packets[1].timestampUs, 20000);
    for (const auto& packet : packets) {
        EXPECT_GT(packet.Size(), 0u);
    }

    encoder.Flush();
    EXPECT_EQ(packets.size(), 3u);
    EXPECT_EQ(encoder.PendingFrames(), 0u);
    encoder.Flush();
    EXPECT_EQ(packets.size(), 3u);
}

TEST(OpusFrameEncoderTest, RejectsUnsupportedFormat) {
    EXPECT_FALSE(OpusFrameEncoder::IsSupported(44100, 2));
    EXPECT_FALSE(OpusFrameEncoder::IsSupported(16000, 6));
    EXPECT_TRUE(OpusFrameEncoder::IsSupported(16000, 2));
    EXPECT_THROW(OpusFrameEncoder(44100, 2, 16000, 20, nullptr), RecorderError);
}

TEST(FrameEncoderStrategyTest, OpusPathProducesStopChunk) {
    RecorderConfig config;
    CollectingSink sink;
    FrameEncoderStrategy strategy(config.encoder, config.chunking, StreamFormat{16000, 2}, &sink);
    test_utils::TestAudioGenerator generator(16000, 2);

    for (int i = 0; i < 50; ++i) {
        strategy.Submit(*SineFrame(generator, i * 20000));
    }
    EXPECT_EQ(strategy.Stop(), 1u);

    auto chunks = sink.Chunks();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].reason, FlushReason::Stop);
    EXPECT_EQ(chunks[0].frames.size(), 50u);
    EXPECT_EQ(chunks[0].sampleRate, 16000u);
    EXPECT_EQ(chunks[0].channels, 2u);
    EXPECT_EQ(sink.Completes().size(), 0u);
}

TEST(FrameEncoderStrategyTest, ResamplesToEncoderRate) {
    RecorderConfig config;
    CollectingSink sink;
    FrameEncoderStrategy strategy(config.encoder, config.chunking, StreamFormat{48000, 2}, &sink);

    auto frame = std::make_unique<AudioFrame>();
    frame->sampleRate = 48000;
    frame->channels = 2;
    test_utils::TestAudioGenerator generator(48000, 2);
    frame->samples = generator.Generate(960 * 5);
    strategy.Submit(*frame);

    EXPECT_EQ(strategy.Stop(), 1u);
    ASSERT_EQ(sink.Chunks().size(), 1u);
    EXPECT_EQ(sink.Chunks()[0].frames.size(), 5u);
    EXPECT_EQ(sink.Chunks()[0].sampleRate, 16000u);
}

TEST(FrameEncoderStrategyTest, PauseFlushesPartialCodecFrame) {
    RecorderConfig config;
    CollectingSink sink;
    FrameEncoderStrategy strategy(config.encoder, config.chunking, StreamFormat{16000, 2}, &sink);

    strategy.Submit(*MakeFrame(100, 0));
    strategy.Pause();
    ASSERT_EQ(sink.Chunks().size(), 1u);
    EXPECT_EQ(sink.Chunks()[0].reason, FlushReason::Pause);
    EXPECT_EQ(sink.Chunks()[0].frames.size(), 1u);

    strategy.Resume();
    EXPECT_EQ(strategy.Stop(), 1u);
}

TEST(FrameEncoderStrategyTest, AudioSubmittedWhilePausedNeverReachesCodec) {
    RecorderConfig config;
    CollectingSink sink;
    FrameEncoderStrategy strategy(config.encoder, config.chunking, StreamFormat{16000, 2}, &sink);
    test_utils::TestAudioGenerator generator(16000, 2);

    strategy.Submit(*SineFrame(generator, 0));
    strategy.Submit(*MakeFrame(100, 20000));
    strategy.Pause();
    ASSERT_EQ(sink.Chunks().size(), 1u);
    EXPECT_EQ(sink.Chunks()[0].frames.size(), 2u);

    // A whole codec frame and a partial one; neither may surface later.
    strategy.Submit(*SineFrame(generator, 40000));
    strategy.Submit(*MakeFrame(100, 60000));
    EXPECT_EQ(strategy.Assembler().PendingFrames(), 0u);

    strategy.Resume();
    strategy.Submit(*SineFrame(generator, 500000));
    EXPECT_EQ(strategy.Stop(), 2u);

    auto chunks = sink.Chunks();
    ASSERT_EQ(chunks.size(), 2u);
    ASSERT_EQ(chunks[1].frames.size(), 1u);
    EXPECT_EQ(chunks[1].frames[0].timestampUs, 500000);
    EXPECT_TRUE(sink.Errors().empty());
}

TEST(FrameEncoderStrategyTest, PauseRacingSubmitKeepsEveryEncodedPacket) {
    RecorderConfig config;
    CollectingSink sink;
    FrameEncoderStrategy strategy(config.encoder, config.chunking, StreamFormat{16000, 2}, &sink);

    std::atomic<bool> running{true};
    std::thread reader([&] {
        test_utils::TestAudioGenerator generator(16000, 2);
        int64_t ts = 0;
        while (running) {
            strategy.Submit(*SineFrame(generator, ts));
            ts += 20000;
        }
    });
    std::this_thread::sleep_for(20ms);
    strategy.Pause();
    const size_t pendingAfterPause = strategy.Assembler().PendingFrames();
    std::this_thread::sleep_for(20ms);
    running = false;
    reader.join();

    EXPECT_EQ(pendingAfterPause, 0u);
    EXPECT_EQ(strategy.Assembler().PendingFrames(), 0u);
    strategy.Resume();
    EXPECT_EQ(strategy.Stop(), sink.Chunks().size());
}

TEST(EncoderCapabilitiesTest, FrameEncoderPreferred) {
    EncoderCapabilities both{true, true};
    EXPECT_EQ(SelectEncoderPath(both), EncoderPath::Frame);

    EncoderCapabilities legacyOnly{false, true};
    EXPECT_EQ(SelectEncoderPath(legacyOnly), EncoderPath::Container);

    EncoderCapabilities none{false, false};
    try {
        SelectEncoderPath(none);
        FAIL() << "Expected EncoderUnavailable";
    } catch (const RecorderError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::EncoderUnavailable);
    }
}

TEST(EncoderCapabilitiesTest, DisabledFrameEncoderIsNotProbed) {
    RecorderConfig config;
    config.encoder.enableFrameEncoder = false;
    EXPECT_FALSE(ProbeEncoderCapabilities(config, StreamFormat{16000, 2}).frameEncoder);
}

TEST(ContainerRecorderStrategyTest, SlicesAreCompleteOggFiles) {
    if (!ContainerRecorderStrategy::IsSupported(16000, 2)) {
        GTEST_SKIP() << "libsndfile built without Ogg/Opus";
    }
    RecorderConfig config;
    config.encoder.containerSliceMs = 1000;
    CollectingSink sink;
    ContainerRecorderStrategy strategy(config.encoder, StreamFormat{16000, 2}, &sink);
    test_utils::TestAudioGenerator generator(16000, 2);

    // 2.5 seconds of audio: two full slices and one partial slice on stop.
    for (int i = 0; i < 125; ++i) {
        strategy.Submit(*SineFrame(generator, i * 20000));
    }
    EXPECT_EQ(sink.Chunks().size(), 2u);
    EXPECT_EQ(strategy.Stop(), 3u);

    auto chunks = sink.Chunks();
    ASSERT_EQ(chunks.size(), 3u);
    for (const auto& chunk : chunks) {
        EXPECT_EQ(chunk.reason, FlushReason::Legacy);
        ASSERT_EQ(chunk.frames.size(), 1u);
        const auto& bytes = chunk.frames[0].data;
        ASSERT_GE(bytes.size(), 4u);
        EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "OggS");
        EXPECT_EQ(chunk.totalBytes, bytes.size());
    }
    EXPECT_EQ(chunks[1].frames[0].timestampUs, 1000000);
}
