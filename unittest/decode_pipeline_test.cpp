// ============================================================================
// EVENT DECODE PIPELINE UNIT TESTS
// ============================================================================
// End-to-end: base64 blob -> ordered typed events
// - Frame count and ordering
// - Trailing partial frame policies
// - Per-frame failure isolation (skip) and abort
// - Idempotence across the base64 and raw-bytes paths
// ============================================================================

#include <gtest/gtest.h>
#include <pumpevents/core/codec/base64.hpp>
#include <pumpevents/core/events/errors.hpp>
#include <pumpevents/core/pipeline/decode_pipeline.hpp>
#include "frame_builder.hpp"
#include <algorithm>
#include <variant>

using namespace PumpEvents;

// ============================================================================
// TEST CLASS
// ============================================================================
class DecodePipelineTest : public ::testing::Test {
protected:
    EventDecodePipeline makePipeline(DecodeOptions options = {}) {
        return EventDecodePipeline(TestFrames::testRegistry(),
                                   TimestampResolver("America/Los_Angeles"), options);
    }

    static std::vector<uint8_t> glucoseBuffer(size_t frames) {
        std::vector<uint8_t> buffer;
        for (uint32_t i = 0; i < frames; ++i)
            TestFrames::append(buffer, TestFrames::glucoseFrame(1000 + i * 300, i + 1,
                                                                static_cast<uint16_t>(90 + i)));
        return buffer;
    }
};

// ============================================================================
// HAPPY PATH
// ============================================================================

TEST_F(DecodePipelineTest, TwoGlucoseFramesInOrder) {
    std::vector<uint8_t> buffer;
    TestFrames::append(buffer, TestFrames::glucoseFrame(100, 1, 110));
    TestFrames::append(buffer, TestFrames::glucoseFrame(200, 2, 115));
    ASSERT_EQ(buffer.size(), 52u);

    auto pipeline = makePipeline();
    DecodeResult result = pipeline.decodeAll(Base64::encode(buffer));

    ASSERT_EQ(result.events.size(), 2u);
    EXPECT_TRUE(result.rejected.empty());
    const auto& first = std::get<GlucoseReading>(result.events[0]);
    const auto& second = std::get<GlucoseReading>(result.events[1]);
    EXPECT_EQ(first.glucose_mg_dl, 110);
    EXPECT_EQ(second.glucose_mg_dl, 115);
    EXPECT_EQ(second.common.timestamp.wall_seconds - first.common.timestamp.wall_seconds, 100);
    EXPECT_EQ(first.common.timestamp.toIsoString(), "2008-01-01T00:01:40-08:00");
}

TEST_F(DecodePipelineTest, EventCountEqualsFrameCount) {
    auto pipeline = makePipeline();
    for (size_t frames : {0u, 1u, 5u, 40u}) {
        DecodeResult result = pipeline.decodeBytes(glucoseBuffer(frames)).collect();
        EXPECT_EQ(result.events.size(), frames);
        EXPECT_EQ(result.frame_count, frames);
    }
}

TEST_F(DecodePipelineTest, MixedKindsDispatchToTheirRecords) {
    std::vector<uint8_t> buffer;
    TestFrames::append(buffer, TestFrames::glucoseFrame(10, 1, 140));

    std::vector<uint8_t> basal(PAYLOAD_SIZE, 0);
    TestFrames::putFloat(basal, 0, 1.1f);
    TestFrames::putFloat(basal, 4, 1.0f);
    TestFrames::putFloat(basal, 8, 5.0f);
    TestFrames::append(buffer, TestFrames::buildFrame(0, TestFrames::BASAL_CHANGE_ID, 20, 2, basal));

    std::vector<uint8_t> delivery(PAYLOAD_SIZE, 0);
    TestFrames::putUint16(delivery, 4, 750);
    TestFrames::append(buffer, TestFrames::buildFrame(0, TestFrames::BASAL_DELIVERY_ID, 30, 3, delivery));

    std::vector<uint8_t> carbs(PAYLOAD_SIZE, 0);
    TestFrames::putFloat(carbs, 0, 30.0f);
    TestFrames::append(buffer, TestFrames::buildFrame(0, TestFrames::CARBS_ID, 40, 4, carbs));

    DecodeResult result = makePipeline().decodeBytes(buffer).collect();
    ASSERT_EQ(result.events.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<GlucoseReading>(result.events[0]));
    EXPECT_TRUE(std::holds_alternative<BasalRateChange>(result.events[1]));
    EXPECT_TRUE(std::holds_alternative<BasalDelivery>(result.events[2]));
    EXPECT_TRUE(std::holds_alternative<GenericEvent>(result.events[3]));
    EXPECT_DOUBLE_EQ(std::get<BasalDelivery>(result.events[2]).profile_rate, 0.75);

    for (size_t i = 0; i < result.events.size(); ++i)
        EXPECT_EQ(commonOf(result.events[i]).sequence_number, i + 1);
}

TEST_F(DecodePipelineTest, EventKeepsCopyOfItsFrame) {
    std::vector<uint8_t> buffer = glucoseBuffer(2);
    DecodeResult result = makePipeline().decodeBytes(buffer).collect();
    ASSERT_EQ(result.events.size(), 2u);

    const RawFrame& raw = commonOf(result.events[1]).raw;
    EXPECT_TRUE(std::equal(raw.begin(), raw.end(), buffer.begin() + FRAME_SIZE));
}

// ============================================================================
// LAZY ITERATION
// ============================================================================

TEST_F(DecodePipelineTest, StreamIsRestartable) {
    auto pipeline = makePipeline();
    DecodedEventStream stream = pipeline.decodeBytes(glucoseBuffer(3));

    std::vector<DecodedEvent> first(stream.begin(), stream.end());
    std::vector<DecodedEvent> second(stream.begin(), stream.end());
    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(first, second);
}

TEST_F(DecodePipelineTest, ConsumerMayStopEarly) {
    DecodedEventStream stream = makePipeline().decodeBytes(glucoseBuffer(10));
    auto it = stream.begin();
    ASSERT_NE(it, stream.end());
    EXPECT_EQ(std::get<GlucoseReading>(*it).glucose_mg_dl, 90);
    ++it;
    EXPECT_EQ(std::get<GlucoseReading>(*it).glucose_mg_dl, 91);
}

TEST_F(DecodePipelineTest, PostIncrementReturnsPreviousEvent) {
    DecodedEventStream stream = makePipeline().decodeBytes(glucoseBuffer(3));
    auto it = stream.begin();

    auto previous = it++;
    EXPECT_EQ(std::get<GlucoseReading>(*previous).glucose_mg_dl, 90);
    EXPECT_EQ(std::get<GlucoseReading>(*it).glucose_mg_dl, 91);

    it++;
    it++;
    EXPECT_EQ(it, stream.end());
}

TEST_F(DecodePipelineTest, EmptyInputYieldsNothing) {
    DecodedEventStream stream = makePipeline().decode("");
    EXPECT_EQ(stream.begin(), stream.end());
    EXPECT_EQ(stream.frameCount(), 0u);
}

// ============================================================================
// TRAILING BYTES
// ============================================================================

TEST_F(DecodePipelineTest, TrailingBytesDroppedByDefault) {
    std::vector<uint8_t> buffer = glucoseBuffer(2);
    buffer.insert(buffer.end(), 11, 0x42);

    DecodeResult result = makePipeline().decodeBytes(buffer).collect();
    EXPECT_EQ(result.events.size(), 2u);
    EXPECT_EQ(result.trailing_bytes, 11u);
    EXPECT_TRUE(result.rejected.empty());
}

TEST_F(DecodePipelineTest, TrailingBytesRejectedOnRequest) {
    DecodeOptions options;
    options.on_trailing_bytes = TrailingBytesPolicy::REJECT;
    auto pipeline = makePipeline(options);

    std::vector<uint8_t> buffer = glucoseBuffer(2);
    buffer.push_back(0x00);

    try {
        pipeline.decodeBytes(buffer);
        FAIL() << "Expected TruncatedFrameError";
    } catch (const TruncatedFrameError& e) {
        EXPECT_EQ(e.trailingBytes(), 1u);
    }

    EXPECT_NO_THROW(pipeline.decodeBytes(glucoseBuffer(2)));
}

// ============================================================================
// FAILURE ISOLATION
// ============================================================================

TEST_F(DecodePipelineTest, UnknownTypeIsSkippedAndLaterFramesDecode) {
    std::vector<uint8_t> buffer;
    TestFrames::append(buffer, TestFrames::glucoseFrame(100, 1, 100));
    TestFrames::append(buffer, TestFrames::buildFrame(0, 0x0ABC, 150, 2));
    TestFrames::append(buffer, TestFrames::glucoseFrame(200, 3, 120));

    RejectedFrameLog log;
    auto pipeline = makePipeline();
    pipeline.setRejectedFrameLog(&log);

    DecodeResult result = pipeline.decodeBytes(buffer).collect();
    ASSERT_EQ(result.events.size(), 2u);
    EXPECT_EQ(std::get<GlucoseReading>(result.events[0]).glucose_mg_dl, 100);
    EXPECT_EQ(std::get<GlucoseReading>(result.events[1]).glucose_mg_dl, 120);
    EXPECT_EQ(commonOf(result.events[1]).sequence_number, 3u);

    ASSERT_EQ(result.rejected.size(), 1u);
    EXPECT_EQ(result.rejected[0].reason, RejectReason::UNKNOWN_EVENT_TYPE);
    EXPECT_EQ(result.rejected[0].frame_index, 1u);
    EXPECT_EQ(result.rejected[0].type_id, 0x0ABC);
    EXPECT_EQ(result.rejected[0].sequence_number, 2u);

    EXPECT_EQ(log.totalRejected(), 1u);
}

TEST_F(DecodePipelineTest, LazyIterationAlsoSkipsUnknownTypes) {
    std::vector<uint8_t> buffer;
    TestFrames::append(buffer, TestFrames::buildFrame(0, 0x0FFF, 1, 1));
    TestFrames::append(buffer, TestFrames::glucoseFrame(2, 2, 101));
    TestFrames::append(buffer, TestFrames::buildFrame(0, 0x0FFE, 3, 3));

    RejectedFrameLog log;
    auto pipeline = makePipeline();
    pipeline.setRejectedFrameLog(&log);

    size_t n = 0;
    for (const auto& event : pipeline.decodeBytes(buffer)) {
        EXPECT_EQ(commonOf(event).sequence_number, 2u);
        ++n;
    }
    EXPECT_EQ(n, 1u);
    EXPECT_EQ(log.totalRejected(), 2u);
}

TEST_F(DecodePipelineTest, RepeatedPassesReportEachSkippedFrameOnce) {
    std::vector<uint8_t> buffer;
    TestFrames::append(buffer, TestFrames::glucoseFrame(100, 1, 100));
    TestFrames::append(buffer, TestFrames::buildFrame(0, 0x0ABC, 150, 2));

    RejectedFrameLog log;
    auto pipeline = makePipeline();
    pipeline.setRejectedFrameLog(&log);

    DecodedEventStream stream = pipeline.decodeBytes(buffer);
    for (int pass = 0; pass < 2; ++pass) {
        size_t n = 0;
        for (auto it = stream.begin(); it != stream.end(); ++it) ++n;
        EXPECT_EQ(n, 1u);
    }

    // collect() still lists the rejection for its own caller
    DecodeResult result = stream.collect();
    EXPECT_EQ(result.rejected.size(), 1u);

    DecodedEventStream copy = stream;
    copy.collect();

    EXPECT_EQ(log.totalRejected(), 1u);
    EXPECT_EQ(log.size(), 1u);

    // A new decode of the same bytes is a separate fetch and is reported again
    pipeline.decodeBytes(buffer).collect();
    EXPECT_EQ(log.totalRejected(), 2u);
}

TEST_F(DecodePipelineTest, AllFramesUnknownYieldsNoEvents) {
    std::vector<uint8_t> buffer;
    for (uint32_t i = 0; i < 3; ++i)
        TestFrames::append(buffer, TestFrames::buildFrame(0, 999, i, i));

    DecodeResult result = makePipeline().decodeBytes(buffer).collect();
    EXPECT_TRUE(result.events.empty());
    EXPECT_EQ(result.rejected.size(), 3u);
}

TEST_F(DecodePipelineTest, AbortPolicyRethrowsFirstFrameError) {
    DecodeOptions options;
    options.on_frame_error = FrameErrorPolicy::ABORT;
    auto pipeline = makePipeline(options);

    std::vector<uint8_t> buffer;
    TestFrames::append(buffer, TestFrames::glucoseFrame(100, 1, 100));
    TestFrames::append(buffer, TestFrames::buildFrame(0, 0x0ABC, 150, 2));
    TestFrames::append(buffer, TestFrames::glucoseFrame(200, 3, 120));

    DecodedEventStream stream = pipeline.decodeBytes(buffer);
    EXPECT_THROW(stream.collect(), UnknownEventTypeError);

    // The frame before the bad one is still delivered lazily
    auto it = stream.begin();
    EXPECT_EQ(std::get<GlucoseReading>(*it).glucose_mg_dl, 100);
    EXPECT_THROW(++it, UnknownEventTypeError);
}

// ============================================================================
// ENCODING & IDEMPOTENCE
// ============================================================================

TEST_F(DecodePipelineTest, InvalidBase64AbortsTheCall) {
    auto pipeline = makePipeline();
    EXPECT_THROW(pipeline.decode("not base64!"), InvalidEncodingError);
    EXPECT_THROW(pipeline.decodeAll("AAA"), InvalidEncodingError);
}

TEST_F(DecodePipelineTest, Base64AndRawPathsAgree) {
    std::vector<uint8_t> buffer = glucoseBuffer(6);
    auto pipeline = makePipeline();

    DecodeResult fromText = pipeline.decodeAll(Base64::encode(buffer));
    DecodeResult fromBytes = pipeline.decodeBytes(buffer).collect();
    EXPECT_EQ(fromText.events, fromBytes.events);
}

TEST_F(DecodePipelineTest, RepeatedDecodesAreIdentical) {
    std::string blob = Base64::encode(glucoseBuffer(8));

    DecodeResult a = makePipeline().decodeAll(blob);
    DecodeResult b = makePipeline().decodeAll(blob);   // fresh registry and pipeline
    ASSERT_EQ(a.events.size(), 8u);
    EXPECT_EQ(a.events, b.events);
}

TEST(EventDecodePipeline, RequiresRegistry) {
    EXPECT_THROW(EventDecodePipeline(nullptr, TimestampResolver("UTC")), std::invalid_argument);
}
