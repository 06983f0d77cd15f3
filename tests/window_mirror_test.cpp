#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "WindowMirror.hpp"
#include "test_fakes.hpp"

namespace KUCHIPAKU {
namespace {

    using json = nlohmann::json;
    using fakes::RecordingMirrorTarget;

    TEST(WindowMirrorTest, SendStatePostsStateUpdate) {
        RecordingMirrorTarget target;
        PlaybackState state;
        state.is_playing = true;
        state.active_index = 2;
        state.openness = 0.5f;

        SendState(&target, state);

        ASSERT_EQ(target.messages.size(), 1u);
        json j = json::parse(target.messages[0]);
        EXPECT_EQ(j["type"].get<std::string>(), "STATE_UPDATE");
        EXPECT_TRUE(j["payload"]["isPlaying"].get<bool>());
        EXPECT_EQ(j["payload"]["activeIndex"].get<int>(), 2);
        EXPECT_FLOAT_EQ(j["payload"]["opennessValue"].get<float>(), 0.5f);
    }

    TEST(WindowMirrorTest, SendStateToNullTargetDoesNothing) {
        PlaybackState state;
        state.is_playing = true;
        EXPECT_NO_THROW(SendState(nullptr, state));
    }

    TEST(WindowMirrorTest, SendStateToClosedTargetDoesNothing) {
        RecordingMirrorTarget target;
        target.open = false;
        SendState(&target, PlaybackState());
        EXPECT_TRUE(target.messages.empty());
    }

    TEST(WindowMirrorTest, EncodedMessageDecodes) {
        MirrorMessage message;
        message.payload.is_playing = true;
        message.payload.active_index = 4;
        message.payload.openness = 0.25f;

        MirrorMessage decoded;
        ASSERT_TRUE(DecodeMirrorLine(EncodeMirrorMessage(message).dump(), &decoded));
        EXPECT_EQ(decoded.kind, MirrorMessageKind::StateUpdate);
        EXPECT_TRUE(decoded.payload.is_playing);
        EXPECT_EQ(decoded.payload.active_index, 4);
        EXPECT_FLOAT_EQ(decoded.payload.openness, 0.25f);
    }

    TEST(WindowMirrorTest, DecodeAppliesDefaultsAndClamps) {
        MirrorMessage decoded;
        ASSERT_TRUE(DecodeMirrorMessage(
            json::parse(R"({"type":"STATE_UPDATE","payload":{"isPlaying":false}})"), &decoded));
        EXPECT_FALSE(decoded.payload.is_playing);
        EXPECT_EQ(decoded.payload.active_index, -1);
        EXPECT_FLOAT_EQ(decoded.payload.openness, 0.0f);

        ASSERT_TRUE(DecodeMirrorMessage(
            json::parse(R"({"type":"STATE_UPDATE","payload":{"isPlaying":true,"opennessValue":3.0}})"),
            &decoded));
        EXPECT_FLOAT_EQ(decoded.payload.openness, 1.0f);
    }

    TEST(WindowMirrorTest, DecodeRejectsMalformedMessages) {
        MirrorMessage decoded;
        EXPECT_FALSE(DecodeMirrorLine("not json", &decoded));
        EXPECT_FALSE(DecodeMirrorLine("[]", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(R"({"payload":{"isPlaying":true}})", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(R"({"type":"RELOAD","payload":{"isPlaying":true}})", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(R"({"type":"STATE_UPDATE"})", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(R"({"type":"STATE_UPDATE","payload":{}})", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(R"({"type":"STATE_UPDATE","payload":{"isPlaying":"yes"}})", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(
            R"({"type":"STATE_UPDATE","payload":{"isPlaying":true,"opennessValue":"wide"}})", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(
            R"({"type":"STATE_UPDATE","payload":{"isPlaying":true,"activeIndex":-5}})", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(
            R"({"type":"STATE_UPDATE","payload":{"isPlaying":true,"activeIndex":1.5}})", &decoded));
    }

    TEST(WindowMirrorTest, DecodeRejectsIndexOutsideIntRange) {
        MirrorMessage decoded;
        EXPECT_FALSE(DecodeMirrorLine(
            R"({"type":"STATE_UPDATE","payload":{"isPlaying":true,"activeIndex":4294967295}})", &decoded));
        EXPECT_FALSE(DecodeMirrorLine(
            R"({"type":"STATE_UPDATE","payload":{"isPlaying":true,"activeIndex":-4294967297}})", &decoded));
        ASSERT_TRUE(DecodeMirrorLine(
            R"({"type":"STATE_UPDATE","payload":{"isPlaying":true,"activeIndex":2147483647}})", &decoded));
        EXPECT_EQ(decoded.payload.active_index, 2147483647);
    }

    TEST(MirrorReceiverTest, ReassemblesSplitLines) {
        MirrorReceiver receiver;
        std::string line = R"({"type":"STATE_UPDATE","payload":{"isPlaying":true,"activeIndex":1}})";

        EXPECT_TRUE(receiver.Feed(line.substr(0, 10)).empty());
        std::vector<MirrorMessage> messages = receiver.Feed(line.substr(10) + "\n");
        ASSERT_EQ(messages.size(), 1u);
        EXPECT_EQ(messages[0].payload.active_index, 1);
    }

    TEST(MirrorReceiverTest, DropsInvalidLinesAndKeepsGoing) {
        MirrorReceiver receiver;
        std::string chunk =
            "garbage\n"
            "{\"type\":\"STATE_UPDATE\",\"payload\":{\"isPlaying\":true}}\r\n"
            "\n"
            "{\"type\":\"OTHER\",\"payload\":{}}\n"
            "{\"type\":\"STATE_UPDATE\",\"payload\":{\"isPlaying\":false}}\n";

        std::vector<MirrorMessage> messages = receiver.Feed(chunk);
        ASSERT_EQ(messages.size(), 2u);
        EXPECT_TRUE(messages[0].payload.is_playing);
        EXPECT_FALSE(messages[1].payload.is_playing);
        EXPECT_EQ(receiver.GetRejectedCount(), 2);
    }

}  // namespace
}  // namespace KUCHIPAKU
