#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ScriptManifest.hpp"
#include "test_fakes.hpp"

namespace KUCHIPAKU {
namespace {

    using json = nlohmann::json;
    using fakes::FakeTransport;
    using fakes::TransportControl;

    const std::string kDataDir = KUCHIPAKU_TEST_DATA_DIR;

    TEST(ScriptManifestTest, LoadsAndPairsLinesWithAudio) {
        std::vector<ScriptLine> lines;
        ASSERT_TRUE(LoadScriptManifestFromFile(kDataDir + "/manzai.json", &lines));
        ASSERT_EQ(lines.size(), 3u);

        EXPECT_EQ(lines[0].role, Role::Lead);
        EXPECT_EQ(lines[0].text, "どうもー");
        EXPECT_EQ(lines[0].audio_path, kDataDir + "/audio/line0.wav");
        EXPECT_EQ(lines[0].timing_path, kDataDir + "/timing/line0.json");

        EXPECT_EQ(lines[1].role, Role::Foil);
        EXPECT_EQ(lines[1].audio_path, "/srv/audio/line1.wav");
        EXPECT_TRUE(lines[1].timing_path.empty());

        EXPECT_EQ(lines[2].role, Role::Lead);
    }

    TEST(ScriptManifestTest, SkipsUnusableEntries) {
        json j = json::parse(R"({
            "script": [
                {"role": "lead", "text": "one"},
                {"role": "narrator", "text": "two"},
                {"role": "foil", "text": ""},
                "three",
                {"role": "foil", "text": "four"},
                {"role": "lead", "text": "five"}
            ],
            "audio_data": [
                {"audio_path": "1.wav"},
                {"audio_path": "2.wav"},
                {"audio_path": "3.wav"},
                {"audio_path": "4.wav"},
                {"role": "boke", "audio_path": "5.wav"}
            ]})");

        std::vector<ScriptLine> lines = ParseScriptManifest(j, "clips");
        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(lines[0].text, "one");
        EXPECT_EQ(lines[0].audio_path, "clips/1.wav");
        EXPECT_EQ(lines[1].text, "four");
        EXPECT_EQ(lines[1].role, Role::Foil);
        EXPECT_EQ(lines[1].audio_path, "clips/5.wav");
    }

    TEST(ScriptManifestTest, MissingArraysYieldNothing) {
        EXPECT_TRUE(ParseScriptManifest(json::parse(R"({"script": []})")).empty());
        EXPECT_TRUE(ParseScriptManifest(json::parse(R"({"audio_data": []})")).empty());
        EXPECT_TRUE(ParseScriptManifest(json::parse("[1, 2]")).empty());

        std::vector<ScriptLine> lines;
        EXPECT_FALSE(LoadScriptManifestFromFile(kDataDir + "/missing.json", &lines));
        EXPECT_TRUE(lines.empty());
    }

    TEST(ScriptManifestTest, MakeSegmentsGivesEachLineItsOwnTransport) {
        std::vector<ScriptLine> lines(2);
        lines[0].role = Role::Lead;
        lines[0].text = "a";
        lines[0].audio_path = "a.wav";
        lines[0].timing_path = "a.json";
        lines[1].role = Role::Foil;
        lines[1].text = "b";
        lines[1].audio_path = "b.wav";

        StageConfig config = DefaultStageConfig();
        config.foil.speaker_id = 9;

        std::vector<std::string> opened;
        std::vector<Segment> segments = MakeSegments(lines, config,
            [&opened](const std::string& audio_path) -> std::unique_ptr<Transport> {
                opened.push_back(audio_path);
                return std::make_unique<FakeTransport>(std::make_shared<TransportControl>());
            });

        ASSERT_EQ(segments.size(), 2u);
        EXPECT_EQ(opened, (std::vector<std::string>{"a.wav", "b.wav"}));
        EXPECT_EQ(segments[0].speaker_id, 1);
        EXPECT_EQ(segments[0].timing_path, "a.json");
        EXPECT_EQ(segments[1].speaker_id, 9);
        EXPECT_EQ(segments[1].text, "b");
        ASSERT_TRUE(segments[0].transport);
        ASSERT_TRUE(segments[1].transport);
        EXPECT_NE(segments[0].transport.get(), segments[1].transport.get());
    }

}  // namespace
}  // namespace KUCHIPAKU
