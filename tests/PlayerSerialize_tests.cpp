#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>

#include "assets/AssetStorage.hpp"
#include "serializers/PlayerSerialize.hpp"

using namespace lplay;
using namespace lplay::player;
using namespace lplay::serializers;
using json = nlohmann::json;

namespace {
    const char* button_definition = R"({
        "initial_state": "idle",
        "states": [
            {
                "id": "idle",
                "asset": "button",
                "transitions": [ { "on": "mouse_enter", "state": "hover" } ]
            },
            {
                "id": "hover",
                "playback_settings": { "direction": "reverse", "looping": 2, "segments": [10, null] },
                "theme": { "name": "hot", "colors": { "fill": [1, 0, 0, 1] } },
                "reset_playhead_on_start": true,
                "transitions": [
                    { "on": "mouse_leave", "state": "idle" },
                    { "on": "after", "secs": 2.5, "state": "idle" }
                ]
            }
        ]
    })";

    class PlayerSerializeTest : public ::testing::Test {
    protected:
        assets::AssetStorage storage;
        assets::VectorAssetHandle button;

        void SetUp() override {
            button = storage.reserve("button");
        }
    };
}

TEST(PlaybackSettingsSerialize, DefaultsForMissingKeys) {
    auto s = deserialize_playback_settings(json::object());
    EXPECT_EQ(s, playback::PlaybackSettings{});
}

TEST(PlaybackSettingsSerialize, ParsesAllFields) {
    auto s = deserialize_playback_settings(json::parse(R"({
        "autoplay": false, "direction": "reverse", "speed": 0.5,
        "intermission": 12, "looping": "none", "segments": [5, 50]
    })"));

    EXPECT_FALSE(s.autoplay);
    EXPECT_EQ(s.direction, playback::PlaybackDirection::Reverse);
    EXPECT_FLOAT_EQ(s.speed, 0.5f);
    EXPECT_FLOAT_EQ(s.intermission, 12.0f);
    EXPECT_EQ(s.looping, playback::PlaybackLoopBehavior::do_not_loop());
    EXPECT_FLOAT_EQ(s.segments.start, 5.0f);
    EXPECT_FLOAT_EQ(s.segments.end, 50.0f);
}

TEST(PlaybackSettingsSerialize, WritesDefaultSegmentsAsNull) {
    auto j = serialize_playback_settings(playback::PlaybackSettings{});
    EXPECT_TRUE(j["segments"][0].is_null());
    EXPECT_TRUE(j["segments"][1].is_null());
    EXPECT_EQ(j["looping"], "loop");
    EXPECT_EQ(j["direction"], "normal");
    EXPECT_EQ(deserialize_playback_settings(j), playback::PlaybackSettings{});
}

TEST(PlaybackSettingsSerialize, RejectsBadValues) {
    EXPECT_THROW(deserialize_playback_settings(json::parse(R"({ "direction": "sideways" })")), ConfigError);
    EXPECT_THROW(deserialize_playback_settings(json::parse(R"({ "looping": "forever" })")), ConfigError);
    EXPECT_THROW(deserialize_playback_settings(json::parse(R"({ "looping": -1 })")), ConfigError);
    EXPECT_THROW(deserialize_playback_settings(json::parse(R"({ "speed": "fast" })")), ConfigError);
    EXPECT_THROW(deserialize_playback_settings(json::parse(R"({ "segments": [1] })")), ConfigError);
    EXPECT_THROW(deserialize_playback_settings(json::array()), ConfigError);
}

TEST(TransitionSerialize, AllTriggers) {
    const std::vector<AnimationTransition> transitions{
        OnAfter{ "a", 1.5f }, OnComplete{ "b" }, OnMouseEnter{ "c" },
        OnMouseClick{ "d" }, OnMouseLeave{ "e" }, OnShow{ "f" }
    };
    for (const auto& t : transitions) {
        auto back = deserialize_transition(serialize_transition(t));
        EXPECT_EQ(back.index(), t.index());
        EXPECT_EQ(target(back), target(t));
    }
    auto after = deserialize_transition(serialize_transition(OnAfter{ "a", 1.5f }));
    EXPECT_FLOAT_EQ(std::get<OnAfter>(after).secs, 1.5f);
}

TEST(TransitionSerialize, RejectsMalformed) {
    EXPECT_THROW(deserialize_transition(json::parse(R"({ "on": "hover", "state": "a" })")), ConfigError);
    EXPECT_THROW(deserialize_transition(json::parse(R"({ "on": "show" })")), ConfigError);
    EXPECT_THROW(deserialize_transition(json::parse(R"({ "on": "after", "state": "a" })")), ConfigError);
}

TEST_F(PlayerSerializeTest, LoadsDefinition) {
    auto p = deserialize_player(json::parse(button_definition), storage);

    EXPECT_EQ(p.initial_state(), StateId{ "idle" });
    ASSERT_EQ(p.states().size(), 2u);

    const auto* idle = p.find_state("idle");
    ASSERT_NE(idle, nullptr);
    EXPECT_EQ(idle->asset, button);
    ASSERT_EQ(idle->transitions.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<OnMouseEnter>(idle->transitions[0]));

    const auto* hover = p.find_state("hover");
    ASSERT_NE(hover, nullptr);
    EXPECT_FALSE(hover->asset.has_value());
    EXPECT_TRUE(hover->reset_playhead_on_start);
    EXPECT_FALSE(hover->reset_playhead_on_transition);
    ASSERT_TRUE(hover->playback_settings.has_value());
    EXPECT_EQ(hover->playback_settings->looping, playback::PlaybackLoopBehavior::times(2));
    EXPECT_FLOAT_EQ(hover->playback_settings->segments.start, 10.0f);
    EXPECT_EQ(hover->playback_settings->segments.end, std::numeric_limits<float>::max());
    ASSERT_TRUE(hover->theme.has_value());
    EXPECT_EQ(hover->theme->colors.at("fill"), glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
    ASSERT_EQ(hover->transitions.size(), 2u);
    EXPECT_FLOAT_EQ(std::get<OnAfter>(hover->transitions[1]).secs, 2.5f);
}

TEST_F(PlayerSerializeTest, WriteThenReadKeepsDefinition) {
    auto p = deserialize_player(json::parse(button_definition), storage);
    auto j = serialize_player(p, storage);

    EXPECT_EQ(j["states"][0]["id"], "idle");
    EXPECT_EQ(j["states"][0]["asset"], "button");

    auto q = deserialize_player(j, storage);
    EXPECT_EQ(serialize_player(q, storage), j);
}

TEST_F(PlayerSerializeTest, UnknownTargetRejected) {
    auto j = json::parse(button_definition);
    j["states"][1]["transitions"][0]["state"] = "gone";
    try {
        deserialize_player(j, storage);
        FAIL() << "expected UnknownStateError";
    }
    catch (const UnknownStateError& e) {
        EXPECT_EQ(e.state, "gone");
    }
}

TEST_F(PlayerSerializeTest, UnknownInitialRejected) {
    auto j = json::parse(button_definition);
    j["initial_state"] = "boot";
    EXPECT_THROW(deserialize_player(j, storage), UnknownStateError);
}

TEST_F(PlayerSerializeTest, UnknownAssetRejected) {
    auto j = json::parse(button_definition);
    j["states"][0]["asset"] = "nope";
    EXPECT_THROW(deserialize_player(j, storage), ConfigError);
}

TEST_F(PlayerSerializeTest, MissingKeysRejected) {
    EXPECT_THROW(deserialize_player(json::parse(R"({ "states": [] })"), storage), ConfigError);
    EXPECT_THROW(deserialize_player(json::parse(R"({ "initial_state": "a" })"), storage), ConfigError);
    EXPECT_THROW(deserialize_player(json::parse(R"({ "initial_state": "a", "states": [ {} ] })"), storage), ConfigError);
}

TEST_F(PlayerSerializeTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "lplay_button_player.json";
    {
        std::ofstream out(path);
        out << button_definition;
    }
    auto p = load_player(path, storage);
    EXPECT_EQ(p.states().size(), 2u);
    std::filesystem::remove(path);

    EXPECT_THROW(load_player(path, storage), ConfigError);
}
