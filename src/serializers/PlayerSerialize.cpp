// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "serializers/PlayerSerialize.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "assets/AssetStorage.hpp"
#include "serializers/GLMSerialize.hpp"

namespace lplay::serializers
{
    namespace
    {
        using playback::PlaybackDirection;
        using playback::PlaybackLoopBehavior;

        const nlohmann::json& require(const nlohmann::json& j, const char* key, const char* where)
        {
            if (!j.is_object() || !j.contains(key))
                throw ConfigError(std::string(where) + ": missing \"" + key + "\"");
            return j.at(key);
        }

        nlohmann::json serialize_looping(const PlaybackLoopBehavior& looping)
        {
            switch (looping.kind)
            {
            case PlaybackLoopBehavior::Kind::DoNotLoop: return "none";
            case PlaybackLoopBehavior::Kind::Amount: return looping.amount;
            case PlaybackLoopBehavior::Kind::Loop: return "loop";
            }
            return "loop";
        }

        PlaybackLoopBehavior deserialize_looping(const nlohmann::json& j)
        {
            if (j.is_number_unsigned())
                return PlaybackLoopBehavior::times(j.get<size_t>());
            if (j.is_boolean())
                return j.get<bool>() ? PlaybackLoopBehavior::loop() : PlaybackLoopBehavior::do_not_loop();
            if (j.is_string())
            {
                const auto s = j.get<std::string>();
                if (s == "loop") return PlaybackLoopBehavior::loop();
                if (s == "none") return PlaybackLoopBehavior::do_not_loop();
            }
            throw ConfigError("playback_settings: invalid \"looping\" " + j.dump());
        }

        PlaybackDirection deserialize_direction(const nlohmann::json& j)
        {
            const auto s = j.get<std::string>();
            if (s == "normal") return PlaybackDirection::Normal;
            if (s == "reverse") return PlaybackDirection::Reverse;
            throw ConfigError("playback_settings: invalid \"direction\" '" + s + "'");
        }

        // Segment bounds at the float limits are the defaults and are omitted
        nlohmann::json serialize_segments(const playback::FrameRange& range)
        {
            nlohmann::json j = nlohmann::json::array();
            if (range.start == std::numeric_limits<float>::lowest())
                j.push_back(nullptr);
            else
                j.push_back(range.start);
            if (range.end == std::numeric_limits<float>::max())
                j.push_back(nullptr);
            else
                j.push_back(range.end);
            return j;
        }

        playback::FrameRange deserialize_segments(const nlohmann::json& j)
        {
            if (!j.is_array() || j.size() != 2)
                throw ConfigError("playback_settings: \"segments\" must be [start, end]");
            playback::FrameRange range{};
            if (!j[0].is_null()) range.start = j[0].get<float>();
            if (!j[1].is_null()) range.end = j[1].get<float>();
            return range;
        }

        nlohmann::json serialize_theme(const ecs::Theme& theme)
        {
            nlohmann::json colors = nlohmann::json::object();
            for (const auto& [key, color] : theme.colors)
                colors[key] = serialize_vec4(color);
            return { { "name", theme.name }, { "colors", colors } };
        }

        ecs::Theme deserialize_theme(const nlohmann::json& j)
        {
            ecs::Theme theme;
            theme.name = j.value("name", std::string{});
            if (j.contains("colors"))
            {
                for (const auto& [key, value] : j.at("colors").items())
                    theme.colors[key] = deserialize_vec4(value);
            }
            return theme;
        }

        player::AnimationState deserialize_state(const nlohmann::json& j, const assets::AssetStorage& storage)
        {
            player::AnimationState state{ player::StateId{ require(j, "id", "state").get<std::string>() } };
            const std::string where = "state '" + state.id.name() + "'";

            if (j.contains("asset"))
            {
                const auto asset_name = j.at("asset").get<std::string>();
                auto handle = storage.find(asset_name);
                if (!handle)
                    throw ConfigError(where + ": unknown asset '" + asset_name + "'");
                state.with_asset(*handle);
            }
            if (j.contains("theme"))
                state.with_theme(deserialize_theme(j.at("theme")));
            if (j.contains("playback_settings"))
                state.with_playback_settings(deserialize_playback_settings(j.at("playback_settings")));
            if (j.contains("transitions"))
            {
                for (const auto& t : j.at("transitions"))
                    state.with_transition(deserialize_transition(t));
            }
            state.with_reset_playhead_on_transition(j.value("reset_playhead_on_transition", false));
            state.with_reset_playhead_on_start(j.value("reset_playhead_on_start", false));
            return state;
        }

        nlohmann::json serialize_state(const player::AnimationState& state, const assets::AssetStorage& storage)
        {
            nlohmann::json j;
            j["id"] = state.id.name();
            if (state.asset)
            {
                if (auto name = storage.name_of(*state.asset))
                    j["asset"] = *name;
            }
            if (state.theme)
                j["theme"] = serialize_theme(*state.theme);
            if (state.playback_settings)
                j["playback_settings"] = serialize_playback_settings(*state.playback_settings);

            nlohmann::json transitions = nlohmann::json::array();
            for (const auto& transition : state.transitions)
                transitions.push_back(serialize_transition(transition));
            j["transitions"] = transitions;

            j["reset_playhead_on_transition"] = state.reset_playhead_on_transition;
            j["reset_playhead_on_start"] = state.reset_playhead_on_start;
            return j;
        }
    } // namespace

    nlohmann::json serialize_playback_settings(const playback::PlaybackSettings& settings)
    {
        return {
            { "autoplay", settings.autoplay },
            { "direction", playback::to_string(settings.direction) },
            { "speed", settings.speed },
            { "intermission", settings.intermission },
            { "looping", serialize_looping(settings.looping) },
            { "segments", serialize_segments(settings.segments) }
        };
    }

    playback::PlaybackSettings deserialize_playback_settings(const nlohmann::json& j)
    {
        if (!j.is_object())
            throw ConfigError("playback_settings: expected an object");
        try
        {
            playback::PlaybackSettings settings{};
            settings.autoplay = j.value("autoplay", settings.autoplay);
            if (j.contains("direction"))
                settings.direction = deserialize_direction(j.at("direction"));
            settings.speed = j.value("speed", settings.speed);
            settings.intermission = j.value("intermission", settings.intermission);
            if (j.contains("looping"))
                settings.looping = deserialize_looping(j.at("looping"));
            if (j.contains("segments"))
                settings.segments = deserialize_segments(j.at("segments"));
            return settings;
        }
        catch (const nlohmann::json::exception& e)
        {
            throw ConfigError(std::string("playback_settings: ") + e.what());
        }
    }

    nlohmann::json serialize_transition(const player::AnimationTransition& transition)
    {
        nlohmann::json j;
        j["on"] = player::trigger_name(transition);
        if (auto after = std::get_if<player::OnAfter>(&transition))
            j["secs"] = after->secs;
        j["state"] = player::target(transition).name();
        return j;
    }

    player::AnimationTransition deserialize_transition(const nlohmann::json& j)
    {
        try
        {
            const auto on = require(j, "on", "transition").get<std::string>();
            player::StateId state{ require(j, "state", "transition").get<std::string>() };

            if (on == "after")
                return player::OnAfter{ state, require(j, "secs", "transition 'after'").get<float>() };
            if (on == "complete")
                return player::OnComplete{ state };
            if (on == "mouse_enter")
                return player::OnMouseEnter{ state };
            if (on == "mouse_click")
                return player::OnMouseClick{ state };
            if (on == "mouse_leave")
                return player::OnMouseLeave{ state };
            if (on == "show")
                return player::OnShow{ state };
            throw ConfigError("transition: unknown trigger '" + on + "'");
        }
        catch (const nlohmann::json::exception& e)
        {
            throw ConfigError(std::string("transition: ") + e.what());
        }
    }

    nlohmann::json serialize_player(const player::LottiePlayer& lottie_player, const assets::AssetStorage& storage)
    {
        std::vector<const player::AnimationState*> ordered;
        for (const auto& [key, state] : lottie_player.states())
        {
            if (state.id != lottie_player.initial_state())
                ordered.push_back(&state);
        }
        std::sort(ordered.begin(), ordered.end(), [](auto a, auto b) { return a->id.name() < b->id.name(); });
        if (auto initial = lottie_player.find_state(lottie_player.initial_state()))
            ordered.insert(ordered.begin(), initial);

        nlohmann::json states = nlohmann::json::array();
        for (auto state : ordered)
            states.push_back(serialize_state(*state, storage));

        return { { "initial_state", lottie_player.initial_state().name() }, { "states", states } };
    }

    player::LottiePlayer deserialize_player(const nlohmann::json& j, const assets::AssetStorage& storage)
    {
        try
        {
            player::StateId initial_state{ require(j, "initial_state", "player").get<std::string>() };
            player::LottiePlayer lottie_player{ initial_state };
            for (const auto& state_json : require(j, "states", "player"))
                lottie_player.with_state(deserialize_state(state_json, storage));
            lottie_player.validate();
            return lottie_player;
        }
        catch (const nlohmann::json::exception& e)
        {
            throw ConfigError(std::string("player: ") + e.what());
        }
    }

    player::LottiePlayer load_player(const std::filesystem::path& path, const assets::AssetStorage& storage)
    {
        std::ifstream file(path);
        if (!file)
            throw ConfigError("Failed to open player definition " + path.string());

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw ConfigError("Failed to parse " + path.string() + ": " + e.what());
        }
        return deserialize_player(j, storage);
    }
}
