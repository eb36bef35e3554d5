// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <filesystem>
#include <nlohmann/json_fwd.hpp>

#include "serializers/ConfigError.hpp"
#include "playback/PlaybackSettings.hpp"
#include "player/LottiePlayer.hpp"

namespace lplay::assets
{
    class AssetStorage;
}

namespace lplay::serializers
{
    nlohmann::json serialize_playback_settings(const playback::PlaybackSettings& settings);

    /// Missing keys keep their default values
    /// @throws ConfigError on wrong types or unknown enum names
    playback::PlaybackSettings deserialize_playback_settings(const nlohmann::json& j);

    nlohmann::json serialize_transition(const player::AnimationTransition& transition);

    /// @throws ConfigError on an unknown trigger or missing "state"
    player::AnimationTransition deserialize_transition(const nlohmann::json& j);

    /// @brief Write a player definition. Asset handles are written by name.
    /// States are written with the initial state first, the rest sorted by id.
    nlohmann::json serialize_player(const player::LottiePlayer& player, const assets::AssetStorage& storage);

    /// @brief Build and validate a player from a definition.
    /// Asset names must already be reserved in storage (loaded or not).
    /// @throws ConfigError for malformed documents and unknown asset names
    /// @throws player::UnknownStateError for unknown initial or transition targets
    player::LottiePlayer deserialize_player(const nlohmann::json& j, const assets::AssetStorage& storage);

    /// @brief Parse a JSON file and deserialize a player from it.
    player::LottiePlayer load_player(const std::filesystem::path& path, const assets::AssetStorage& storage);
}
