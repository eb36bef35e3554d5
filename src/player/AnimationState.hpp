// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "player/StateId.hpp"
#include "player/AnimationTransition.hpp"
#include "assets/AssetStorage.hpp"
#include "ecs/ThemeComponent.hpp"
#include "playback/PlaybackSettings.hpp"

namespace lplay::player
{
    /// @brief A node in a player's state graph.
    struct AnimationState
    {
        StateId id;
        /// Asset to show; if unset, the asset currently bound to the entity is kept
        std::optional<assets::VectorAssetHandle> asset;
        std::optional<ecs::Theme> theme;
        /// Settings to apply on entry; if unset, defaults are applied
        std::optional<playback::PlaybackSettings> playback_settings;
        /// Evaluated in order, first match wins
        std::vector<AnimationTransition> transitions;
        /// Reset the playhead when leaving this state
        bool reset_playhead_on_transition = false;
        /// Reset the playhead when entering this state
        bool reset_playhead_on_start = false;

        explicit AnimationState(StateId id)
            : id(std::move(id))
        {}

        AnimationState& with_asset(assets::VectorAssetHandle handle);
        AnimationState& with_theme(ecs::Theme theme);
        AnimationState& with_playback_settings(playback::PlaybackSettings settings);
        AnimationState& with_transition(AnimationTransition transition);
        AnimationState& with_reset_playhead_on_transition(bool reset);
        AnimationState& with_reset_playhead_on_start(bool reset);

        /// Direction this state plays in once entered
        playback::PlaybackDirection direction() const;
    };

    std::string to_string(const AnimationState& state);
}
