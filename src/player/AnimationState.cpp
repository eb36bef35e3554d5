// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "player/AnimationState.hpp"

#include <sstream>

namespace lplay::player
{
    AnimationState& AnimationState::with_asset(assets::VectorAssetHandle handle)
    {
        asset = handle;
        return *this;
    }

    AnimationState& AnimationState::with_theme(ecs::Theme theme)
    {
        this->theme = std::move(theme);
        return *this;
    }

    AnimationState& AnimationState::with_playback_settings(playback::PlaybackSettings settings)
    {
        playback_settings = settings;
        return *this;
    }

    AnimationState& AnimationState::with_transition(AnimationTransition transition)
    {
        transitions.push_back(std::move(transition));
        return *this;
    }

    AnimationState& AnimationState::with_reset_playhead_on_transition(bool reset)
    {
        reset_playhead_on_transition = reset;
        return *this;
    }

    AnimationState& AnimationState::with_reset_playhead_on_start(bool reset)
    {
        reset_playhead_on_start = reset;
        return *this;
    }

    playback::PlaybackDirection AnimationState::direction() const
    {
        return playback_settings ? playback_settings->direction : playback::PlaybackDirection::Normal;
    }

    std::string to_string(const AnimationState& state)
    {
        std::ostringstream ss;
        ss << "AnimationState(id = " << state.id.name();
        if (state.asset)
            ss << ", asset = " << state.asset->to_string();
        if (state.theme)
            ss << ", theme = " << state.theme->name;
        if (state.playback_settings)
            ss << ", " << playback::to_string(*state.playback_settings);
        ss << ", transitions = [";
        for (size_t i = 0; i < state.transitions.size(); i++)
            ss << (i ? ", " : "") << to_string(state.transitions[i]);
        ss << "])";
        return ss.str();
    }
}
