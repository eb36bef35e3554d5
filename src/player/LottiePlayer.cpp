// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "player/LottiePlayer.hpp"

#include <limits>

namespace lplay::player
{
    LottiePlayer::LottiePlayer(StateId initial_state)
        : initial_state_(initial_state)
        , current_state_(initial_state)
        , next_state_(initial_state)
    {
    }

    LottiePlayer& LottiePlayer::with_state(AnimationState state)
    {
        const auto key = state.id.value();
        states_.insert_or_assign(key, std::move(state));
        return *this;
    }

    void LottiePlayer::validate() const
    {
        if (!has_state(initial_state_))
            throw UnknownStateError(initial_state_.name(), "initial state");

        for (const auto& [key, state] : states_)
        {
            for (const auto& transition : state.transitions)
            {
                const auto& to = target(transition);
                if (!has_state(to))
                    throw UnknownStateError(to.name(),
                        "transition '" + to_string(transition) + "' of state '" + state.id.name() + "'");
            }
        }
    }

    const AnimationState& LottiePlayer::state() const
    {
        auto state = find_state(current_state_);
        if (!state)
            throw UnknownStateError(current_state_.name(), "current state");
        return *state;
    }

    AnimationState& LottiePlayer::state_mut()
    {
        auto state = find_state(current_state_);
        if (!state)
            throw UnknownStateError(current_state_.name(), "current state");
        return *state;
    }

    const AnimationState* LottiePlayer::find_state(const StateId& id) const
    {
        auto it = states_.find(id.value());
        return it != states_.end() ? &it->second : nullptr;
    }

    AnimationState* LottiePlayer::find_state(const StateId& id)
    {
        auto it = states_.find(id.value());
        return it != states_.end() ? &it->second : nullptr;
    }

    void LottiePlayer::transition(const StateId& state)
    {
        if (!has_state(state))
            throw UnknownStateError(state.name(), "transition request");
        next_state_ = state;
    }

    void LottiePlayer::reset()
    {
        next_state_ = initial_state_;
        seek(std::numeric_limits<float>::lowest());
    }

    void LottiePlayer::seek(float frame)
    {
        pending_seek_frame = frame;
    }

    void LottiePlayer::set_intermission(float intermission)
    {
        pending_intermission = intermission;
    }

    void LottiePlayer::set_speed(float speed)
    {
        pending_speed = speed;
    }

    void LottiePlayer::toggle_play()
    {
        if (stopped || !playing)
            play();
        else
            pause();
    }

    void LottiePlayer::play()
    {
        playing = true;
        stopped = false;
    }

    void LottiePlayer::pause()
    {
        playing = false;
    }

    void LottiePlayer::stop()
    {
        stopped = true;
    }
}
