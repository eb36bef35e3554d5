// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <optional>
#include <unordered_map>

#include <entt/core/fwd.hpp>

#include "player/AnimationState.hpp"
#include "player/PlayerErrors.hpp"
#include "player/StateId.hpp"

namespace lplay::ecs::systems
{
    class PlayerSystem;
}

namespace lplay::player
{
    /*
    State machine controller for one entity.

    Holds a graph of named states and the playback status. Mutations requested
    through the public API (seek, speed, intermission, transitions) are only
    recorded here; PlayerSystem folds them into the playhead on the next update.

    Status flags:
    - playing   cleared by pause(); transitions are still evaluated
    - stopped   set by stop(); neither the playhead nor transitions run
    - started   set once the first frame of the current state has played
    */
    class LottiePlayer
    {
    public:
        using StateMap = std::unordered_map<entt::id_type, AnimationState>;

        /// The first update enters initial_state
        explicit LottiePlayer(StateId initial_state);

        /// @brief Register a state, replacing any state with the same id.
        LottiePlayer& with_state(AnimationState state);

        /// @brief Check that the initial state and every transition target
        /// are registered.
        /// @throws UnknownStateError naming the first offending id
        void validate() const;

        /// @throws UnknownStateError if the current state is not registered
        const AnimationState& state() const;
        AnimationState& state_mut();

        const AnimationState* find_state(const StateId& id) const;
        AnimationState* find_state(const StateId& id);

        bool has_state(const StateId& id) const { return find_state(id) != nullptr; }

        const StateMap& states() const { return states_; }
        /// State ids (the map keys) must not be modified through this
        StateMap& states_mut() { return states_; }

        /// @brief Request a transition, committed on the next update.
        /// @throws UnknownStateError if the state is not registered
        void transition(const StateId& state);

        /// @brief Go back to the initial state and its first frame.
        void reset();

        /// @brief Seek to a frame within the current loop.
        void seek(float frame);

        /// @brief Set the pause between loops for the current playback only.
        void set_intermission(float intermission);

        /// @brief Set the speed for the current playback only.
        void set_speed(float speed);

        void toggle_play();
        void play();
        /// State machines keep running while paused
        void pause();
        /// Freezes the playhead and the state machine
        void stop();

        bool is_playing() const { return playing; }
        bool is_stopped() const { return stopped; }
        bool is_started() const { return started; }
        bool is_hovered() const { return hovered; }

        const StateId& initial_state() const { return initial_state_; }
        const StateId& current_state() const { return current_state_; }
        const std::optional<StateId>& next_state() const { return next_state_; }

        const std::optional<float>& pending_seek() const { return pending_seek_frame; }
        const std::optional<float>& pending_intermission_change() const { return pending_intermission; }
        const std::optional<float>& pending_speed_change() const { return pending_speed; }

    private:
        friend class lplay::ecs::systems::PlayerSystem;

        StateId initial_state_;
        StateId current_state_;
        std::optional<StateId> next_state_;
        StateMap states_;

        std::optional<float> pending_seek_frame;
        std::optional<float> pending_intermission;
        std::optional<float> pending_speed;

        bool started = false;
        bool playing = false;
        bool stopped = false;

        // Pointer was inside the asset on an earlier update (OnMouseLeave latch)
        bool hovered = false;
        // A commit is waiting for its asset to load; used to log once
        bool commit_deferred = false;
    };
}
