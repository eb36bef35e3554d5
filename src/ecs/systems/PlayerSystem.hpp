// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <entt/entity/entity.hpp>
#include "player/StateId.hpp"

namespace lplay
{
    struct EngineContext;
}

namespace lplay::ecs::systems
{
    /// Enqueued on the engine event queue whenever a player enters a state
    struct StateChangedEvent
    {
        entt::entity entity;
        player::StateId from;
        player::StateId to;
    };

    /*
    Drives every LottiePlayer in the registry.

    update() runs four stages, each over all entities before the next begins:
      1. apply_player_inputs  fold pending seek/intermission/speed into the playhead
      2. advance_playheads    integrate time into the playhead of each asset
      3. run_transitions      pick at most one transition per player
      4. set_state            commit pending transitions

    Entities are expected to carry an AssetComponent. LottiePlayer,
    PlaybackSettings, TransformComponent and Theme are optional.
    */
    class PlayerSystem
    {
    public:
        /// @brief Run all stages, in order.
        void update(EngineContext& ctx, float delta_time);

        void apply_player_inputs(EngineContext& ctx);

        /// @note Each asset advances at most once, however many entities show it.
        void advance_playheads(EngineContext& ctx, float delta_time);

        /// @throws player::InvalidTransitionError for OnComplete on an asset without frames
        /// @throws player::UnknownStateError if a current state is not registered
        void run_transitions(EngineContext& ctx);

        /// @throws player::UnknownStateError if a requested state is not registered
        void set_state(EngineContext& ctx);
    };
}
