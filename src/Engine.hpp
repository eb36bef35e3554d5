// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef ENGINE_HPP
#define ENGINE_HPP

#include "EngineContext.hpp"
#include "ecs/systems/PlayerSystem.hpp"
#include <memory>

namespace lplay
{
    /**
     * @brief Owns the engine context and runs the player systems once per tick.
     * The host supplies the frame delta; scheduling is the host's concern.
     */
    class Engine
    {
    public:
        /** Constructor */
        explicit Engine(std::shared_ptr<EngineContext> ctx);

        /** Destructor */
        ~Engine();

        /**
         * @brief Hook up config events and the global logger.
         * Call once before the first tick.
         */
        void init();

        /**
         * @brief Advance the engine clock and run the player pipeline.
         * @param delta_time Seconds since the previous tick. Negative values count as 0.
         *        Scaled by EngineValue::TimeScale.
         */
        void tick(float delta_time);

        std::shared_ptr<EngineContext> context() const { return ctx; }

        ecs::systems::PlayerSystem& player_system() { return player_system_; }

        float time_scale() const { return time_scale_; }

    private:
        std::shared_ptr<EngineContext> ctx;
        ecs::systems::PlayerSystem player_system_;
        float time_scale_ = 1.0f;   ///< Cached EngineValue::TimeScale
        bool initialized = false;

        void on_set_time_scale(const SetTimeScaleEvent& e);
        void on_set_log_echo(const SetLogEchoEvent& e);
    };

    using EnginePtr = std::unique_ptr<Engine>;

    /// @brief Engine with a fresh registry, asset storage, InputManager and LogManager.
    EnginePtr make_default_engine();

} // namespace lplay

#endif // ENGINE_HPP
