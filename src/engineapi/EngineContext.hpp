// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "IInputManager.hpp"
#include "ILogManager.hpp"
#include <cstdint>
#include <memory>
#include <unordered_map>

#include <entt/entity/fwd.hpp>

namespace lplay
{
    class EventQueue;
    namespace assets { class AssetStorage; }

    /*
    Engine context facilities:
    - Entity registry
    - Asset storage
    - Input (pointer)
    - Event queue
    - Logger
    - Engine config
    - Engine clock
    */

    struct SetTimeScaleEvent { float time_scale; };
    struct SetLogEchoEvent { bool enabled; };

    enum class EngineFlag : uint8_t
    {
        EchoLogToStdout,
        LogTransitions,
        // ...
    };

    enum class EngineValue : uint8_t
    {
        TimeScale,
        // ...
    };

    class EngineConfig
    {
    public:
        explicit EngineConfig(EventQueue& event_queue);

        // --- Flag handling ---
        void set_flag(EngineFlag flag, bool enabled);

        bool get_flag(EngineFlag flag) const;

        // --- Value handling ---
        void set_value(EngineValue key, float new_value);

        float get_value(EngineValue key) const;

    private:
        std::unordered_map<EngineFlag, bool> flags;
        std::unordered_map<EngineValue, float> values;
        EventQueue& event_queue;
    };

    /// @brief Simulated time, advanced once per engine tick.
    class EngineClock
    {
    public:
        void advance(double dt) { time += dt; ++frame; }
        double now() const { return time; }
        uint64_t frame_count() const { return frame; }

    private:
        double time = 0.0;
        uint64_t frame = 0;
    };

    struct EngineContext
    {
        EngineContext(
            std::shared_ptr<entt::registry>         registry,
            std::unique_ptr<assets::AssetStorage>   asset_storage,
            std::unique_ptr<IInputManager>          input_manager,
            std::shared_ptr<ILogManager>            log_manager);

        ~EngineContext();

        std::shared_ptr<entt::registry>         registry;
        std::unique_ptr<assets::AssetStorage>   asset_storage;
        std::unique_ptr<IInputManager>          input_manager;
        std::shared_ptr<ILogManager>            log_manager;
        std::unique_ptr<EventQueue>             event_queue;
        std::unique_ptr<EngineConfig>           engine_config;
        EngineClock                             clock;
    };

    using EngineContextPtr = std::shared_ptr<EngineContext>;
    using EngineContextWeakPtr = std::weak_ptr<EngineContext>;

} // namespace lplay
