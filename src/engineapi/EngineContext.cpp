// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "EngineContext.hpp"

#include <entt/entity/registry.hpp>

#include "EventQueue.h"
#include "LogManager.hpp"
#include "assets/AssetStorage.hpp"

namespace lplay
{
    EngineConfig::EngineConfig(EventQueue& event_queue)
        : event_queue(event_queue)
    {
        flags[EngineFlag::LogTransitions] = true;
        values[EngineValue::TimeScale] = 1.0f;
    }

    void EngineConfig::set_flag(EngineFlag flag, bool enabled)
    {
        if (flags[flag] != enabled)
        {
            flags[flag] = enabled;

            switch (flag)
            {
            case EngineFlag::EchoLogToStdout:
                event_queue.dispatch(SetLogEchoEvent{ enabled });
                break;
            case EngineFlag::LogTransitions:
                break;
            }
        }
    }

    bool EngineConfig::get_flag(EngineFlag flag) const
    {
        auto it = flags.find(flag);
        return it != flags.end() ? it->second : false;
    }

    void EngineConfig::set_value(EngineValue key, float new_value)
    {
        float& current = values[key];
        if (current != new_value)
        {
            current = new_value;

            switch (key)
            {
            case EngineValue::TimeScale:
                event_queue.dispatch(SetTimeScaleEvent{ new_value });
                break;
            }
        }
    }

    float EngineConfig::get_value(EngineValue key) const
    {
        auto it = values.find(key);
        return it != values.end() ? it->second : 0.0f;
    }

    EngineContext::EngineContext(
        std::shared_ptr<entt::registry> registry,
        std::unique_ptr<assets::AssetStorage> asset_storage,
        std::unique_ptr<IInputManager> input_manager,
        std::shared_ptr<ILogManager> log_manager)
        : registry(registry ? std::move(registry) : std::make_shared<entt::registry>())
        , asset_storage(asset_storage ? std::move(asset_storage) : std::make_unique<assets::AssetStorage>())
        , input_manager(std::move(input_manager))
        , log_manager(log_manager ? std::move(log_manager) : std::make_shared<LogManager>())
        , event_queue(std::make_unique<EventQueue>())
        , engine_config(std::make_unique<EngineConfig>(*event_queue))
    {
    }

    EngineContext::~EngineContext() = default;

} // namespace lplay
