// Licensed under the MIT License. See LICENSE file for details.

#include "Engine.hpp"

#include <algorithm>

#include <entt/entity/registry.hpp>

#include "EventQueue.h"
#include "InputManager.hpp"
#include "LogGlobals.hpp"
#include "LogMacros.h"
#include "LogManager.hpp"
#include "assets/AssetStorage.hpp"

namespace lplay
{
    Engine::Engine(std::shared_ptr<EngineContext> ctx)
        : ctx(std::move(ctx))
    {
    }

    Engine::~Engine() = default;

    void Engine::init()
    {
        if (initialized)
            return;
        initialized = true;

        LogGlobals::set_logger(ctx->log_manager);

        ctx->event_queue->register_callback([&](const SetTimeScaleEvent& event) { this->on_set_time_scale(event); });
        ctx->event_queue->register_callback([&](const SetLogEchoEvent& event) { this->on_set_log_echo(event); });

        time_scale_ = ctx->engine_config->get_value(EngineValue::TimeScale);
        if (auto log_manager = std::dynamic_pointer_cast<LogManager>(ctx->log_manager))
            log_manager->set_echo(ctx->engine_config->get_flag(EngineFlag::EchoLogToStdout));

        LPLAY_LOG_INFO(ctx, "Engine initialized");
    }

    void Engine::tick(float delta_time)
    {
        const float dt = std::max(delta_time, 0.0f) * time_scale_;
        ctx->clock.advance(dt);
        player_system_.update(*ctx, dt);
    }

    void Engine::on_set_time_scale(const SetTimeScaleEvent& e)
    {
        if (e.time_scale < 0.0f)
        {
            LPLAY_LOG_WARN(ctx, "Negative time scale %f ignored", e.time_scale);
            return;
        }
        time_scale_ = e.time_scale;
    }

    void Engine::on_set_log_echo(const SetLogEchoEvent& e)
    {
        if (auto log_manager = std::dynamic_pointer_cast<LogManager>(ctx->log_manager))
            log_manager->set_echo(e.enabled);
    }

    EnginePtr make_default_engine()
    {
        auto ctx = std::make_shared<EngineContext>(
            std::make_shared<entt::registry>(),
            std::make_unique<assets::AssetStorage>(),
            std::make_unique<InputManager>(),
            std::make_shared<LogManager>()
        );
        return std::make_unique<Engine>(ctx);
    }
}
