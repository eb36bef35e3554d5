// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <cmath>
#include <exception>
#include <fstream>
#include <iostream>

#include <entt/entity/registry.hpp>
#include <nlohmann/json.hpp>

#include "Engine.hpp"
#include "EventQueue.h"
#include "InputManager.hpp"
#include "LogMacros.h"
#include "assets/AssetStorage.hpp"
#include "ecs/AssetComponent.hpp"
#include "ecs/ThemeComponent.hpp"
#include "ecs/TransformComponent.hpp"
#include "serializers/EngineConfigSerialize.hpp"
#include "serializers/PlayerSerialize.hpp"

namespace
{
    using namespace lplay;

    // idle -> hover on enter, hover -> pressed on click, pressed -> idle when done
    player::LottiePlayer make_button_player(assets::AssetStorage& storage)
    {
        const auto button = storage.add(assets::VectorAsset::make_lottie(
            "button", playback::Composition{ 0.0f, 60.0f, 30.0f }, 200.0f, 80.0f));
        const auto pressed = storage.add(assets::VectorAsset::make_lottie(
            "button_pressed", playback::Composition{ 0.0f, 20.0f, 30.0f }, 200.0f, 80.0f));

        playback::PlaybackSettings looping{};
        playback::PlaybackSettings once{};
        once.looping = playback::PlaybackLoopBehavior::do_not_loop();
        playback::PlaybackSettings backwards{};
        backwards.direction = playback::PlaybackDirection::Reverse;
        backwards.intermission = 10.0f;

        ecs::Theme highlight{ "highlight", { { "fill", glm::vec4(1.0f, 0.8f, 0.2f, 1.0f) } } };

        player::LottiePlayer lottie_player{ "idle" };
        lottie_player
            .with_state(player::AnimationState{ "idle" }
                .with_asset(button)
                .with_playback_settings(looping)
                .with_transition(player::OnMouseEnter{ "hover" }))
            .with_state(player::AnimationState{ "hover" }
                .with_asset(button)
                .with_theme(highlight)
                .with_playback_settings(backwards)
                .with_transition(player::OnMouseClick{ "pressed" })
                .with_transition(player::OnMouseLeave{ "idle" }))
            .with_state(player::AnimationState{ "pressed" }
                .with_asset(pressed)
                .with_playback_settings(once)
                .with_reset_playhead_on_start(true)
                .with_transition(player::OnComplete{ "idle" }));
        lottie_player.validate();
        return lottie_player;
    }
}

int main(int argc, char* argv[])
{
    std::cout << "Starting lplay demo..." << std::endl;

    auto engine = make_default_engine();
    auto ctx = engine->context();

    try
    {
        if (argc > 1)
        {
            std::ifstream file(argv[1]);
            if (!file)
            {
                std::cerr << "Cannot open config " << argv[1] << std::endl;
                return -1;
            }
            serializers::apply_engine_config(nlohmann::json::parse(file), *ctx->engine_config);
        }
        else
            ctx->engine_config->set_flag(EngineFlag::EchoLogToStdout, true);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Config error: " << e.what() << std::endl;
        return -1;
    }

    engine->init();

    ctx->event_queue->register_callback([&](const ecs::systems::StateChangedEvent& e)
        {
            if (auto theme = ctx->registry->try_get<ecs::Theme>(e.entity))
                LPLAY_LOG(ctx, "  theme %s", ecs::to_string(*theme).c_str());
        });

    auto& registry = *ctx->registry;
    const auto entity = registry.create();

    try
    {
        auto player_def = make_button_player(*ctx->asset_storage);
        for (const auto& [key, state] : player_def.states())
            LPLAY_LOG_INFO(ctx, "%s", player::to_string(state).c_str());
        std::cout << serializers::serialize_player(player_def, *ctx->asset_storage).dump(2) << std::endl;

        registry.emplace<ecs::AssetComponent>(entity, *ctx->asset_storage->find("button"));
        registry.emplace<ecs::TransformComponent>(entity,
            ecs::TransformComponent::from_trs({ 0.0f, 0.0f }, 0.0f, { 1.5f, 1.5f }));
        registry.emplace<player::LottiePlayer>(entity, std::move(player_def));
        LPLAY_LOG_INFO(ctx, "%s", ecs::to_string(registry.get<ecs::TransformComponent>(entity)).c_str());
    }
    catch (const std::exception& e)
    {
        LPLAY_LOG_ERROR(ctx, "Failed to set up player: %s", e.what());
        return -1;
    }

    auto* input = dynamic_cast<InputManager*>(ctx->input_manager.get());
    if (!input)
    {
        LPLAY_LOG_ERROR(ctx, "Demo requires the default InputManager");
        return -1;
    }

    // Pointer sweeps across the button twice, clicking once while over it
    constexpr float dt = 1.0f / 60.0f;
    try
    {
        for (int frame = 0; frame < 240; frame++)
        {
            const float x = -300.0f + 600.0f * std::fmod(frame / 120.0f, 1.0f);
            input->SetPointerWorldPosition({ x, 0.0f });
            input->SetMouseButton(IInputManager::MouseButton::Left, frame == 180);

            engine->tick(dt);
            ctx->event_queue->dispatch_all_events();
            input->EndFrame();
        }
    }
    catch (const std::exception& e)
    {
        LPLAY_LOG_ERROR(ctx, "Player update failed: %s", e.what());
        return -1;
    }

    const auto& asset = ctx->asset_storage->get(registry.get<ecs::AssetComponent>(entity).handle);
    LPLAY_LOG_INFO(ctx, "%s", assets::to_string(asset).c_str());
    if (auto settings = registry.try_get<playback::PlaybackSettings>(entity))
        LPLAY_LOG_INFO(ctx, "%s", playback::to_string(*settings).c_str());

    std::cout << "Exiting lplay demo." << std::endl;
    return 0;
}
