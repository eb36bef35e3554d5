// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "ecs/systems/PlayerSystem.hpp"

#include <optional>
#include <type_traits>
#include <unordered_set>
#include <variant>

#include <entt/entity/registry.hpp>

#include "EngineContextHelpers.hpp"
#include "ecs/AssetComponent.hpp"
#include "ecs/ThemeComponent.hpp"
#include "ecs/TransformComponent.hpp"
#include "playback/Playhead.hpp"
#include "player/LottiePlayer.hpp"

namespace
{
    using namespace lplay;
    using playback::PlaybackSettings;

    constexpr const char* log_tag = "PlayerSystem";

    unsigned entity_id(entt::entity entity)
    {
        return static_cast<unsigned>(entt::to_integral(entity));
    }

    PlaybackSettings settings_or_default(const entt::registry& registry, entt::entity entity)
    {
        if (auto settings = registry.try_get<PlaybackSettings>(entity))
            return *settings;
        return PlaybackSettings{};
    }

    /// Everything a transition predicate may look at during one update
    struct TransitionInputs
    {
        const assets::VectorAsset& asset;
        const PlaybackSettings& settings;
        const player::AnimationState& state;
        double now;
        bool is_inside;
        bool was_hovered;
        bool clicked;
    };

    bool should_transition(const player::AnimationTransition& transition, const TransitionInputs& in)
    {
        return std::visit([&](const auto& t) -> bool
            {
                using T = std::decay_t<decltype(t)>;
                if constexpr (std::is_same_v<T, player::OnAfter>)
                {
                    return in.asset.first_frame
                        && in.now - *in.asset.first_frame >= static_cast<double>(t.secs);
                }
                else if constexpr (std::is_same_v<T, player::OnComplete>)
                {
                    if (!in.asset.has_frames())
                        throw player::InvalidTransitionError(
                            "invalid state: '" + in.state.id.name() +
                            "', OnComplete is only valid for frame-based assets, use OnAfter instead");
                    return playback::is_complete(in.asset.rendered_frames, in.asset.composition, in.settings.intermission);
                }
                else if constexpr (std::is_same_v<T, player::OnMouseEnter>)
                    return in.is_inside;
                else if constexpr (std::is_same_v<T, player::OnMouseClick>)
                    return in.is_inside && in.clicked;
                else if constexpr (std::is_same_v<T, player::OnMouseLeave>)
                    return in.was_hovered && !in.is_inside;
                else
                    return in.asset.first_frame.has_value();
            }, transition);
    }

    /// Advance the playhead of an asset shown by a player
    void advance_controlled(
        const PlaybackSettings& settings,
        assets::VectorAsset& asset,
        double now,
        float delta_time,
        bool& started,
        bool& playing)
    {
        if (settings.autoplay && !started)
            playing = true;
        if (!playing)
            return;

        // At this point, we are playing
        asset.mark_rendered(now);
        started = true;

        if (asset.has_frames())
            asset.rendered_frames += playback::integrate(delta_time, settings.speed, asset.composition.frame_rate);
    }
}

namespace lplay::ecs::systems
{
    void PlayerSystem::update(EngineContext& ctx, float delta_time)
    {
        apply_player_inputs(ctx);
        advance_playheads(ctx, delta_time);
        run_transitions(ctx);
        set_state(ctx);
    }

    void PlayerSystem::apply_player_inputs(EngineContext& ctx)
    {
        auto* registry = try_get_registry_ptr(ctx, log_tag);
        auto* storage = try_get_asset_storage(ctx, log_tag);
        if (!registry || !storage)
            return;

        auto view = registry->view<player::LottiePlayer, AssetComponent>();
        for (auto&& [entity, controller, asset_component] : view.each())
        {
            auto* asset = storage->try_get(asset_component.handle);
            // Inputs stay pending until the asset has frames to apply them to
            if (!asset || !asset->has_frames())
                continue;

            auto& settings = registry->get_or_emplace<PlaybackSettings>(entity);

            if (controller.pending_intermission)
            {
                float intermission = *controller.pending_intermission;
                controller.pending_intermission.reset();
                if (intermission < 0.0f)
                {
                    LPLAY_LOG_WARN(&ctx, "[%s] entity %u: negative intermission %f clamped to 0",
                        log_tag, entity_id(entity), intermission);
                    intermission = 0.0f;
                }
                asset->rendered_frames = playback::apply_intermission_change(
                    asset->rendered_frames, asset->composition, settings.intermission, intermission);
                settings.intermission = intermission;
            }

            if (controller.pending_seek_frame)
            {
                const float frame = *controller.pending_seek_frame;
                controller.pending_seek_frame.reset();
                asset->rendered_frames = playback::apply_seek(
                    asset->rendered_frames, frame, asset->composition, settings);
            }

            if (controller.pending_speed)
            {
                float speed = *controller.pending_speed;
                controller.pending_speed.reset();
                if (speed < 0.0f)
                {
                    LPLAY_LOG_WARN(&ctx, "[%s] entity %u: negative speed %f clamped to 0",
                        log_tag, entity_id(entity), speed);
                    speed = 0.0f;
                }
                settings.speed = speed;
            }
        }
    }

    void PlayerSystem::advance_playheads(EngineContext& ctx, float delta_time)
    {
        auto* registry = try_get_registry_ptr(ctx, log_tag);
        auto* storage = try_get_asset_storage(ctx, log_tag);
        if (!registry || !storage)
            return;

        const double now = ctx.clock.now();
        std::unordered_set<assets::VectorAssetHandle> claimed;

        // Players own the playheads of the assets they show
        auto players = registry->view<player::LottiePlayer, AssetComponent>();
        for (auto&& [entity, controller, asset_component] : players.each())
        {
            auto* asset = storage->try_get(asset_component.handle);
            if (!asset || !claimed.insert(asset_component.handle).second)
                continue;
            if (controller.stopped)
                continue;

            const auto settings = settings_or_default(*registry, entity);
            advance_controlled(settings, *asset, now, delta_time, controller.started, controller.playing);
        }

        // Assets without a player always play
        auto uncontrolled = registry->view<AssetComponent>(entt::exclude<player::LottiePlayer>);
        for (auto entity : uncontrolled)
        {
            const auto& asset_component = uncontrolled.get<AssetComponent>(entity);
            auto* asset = storage->try_get(asset_component.handle);
            if (!asset || !asset->has_frames() || !claimed.insert(asset_component.handle).second)
                continue;

            const auto settings = settings_or_default(*registry, entity);
            asset->rendered_frames += playback::integrate(delta_time, settings.speed, asset->composition.frame_rate);
        }
    }

    void PlayerSystem::run_transitions(EngineContext& ctx)
    {
        auto* registry = try_get_registry_ptr(ctx, log_tag);
        auto* storage = try_get_asset_storage(ctx, log_tag);
        if (!registry || !storage)
            return;

        // No input manager or no pointer: pointer transitions simply never fire
        std::optional<glm::vec2> pointer_pos;
        bool clicked = false;
        if (auto* input = try_get_input(ctx))
        {
            pointer_pos = input->GetPointerWorldPosition();
            clicked = input->IsMouseButtonJustPressed(IInputManager::MouseButton::Left);
        }

        const double now = ctx.clock.now();

        auto view = registry->view<player::LottiePlayer, AssetComponent>();
        for (auto&& [entity, controller, asset_component] : view.each())
        {
            if (controller.stopped)
                continue;

            const auto* asset = storage->try_get(asset_component.handle);
            if (!asset)
                continue;

            const auto settings = settings_or_default(*registry, entity);

            bool is_inside = false;
            if (pointer_pos)
            {
                const auto* transform = registry->try_get<TransformComponent>(entity);
                const glm::mat4 world = transform ? transform->world : glm::mat4(1.0f);
                is_inside = asset->contains(world, *pointer_pos);
            }

            const auto& state = controller.state();
            const TransitionInputs inputs{ *asset, settings, state, now, is_inside, controller.hovered, clicked };

            for (const auto& transition : state.transitions)
            {
                if (!should_transition(transition, inputs))
                    continue;

                controller.next_state_ = player::target(transition);
                if (std::holds_alternative<player::OnMouseLeave>(transition))
                    controller.hovered = false;
                break;
            }

            if (is_inside)
                controller.hovered = true;
        }
    }

    void PlayerSystem::set_state(EngineContext& ctx)
    {
        auto* registry = try_get_registry_ptr(ctx, log_tag);
        auto* storage = try_get_asset_storage(ctx, log_tag);
        if (!registry || !storage)
            return;
        auto* event_queue = try_get_event_queue(ctx, log_tag);

        auto view = registry->view<player::LottiePlayer, AssetComponent>();
        for (auto&& [entity, controller, asset_component] : view.each())
        {
            if (!controller.next_state_)
                continue;
            const player::StateId next_state = *controller.next_state_;
            controller.next_state_.reset();

            // Entering a state resets run status; autoplay re-arms it
            controller.started = false;
            controller.playing = false;

            const auto* target_state = controller.find_state(next_state);
            if (!target_state)
                throw player::UnknownStateError(next_state.name(), "state commit");
            const auto target_handle = target_state->asset.value_or(asset_component.handle);

            auto* asset = storage->try_get(target_handle);
            if (!asset)
            {
                // Retry on the next update
                controller.next_state_ = next_state;
                if (!controller.commit_deferred)
                {
                    LPLAY_LOG_WARN(&ctx, "[%s] entity %u: asset not ready for '%s', re-queueing",
                        log_tag, entity_id(entity), next_state.c_str());
                    controller.commit_deferred = true;
                }
                continue;
            }
            controller.commit_deferred = false;

            // Switch to asset
            const bool changed_assets = asset_component.handle != target_handle;
            asset_component.handle = target_handle;

            const auto& current_state = controller.state();
            const auto old_settings = settings_or_default(*registry, entity);

            asset->first_frame.reset();
            if (asset->has_frames())
            {
                const float playhead = playback::calculate_playhead(
                    asset->rendered_frames, asset->composition, old_settings);

                if (current_state.reset_playhead_on_transition
                    || target_state->reset_playhead_on_start
                    || changed_assets)
                {
                    asset->rendered_frames = 0.0f;
                }
                else
                {
                    asset->rendered_frames = playback::remap_on_transition(
                        asset->rendered_frames,
                        playhead,
                        asset->composition,
                        old_settings.direction,
                        target_state->direction());
                }
            }

            if (target_state->theme)
                registry->emplace_or_replace<Theme>(entity, *target_state->theme);
            registry->emplace_or_replace<PlaybackSettings>(
                entity, target_state->playback_settings.value_or(PlaybackSettings{}));

            const player::StateId from = controller.current_state_;
            controller.current_state_ = next_state;

            if (ctx.engine_config && ctx.engine_config->get_flag(EngineFlag::LogTransitions))
                LPLAY_LOG_INFO(&ctx, "[%s] entity %u: '%s' -> '%s'",
                    log_tag, entity_id(entity), from.c_str(), next_state.c_str());
            if (event_queue)
                event_queue->enqueue_event(StateChangedEvent{ entity, from, next_state });
        }
    }
}
