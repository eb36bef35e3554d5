// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include "EngineContext.hpp"
#include "EventQueue.h"
#include "LogGlobals.hpp"
#include "LogMacros.h"
#include "assets/AssetStorage.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>

#include <entt/entity/registry.hpp>

#ifndef LPLAY_CTX_HELPERS_STRICT
#define LPLAY_CTX_HELPERS_STRICT 0
#endif

namespace lplay
{
    namespace detail
    {
        inline const char* normalize_log_tag(const char* log_tag)
        {
            return (log_tag && *log_tag) ? log_tag : "Engine";
        }

        inline void log_warn_once(EngineContext& ctx, const char* log_tag, const char* message)
        {
            const char* tag = normalize_log_tag(log_tag);
            static std::unordered_set<std::string> warned;
            std::string key = std::string(tag) + "|" + message;
            if (!warned.insert(key).second)
                return;
            if (ctx.log_manager)
                LPLAY_LOG_WARN(&ctx, "[%s] %s", tag, message);
            else
                LogGlobals::warn("[%s] %s", tag, message);
        }

        inline void handle_failure(EngineContext& ctx, const char* log_tag, const char* message)
        {
#if LPLAY_CTX_HELPERS_STRICT
            const char* tag = normalize_log_tag(log_tag);
            throw std::runtime_error(std::string("[") + tag + "] " + message);
#else
            log_warn_once(ctx, log_tag, message);
#endif
        }
    } // namespace detail

    inline entt::registry* try_get_registry_ptr(EngineContext& ctx, const char* log_tag)
    {
        if (!ctx.registry)
        {
            detail::handle_failure(ctx, log_tag, "Registry unavailable");
            return nullptr;
        }
        return ctx.registry.get();
    }

    inline assets::AssetStorage* try_get_asset_storage(EngineContext& ctx, const char* log_tag)
    {
        if (!ctx.asset_storage)
        {
            detail::handle_failure(ctx, log_tag, "AssetStorage unavailable");
            return nullptr;
        }
        return ctx.asset_storage.get();
    }

    inline EventQueue* try_get_event_queue(EngineContext& ctx, const char* log_tag)
    {
        if (!ctx.event_queue)
        {
            detail::handle_failure(ctx, log_tag, "EventQueue unavailable");
            return nullptr;
        }
        return ctx.event_queue.get();
    }

    /// Missing input is not an error; the pointer is then treated as absent
    inline const IInputManager* try_get_input(EngineContext& ctx)
    {
        return ctx.input_manager.get();
    }
} // namespace lplay
