// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <memory>
#include "ILogManager.hpp"

/// Process-wide fallback log, for code that has no EngineContext at hand
/// (event queue internals, or a context whose log manager was released).
/// Messages go to the registered logger, or to stderr once it has expired.
namespace lplay::LogGlobals
{
    /// Registered by Engine::init
    void set_logger(std::weak_ptr<ILogManager> logger);

    /// nullptr if no logger is registered or it has expired
    ILogManager* try_get();

    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);
}
