// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <nlohmann/json_fwd.hpp>

#include "EngineContext.hpp"
#include "serializers/ConfigError.hpp"

namespace lplay::serializers
{
    nlohmann::json serialize_engine_config(const EngineConfig& config);

    /// @brief Apply { "echo_log", "log_transitions", "time_scale" } to config.
    /// Missing and unknown keys are ignored. Changes dispatch config events.
    /// @throws ConfigError on wrong value types or a negative time scale
    void apply_engine_config(const nlohmann::json& j, EngineConfig& config);
}
