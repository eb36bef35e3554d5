// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "serializers/EngineConfigSerialize.hpp"

#include <nlohmann/json.hpp>

namespace lplay::serializers
{
    nlohmann::json serialize_engine_config(const EngineConfig& config)
    {
        return {
            { "echo_log", config.get_flag(EngineFlag::EchoLogToStdout) },
            { "log_transitions", config.get_flag(EngineFlag::LogTransitions) },
            { "time_scale", config.get_value(EngineValue::TimeScale) }
        };
    }

    void apply_engine_config(const nlohmann::json& j, EngineConfig& config)
    {
        if (!j.is_object())
            throw ConfigError("engine config: expected an object");
        try
        {
            if (j.contains("echo_log"))
                config.set_flag(EngineFlag::EchoLogToStdout, j.at("echo_log").get<bool>());
            if (j.contains("log_transitions"))
                config.set_flag(EngineFlag::LogTransitions, j.at("log_transitions").get<bool>());
            if (j.contains("time_scale"))
            {
                const float time_scale = j.at("time_scale").get<float>();
                if (time_scale < 0.0f)
                    throw ConfigError("engine config: negative \"time_scale\"");
                config.set_value(EngineValue::TimeScale, time_scale);
            }
        }
        catch (const nlohmann::json::exception& e)
        {
            throw ConfigError(std::string("engine config: ") + e.what());
        }
    }
}
