// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <glm/vec4.hpp>

namespace lplay::serializers
{
    nlohmann::json serialize_vec4(const glm::vec4& v);

    /// Accepts [r, g, b, a] / [x, y, z, w] arrays or objects with x/y/z/w keys.
    /// Missing components are 0.
    /// @throws nlohmann::json::type_error on non-numeric components
    glm::vec4 deserialize_vec4(const nlohmann::json& j);
}
