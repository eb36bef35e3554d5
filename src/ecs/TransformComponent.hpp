// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef TransformComponent_hpp
#define TransformComponent_hpp

#include <string>
#include <glm/glm.hpp>

namespace lplay::ecs
{
    /// @brief World transform of an entity displaying a vector asset.
    /// Scene-graph propagation is the host's job; this holds the result.
    struct TransformComponent
    {
        glm::mat4 world{ 1.0f };

        TransformComponent() = default;
        explicit TransformComponent(const glm::mat4& world) : world(world) {}

        static TransformComponent from_position(float x, float y);

        static TransformComponent from_trs(const glm::vec2& position, float angle, const glm::vec2& scale);
    };

    std::string to_string(const TransformComponent& t);
}

#endif // TransformComponent_hpp
