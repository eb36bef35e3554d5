// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "ecs/TransformComponent.hpp"

#include <sstream>
#include <glm/gtc/matrix_transform.hpp>

namespace lplay::ecs
{
    TransformComponent TransformComponent::from_position(float x, float y)
    {
        return TransformComponent{ glm::translate(glm::mat4(1.0f), glm::vec3(x, y, 0.0f)) };
    }

    TransformComponent TransformComponent::from_trs(const glm::vec2& position, float angle, const glm::vec2& scale)
    {
        // Compose TRS (translation * rotation * scale), rotation about z
        glm::mat4 m = glm::translate(glm::mat4(1.0f), glm::vec3(position, 0.0f));
        m = glm::rotate(m, angle, glm::vec3(0.0f, 0.0f, 1.0f));
        m = glm::scale(m, glm::vec3(scale, 1.0f));
        return TransformComponent{ m };
    }

    std::string to_string(const TransformComponent& t)
    {
        std::ostringstream ss;
        ss << "TransformComponent(position = " << t.world[3].x << ", " << t.world[3].y << ")";
        return ss.str();
    }
}
