// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <optional>
#include <glm/vec2.hpp>

namespace lplay {

    /// @brief Pointer input as seen by the player systems.
    /// The host reduces window, camera and device state to a world-space
    /// pointer position and a left-button edge.
    class IInputManager
    {
    public:
        enum class MouseButton { Left, Right, Middle };

        virtual ~IInputManager() = default;

        /// World-space pointer position, or nullopt when the pointer is outside
        /// the window or no camera is available
        virtual std::optional<glm::vec2> GetPointerWorldPosition() const = 0;

        /// True only on the frame the button went down
        virtual bool IsMouseButtonJustPressed(MouseButton button) const = 0;

        virtual bool IsMouseButtonDown(MouseButton button) const = 0;
    };

} // namespace lplay
