// Created by Carl Johan Gribel.
// Licensed under the MIT License. See LICENSE file for details.

// InputManager.hpp
#pragma once

#include "IInputManager.hpp"
#include <array>
#include <memory>

namespace lplay {

    /// @brief Host-fed input state.
    /// The host pushes pointer and button state each frame and calls
    /// EndFrame() after the engine update to clear edge flags.
    class InputManager final : public IInputManager
    {
    public:
        InputManager();
        ~InputManager() override;

        // From IInputManager
        std::optional<glm::vec2> GetPointerWorldPosition() const override;
        bool IsMouseButtonJustPressed(MouseButton button) const override;
        bool IsMouseButtonDown(MouseButton button) const override;

        // Not part of IInputManager
        void SetPointerWorldPosition(const glm::vec2& world_pos);
        void ClearPointer();
        void SetMouseButton(MouseButton button, bool down);
        void EndFrame();

    private:
        std::optional<glm::vec2> pointer;
        std::array<bool, 3> down{};
        std::array<bool, 3> just_pressed{};
    };

    using InputManagerPtr = std::shared_ptr<InputManager>;
}
