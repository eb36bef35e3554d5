// Created by Carl Johan Gribel.
// Licensed under the MIT License. See LICENSE file for details.

#include "InputManager.hpp"

namespace
{
    size_t button_index(lplay::IInputManager::MouseButton button)
    {
        return static_cast<size_t>(button);
    }
}

namespace lplay {

    InputManager::InputManager() = default;

    InputManager::~InputManager() = default;

    std::optional<glm::vec2> InputManager::GetPointerWorldPosition() const
    {
        return pointer;
    }

    bool InputManager::IsMouseButtonJustPressed(MouseButton button) const
    {
        return just_pressed[button_index(button)];
    }

    bool InputManager::IsMouseButtonDown(MouseButton button) const
    {
        return down[button_index(button)];
    }

    void InputManager::SetPointerWorldPosition(const glm::vec2& world_pos)
    {
        pointer = world_pos;
    }

    void InputManager::ClearPointer()
    {
        pointer.reset();
    }

    void InputManager::SetMouseButton(MouseButton button, bool is_down)
    {
        const auto i = button_index(button);
        if (is_down && !down[i])
            just_pressed[i] = true;
        down[i] = is_down;
    }

    void InputManager::EndFrame()
    {
        just_pressed.fill(false);
    }
}
