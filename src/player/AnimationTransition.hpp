// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <string>
#include <variant>

#include "player/StateId.hpp"

namespace lplay::player
{
    /// Transition after a number of seconds since the state first showed a frame
    struct OnAfter
    {
        StateId state;
        float secs = 0.0f;
    };

    /// Transition once all frames, and the intermission, have played.
    /// Only valid for frame-based assets; use OnAfter for static images.
    struct OnComplete
    {
        StateId state;
    };

    struct OnMouseEnter
    {
        StateId state;
    };

    /// Pointer inside and left button pressed this frame
    struct OnMouseClick
    {
        StateId state;
    };

    struct OnMouseLeave
    {
        StateId state;
    };

    /// Transition once the first frame has been shown
    struct OnShow
    {
        StateId state;
    };

    using AnimationTransition = std::variant<
        OnAfter,
        OnComplete,
        OnMouseEnter,
        OnMouseClick,
        OnMouseLeave,
        OnShow>;

    /// @brief Destination state of a transition.
    const StateId& target(const AnimationTransition& transition);

    /// @brief Short trigger name, e.g. "mouse_enter".
    const char* trigger_name(const AnimationTransition& transition);

    std::string to_string(const AnimationTransition& transition);
}
