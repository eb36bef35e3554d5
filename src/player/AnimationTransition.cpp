// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "player/AnimationTransition.hpp"

#include <sstream>
#include <type_traits>

namespace lplay::player
{
    const StateId& target(const AnimationTransition& transition)
    {
        return std::visit([](const auto& t) -> const StateId& { return t.state; }, transition);
    }

    const char* trigger_name(const AnimationTransition& transition)
    {
        return std::visit([](const auto& t) -> const char*
            {
                using T = std::decay_t<decltype(t)>;
                if constexpr (std::is_same_v<T, OnAfter>) return "after";
                else if constexpr (std::is_same_v<T, OnComplete>) return "complete";
                else if constexpr (std::is_same_v<T, OnMouseEnter>) return "mouse_enter";
                else if constexpr (std::is_same_v<T, OnMouseClick>) return "mouse_click";
                else if constexpr (std::is_same_v<T, OnMouseLeave>) return "mouse_leave";
                else return "show";
            }, transition);
    }

    std::string to_string(const AnimationTransition& transition)
    {
        std::ostringstream ss;
        ss << trigger_name(transition);
        if (auto after = std::get_if<OnAfter>(&transition))
            ss << "(" << after->secs << "s)";
        ss << " -> " << target(transition).name();
        return ss.str();
    }
}
