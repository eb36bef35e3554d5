// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef ThemeComponent_hpp
#define ThemeComponent_hpp

#include <map>
#include <string>
#include <glm/vec4.hpp>

namespace lplay::ecs
{
    /// @brief Named colour overrides applied by the renderer.
    /// States may carry one; it is put on the entity when the state is entered.
    struct Theme
    {
        std::string name;
        std::map<std::string, glm::vec4> colors;

        bool operator==(const Theme&) const = default;
    };

    std::string to_string(const Theme& theme);
}

#endif // ThemeComponent_hpp
