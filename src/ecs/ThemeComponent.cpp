// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "ecs/ThemeComponent.hpp"

#include <sstream>

namespace lplay::ecs
{
    std::string to_string(const Theme& theme)
    {
        std::ostringstream ss;
        ss << "Theme(name = " << theme.name << ", colors = {";
        bool first = true;
        for (const auto& [key, c] : theme.colors)
        {
            ss << (first ? " " : ", ") << key << " = (" << c.r << ", " << c.g << ", " << c.b << ", " << c.a << ")";
            first = false;
        }
        ss << " })";
        return ss.str();
    }
}
