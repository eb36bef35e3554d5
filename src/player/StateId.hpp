// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <string>
#include <string_view>
#include <entt/core/hashed_string.hpp>

namespace lplay::player
{
    /// @brief Interned state identifier.
    /// Compares and hashes by the hashed value; the name is kept for diagnostics.
    class StateId
    {
    public:
        StateId() = default;

        StateId(const char* name)
            : StateId(std::string_view{ name }) {}

        StateId(const std::string& name)
            : StateId(std::string_view{ name }) {}

        explicit StateId(std::string_view name)
            : id(entt::hashed_string::value(name.data(), name.size()))
            , label(name)
        {}

        entt::id_type value() const { return id; }
        const std::string& name() const { return label; }
        const char* c_str() const { return label.c_str(); }

        bool empty() const { return label.empty(); }

        bool operator==(const StateId& other) const { return id == other.id; }
        bool operator!=(const StateId& other) const { return id != other.id; }

    private:
        entt::id_type id{};
        std::string label;
    };
}

namespace std {
    template<>
    struct hash<lplay::player::StateId>
    {
        size_t operator()(const lplay::player::StateId& s) const noexcept
        {
            return std::hash<entt::id_type>{}(s.value());
        }
    };
}
