// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <stdexcept>
#include <string>

namespace lplay::player
{
    /// A state id that is not registered with the player
    struct UnknownStateError : std::runtime_error
    {
        UnknownStateError(const std::string& state, const std::string& context)
            : std::runtime_error("state not found: '" + state + "' (" + context + ")")
            , state(state)
        {}

        std::string state;
    };

    /// A transition that cannot be evaluated against the bound asset
    struct InvalidTransitionError : std::logic_error
    {
        using std::logic_error::logic_error;
    };
}
