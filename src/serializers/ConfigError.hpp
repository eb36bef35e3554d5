// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <stdexcept>
#include <string>

namespace lplay::serializers
{
    /// Malformed or inconsistent configuration document
    struct ConfigError : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };
}
