// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#ifndef AssetComponent_hpp
#define AssetComponent_hpp

#include "assets/AssetStorage.hpp"

namespace lplay::ecs
{
    /// @brief Binds an entity to the vector asset it displays.
    /// Several entities may share one asset, and with it one playhead.
    struct AssetComponent
    {
        assets::VectorAssetHandle handle;

        AssetComponent() = default;
        explicit AssetComponent(assets::VectorAssetHandle handle)
            : handle(handle)
        {}
    };
}

#endif // AssetComponent_hpp
