// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "Handle.h"
#include "assets/VectorAsset.hpp"

namespace lplay
{
    struct ValidationError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };
}

namespace lplay::assets
{
    using VectorAssetHandle = Handle<VectorAsset>;

    /// @brief Arena of vector assets addressed by versioned handles.
    ///
    /// A slot is reserved before its content is available, so entities and
    /// states can refer to an asset that is still loading. Removing a slot
    /// bumps its version, which invalidates outstanding handles.
    class AssetStorage
    {
        struct Slot
        {
            std::string name;
            std::optional<VectorAsset> content;
            handle_ver_type ver = 0;
            bool live = false;
        };

        std::vector<Slot> slots;
        std::vector<handle_idx_type> free_list;
        std::unordered_map<std::string, handle_idx_type> name_to_idx;

        Slot& slot_for(const VectorAssetHandle& handle);
        const Slot* try_slot(const VectorAssetHandle& handle) const;

    public:
        AssetStorage() = default;

        /// @brief Reserve a named slot without content.
        /// @throws std::invalid_argument if the name is already in use
        VectorAssetHandle reserve(const std::string& name);

        /// @brief Reserve a slot and load content into it.
        VectorAssetHandle add(VectorAsset asset);

        /// @brief Provide (or replace) the content of a reserved slot.
        /// @throws ValidationError if the handle is stale
        void load(const VectorAssetHandle& handle, VectorAsset asset);

        /// @brief Drop the content but keep the slot reserved.
        void unload(const VectorAssetHandle& handle);

        /// @throws ValidationError if the handle is stale
        void remove(const VectorAssetHandle& handle);

        bool validate(const VectorAssetHandle& handle) const noexcept;

        /// @brief True if the handle is valid and its content is loaded.
        bool is_ready(const VectorAssetHandle& handle) const noexcept;

        VectorAsset* try_get(const VectorAssetHandle& handle) noexcept;
        const VectorAsset* try_get(const VectorAssetHandle& handle) const noexcept;

        /// @throws ValidationError if the handle is stale or not loaded
        VectorAsset& get(const VectorAssetHandle& handle);
        const VectorAsset& get(const VectorAssetHandle& handle) const;

        std::optional<VectorAssetHandle> find(const std::string& name) const;

        std::optional<std::string> name_of(const VectorAssetHandle& handle) const;

        /// Number of live slots, loaded or not
        size_t size() const;

        template<typename Fn>
        void for_each_ready(Fn&& fn)
        {
            for (handle_idx_type i = 0; i < slots.size(); i++)
            {
                auto& slot = slots[i];
                if (slot.live && slot.content)
                    fn(VectorAssetHandle{ i, slot.ver }, *slot.content);
            }
        }
    };
}
