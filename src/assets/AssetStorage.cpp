// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "assets/AssetStorage.hpp"

namespace lplay::assets
{
    AssetStorage::Slot& AssetStorage::slot_for(const VectorAssetHandle& handle)
    {
        if (!validate(handle))
            throw ValidationError("Invalid asset handle " + handle.to_string());
        return slots[handle.idx];
    }

    const AssetStorage::Slot* AssetStorage::try_slot(const VectorAssetHandle& handle) const
    {
        if (!handle || handle.idx >= slots.size())
            return nullptr;
        const auto& slot = slots[handle.idx];
        if (!slot.live || slot.ver != handle.ver)
            return nullptr;
        return &slot;
    }

    VectorAssetHandle AssetStorage::reserve(const std::string& name)
    {
        if (!name.empty() && name_to_idx.count(name))
            throw std::invalid_argument("Asset name already in use: " + name);

        handle_idx_type idx;
        if (!free_list.empty())
        {
            idx = free_list.back();
            free_list.pop_back();
        }
        else
        {
            idx = slots.size();
            slots.emplace_back();
        }

        auto& slot = slots[idx];
        slot.name = name;
        slot.content.reset();
        slot.live = true;
        if (!name.empty())
            name_to_idx[name] = idx;

        return VectorAssetHandle{ idx, slot.ver };
    }

    VectorAssetHandle AssetStorage::add(VectorAsset asset)
    {
        auto handle = reserve(asset.name);
        slots[handle.idx].content = std::move(asset);
        return handle;
    }

    void AssetStorage::load(const VectorAssetHandle& handle, VectorAsset asset)
    {
        auto& slot = slot_for(handle);
        asset.name = slot.name;
        slot.content = std::move(asset);
    }

    void AssetStorage::unload(const VectorAssetHandle& handle)
    {
        slot_for(handle).content.reset();
    }

    void AssetStorage::remove(const VectorAssetHandle& handle)
    {
        auto& slot = slot_for(handle);
        if (!slot.name.empty())
            name_to_idx.erase(slot.name);
        slot.name.clear();
        slot.content.reset();
        slot.live = false;
        // Skip the null version so recycled handles stay valid
        if (++slot.ver == handle_ver_null)
            slot.ver = 0;
        free_list.push_back(handle.idx);
    }

    bool AssetStorage::validate(const VectorAssetHandle& handle) const noexcept
    {
        return try_slot(handle) != nullptr;
    }

    bool AssetStorage::is_ready(const VectorAssetHandle& handle) const noexcept
    {
        auto slot = try_slot(handle);
        return slot && slot->content.has_value();
    }

    VectorAsset* AssetStorage::try_get(const VectorAssetHandle& handle) noexcept
    {
        auto slot = try_slot(handle);
        if (!slot || !slot->content)
            return nullptr;
        return &slots[handle.idx].content.value();
    }

    const VectorAsset* AssetStorage::try_get(const VectorAssetHandle& handle) const noexcept
    {
        auto slot = try_slot(handle);
        if (!slot || !slot->content)
            return nullptr;
        return &slot->content.value();
    }

    VectorAsset& AssetStorage::get(const VectorAssetHandle& handle)
    {
        auto& slot = slot_for(handle);
        if (!slot.content)
            throw ValidationError("Asset not loaded " + handle.to_string());
        return *slot.content;
    }

    const VectorAsset& AssetStorage::get(const VectorAssetHandle& handle) const
    {
        auto slot = try_slot(handle);
        if (!slot)
            throw ValidationError("Invalid asset handle " + handle.to_string());
        if (!slot->content)
            throw ValidationError("Asset not loaded " + handle.to_string());
        return *slot->content;
    }

    std::optional<VectorAssetHandle> AssetStorage::find(const std::string& name) const
    {
        auto it = name_to_idx.find(name);
        if (it == name_to_idx.end())
            return std::nullopt;
        return VectorAssetHandle{ it->second, slots[it->second].ver };
    }

    std::optional<std::string> AssetStorage::name_of(const VectorAssetHandle& handle) const
    {
        auto slot = try_slot(handle);
        if (!slot)
            return std::nullopt;
        return slot->name;
    }

    size_t AssetStorage::size() const
    {
        return slots.size() - free_list.size();
    }
}
