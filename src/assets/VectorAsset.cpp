// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "assets/VectorAsset.hpp"

#include <sstream>
#include <glm/gtc/matrix_transform.hpp>

namespace lplay::assets
{
    VectorAsset VectorAsset::make_lottie(
        const std::string& name,
        const playback::Composition& composition,
        float width,
        float height)
    {
        VectorAsset asset;
        asset.name = name;
        asset.kind = VectorAssetKind::Lottie;
        asset.composition = composition;
        asset.width = width;
        asset.height = height;
        asset.local_transform_center = center_transform(width, height);
        return asset;
    }

    VectorAsset VectorAsset::make_svg(
        const std::string& name,
        float width,
        float height)
    {
        VectorAsset asset;
        asset.name = name;
        asset.kind = VectorAssetKind::Svg;
        asset.width = width;
        asset.height = height;
        asset.local_transform_center = center_transform(width, height);
        return asset;
    }

    glm::mat4 VectorAsset::center_transform(float width, float height)
    {
        return glm::translate(glm::mat4(1.0f), glm::vec3(width * 0.5f, -height * 0.5f, 0.0f));
    }

    std::optional<float> VectorAsset::calculate_playhead(const playback::PlaybackSettings& settings) const
    {
        if (!has_frames())
            return std::nullopt;
        return playback::calculate_playhead(rendered_frames, composition, settings);
    }

    bool VectorAsset::mark_rendered(double now)
    {
        if (first_frame)
            return false;
        first_frame = now;
        return true;
    }

    bool VectorAsset::contains(const glm::mat4& world_transform, const glm::vec2& world_pos) const
    {
        const glm::mat4 transform = world_transform * glm::inverse(local_transform_center);
        const glm::vec4 local = glm::inverse(transform) * glm::vec4(world_pos, 0.0f, 1.0f);

        // Content space: x right in [0, width], y up in [-height, 0]
        return local.x >= 0.0f && local.x <= width
            && local.y >= -height && local.y <= 0.0f;
    }

    std::string to_string(const VectorAsset& asset)
    {
        std::ostringstream ss;
        ss << "VectorAsset(name = " << asset.name
            << ", kind = " << (asset.has_frames() ? "lottie" : "svg");
        if (asset.has_frames())
        {
            ss << ", frames = [" << asset.composition.frame_start << ", " << asset.composition.frame_end << ")"
                << ", frame_rate = " << asset.composition.frame_rate
                << ", rendered_frames = " << asset.rendered_frames;
        }
        ss << ", size = " << asset.width << "x" << asset.height << ")";
        return ss.str();
    }
}
