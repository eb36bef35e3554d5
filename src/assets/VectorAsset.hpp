// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef VectorAsset_hpp
#define VectorAsset_hpp

#include <optional>
#include <string>
#include <glm/glm.hpp>

#include "playback/Playhead.hpp"

namespace lplay::assets
{
    enum class VectorAssetKind
    {
        Svg,        ///< Static image, no frames
        Lottie      ///< Frame-based animation
    };

    /// @brief A decoded vector asset as seen by the player.
    /// Decoding and rendering live elsewhere; the player owns the playhead.
    struct VectorAsset
    {
        std::string name;
        VectorAssetKind kind = VectorAssetKind::Lottie;

        // Lottie only
        playback::Composition composition{};
        float rendered_frames = 0.0f; // runtime

        /// Engine time (seconds) when the first frame was shown since the
        /// last state entry
        std::optional<double> first_frame; // runtime

        float width = 0.0f;
        float height = 0.0f;
        /// Maps content-local coordinates (origin top-left, y up) to the
        /// entity's local space, centering the content on the entity origin
        glm::mat4 local_transform_center{ 1.0f };

        static VectorAsset make_lottie(
            const std::string& name,
            const playback::Composition& composition,
            float width,
            float height);

        static VectorAsset make_svg(
            const std::string& name,
            float width,
            float height);

        /// @brief Translation placing the content center at the origin.
        static glm::mat4 center_transform(float width, float height);

        bool has_frames() const { return kind == VectorAssetKind::Lottie; }

        /// @brief Displayed frame for the given settings, or nullopt for
        /// assets without frames.
        std::optional<float> calculate_playhead(const playback::PlaybackSettings& settings) const;

        /// @brief Record the first-frame timestamp unless one is already set.
        /// @return true if the timestamp was set by this call
        bool mark_rendered(double now);

        /// @brief Whether a world-space point lies on the content, given the
        /// world transform of the entity that displays it.
        bool contains(const glm::mat4& world_transform, const glm::vec2& world_pos) const;
    };

    std::string to_string(const VectorAsset& asset);
}

#endif // VectorAsset_hpp
