// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef PlaybackSettings_hpp
#define PlaybackSettings_hpp

#include <cstddef>
#include <limits>
#include <string>

namespace lplay::playback
{
    /// @brief The direction to play the segments of an animation.
    enum class PlaybackDirection : int
    {
        Normal = 1,     ///< First frame to last frame
        Reverse = -1    ///< Last frame to first frame
    };

    /// @brief How often to loop.
    struct PlaybackLoopBehavior
    {
        enum class Kind { DoNotLoop, Amount, Loop };

        Kind kind = Kind::Loop;
        size_t amount = 0;      // Used when kind == Amount

        static PlaybackLoopBehavior do_not_loop() { return { Kind::DoNotLoop, 0 }; }
        static PlaybackLoopBehavior times(size_t n) { return { Kind::Amount, n }; }
        static PlaybackLoopBehavior loop() { return { Kind::Loop, 0 }; }

        bool operator==(const PlaybackLoopBehavior&) const = default;
    };

    /// @brief Half-open frame range [start, end).
    struct FrameRange
    {
        float start = std::numeric_limits<float>::lowest();
        float end = std::numeric_limits<float>::max();

        bool operator==(const FrameRange&) const = default;
    };

    /// @brief How one animation segment should play.
    /// Also used as an entity component holding the active settings.
    struct PlaybackSettings
    {
        bool autoplay = true;
        PlaybackDirection direction = PlaybackDirection::Normal;
        /// Speed multiplier. Values below zero are treated as zero.
        float speed = 1.0f;
        /// Idle frames appended after each loop
        float intermission = 0.0f;
        PlaybackLoopBehavior looping{};
        /// Frames to restrict playback to. Out-of-range values are clamped
        /// against the composition when used.
        FrameRange segments{};

        bool operator==(const PlaybackSettings&) const = default;
    };

    const char* to_string(PlaybackDirection direction);

    std::string to_string(const PlaybackLoopBehavior& looping);

    std::string to_string(const PlaybackSettings& settings);
}

#endif // PlaybackSettings_hpp
