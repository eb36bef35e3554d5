// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef Playhead_hpp
#define Playhead_hpp

#include "playback/PlaybackSettings.hpp"

namespace lplay::playback
{
    /// @brief Frame bounds of an animation composition.
    struct Composition
    {
        float frame_start = 0.0f;
        float frame_end = 0.0f;     ///< Exclusive
        float frame_rate = 30.0f;   ///< Frames per second, > 0

        float length() const { return frame_end - frame_start; }
    };

    /*
    Playhead arithmetic.

    The playhead (rendered_frames) counts fractional frames since playback
    started and is never wrapped eagerly. The number of completed loops is
    derived on demand from rendered_frames / (length + intermission), so it
    survives changes to speed, intermission and seeks.
    */

    /// @brief Largest float strictly less than x.
    float prev_frame(float x);

    /// @brief Composition range restricted by the segments of the settings.
    /// The result always satisfies start <= end.
    FrameRange effective_range(const Composition& composition, const PlaybackSettings& settings);

    /// @brief Frames elapsed during dt seconds. Negative speed is treated as zero.
    float integrate(float dt, float speed, float frame_rate);

    /// @brief Loops completed so far, as used when re-anchoring intermissions.
    /// Zero when the cycle (length plus intermission) is empty.
    float loops_completed(float rendered_frames, float length, float intermission);

    /// @brief True if the playhead sits inside the idle window after a loop.
    bool in_intermission(float rendered_frames, float length, float intermission);

    /// @brief Playhead after the intermission changes from old_intermission
    /// to new_intermission. Keeps the loop the player is in; a playhead
    /// inside an intermission stays inside it, re-anchored to the new length.
    float apply_intermission_change(
        float rendered_frames,
        const Composition& composition,
        float old_intermission,
        float new_intermission);

    /// @brief Playhead after seeking to frame within the current loop.
    /// The frame is clamped to the effective segment; Normal keeps it as is,
    /// Reverse stores its distance from the segment end.
    float apply_seek(
        float rendered_frames,
        float frame,
        const Composition& composition,
        const PlaybackSettings& settings);

    /// @brief The composition frame to display for a playhead, honoring
    /// segments, looping, intermission and direction.
    float calculate_playhead(
        float rendered_frames,
        const Composition& composition,
        const PlaybackSettings& settings);

    /// @brief Playhead when moving between two states that keep the same
    /// asset and do not reset. playhead is the displayed frame under the old
    /// settings (see calculate_playhead).
    float remap_on_transition(
        float rendered_frames,
        float playhead,
        const Composition& composition,
        PlaybackDirection from,
        PlaybackDirection to);

    /// @brief True once the first loop, including its intermission, has played.
    bool is_complete(float rendered_frames, const Composition& composition, float intermission);
}

#endif // Playhead_hpp
