// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "playback/Playhead.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace lplay::playback
{
    float prev_frame(float x)
    {
        return std::nextafter(x, -std::numeric_limits<float>::infinity());
    }

    FrameRange effective_range(const Composition& composition, const PlaybackSettings& settings)
    {
        const float start = std::max(settings.segments.start, composition.frame_start);
        const float end = std::min(settings.segments.end, composition.frame_end);
        // Inverted or disjoint segments collapse to an empty range at start
        return { start, std::max(start, end) };
    }

    float integrate(float dt, float speed, float frame_rate)
    {
        return dt * std::max(speed, 0.0f) * frame_rate;
    }

    float loops_completed(float rendered_frames, float length, float intermission)
    {
        if (length + intermission <= 0.0f)
            return 0.0f;
        if (rendered_frames > length + intermission)
            return std::trunc(rendered_frames / (length + intermission));
        if (rendered_frames > length)
            return 1.0f;
        return 0.0f;
    }

    bool in_intermission(float rendered_frames, float length, float intermission)
    {
        const float loops = loops_completed(rendered_frames, length, intermission);
        return rendered_frames > length
            && rendered_frames >= loops * length
            && rendered_frames < loops * length + intermission;
    }

    float apply_intermission_change(
        float rendered_frames,
        const Composition& composition,
        float old_intermission,
        float new_intermission)
    {
        const float length = composition.length();
        if (length + old_intermission <= 0.0f)
            return rendered_frames;
        const float loops = loops_completed(rendered_frames, length, old_intermission);

        if (in_intermission(rendered_frames, length, old_intermission))
            return prev_frame(loops * (length + new_intermission));

        const float dt_frames = (new_intermission - old_intermission) * loops;
        return std::max(0.0f, rendered_frames + dt_frames);
    }

    float apply_seek(
        float rendered_frames,
        float frame,
        const Composition& composition,
        const PlaybackSettings& settings)
    {
        const auto range = effective_range(composition, settings);
        const float last = std::max(range.start, prev_frame(range.end));
        const float bounded = std::clamp(frame, range.start, last);

        // Reverse mirrors the frame about the effective end
        const float seek = settings.direction == PlaybackDirection::Normal
            ? bounded
            : range.end - bounded;

        const float cycle = range.end - range.start + settings.intermission;
        if (cycle <= 0.0f)
            return seek;
        const float loops = std::trunc(rendered_frames / cycle);
        return loops * cycle + seek;
    }

    float calculate_playhead(
        float rendered_frames,
        const Composition& composition,
        const PlaybackSettings& settings)
    {
        const auto range = effective_range(composition, settings);
        const float length = range.end - range.start;
        if (length <= 0.0f)
            return range.start;

        const float cycle = length + std::max(settings.intermission, 0.0f);
        const float last = prev_frame(length);

        float frame = 0.0f;
        switch (settings.looping.kind)
        {
        case PlaybackLoopBehavior::Kind::DoNotLoop:
            frame = std::min(rendered_frames, last);
            break;
        case PlaybackLoopBehavior::Kind::Amount:
        {
            // Hold the last frame once the extra loops have played
            const float limit = static_cast<float>(settings.looping.amount) * cycle + length;
            frame = rendered_frames >= limit ? last : std::fmod(rendered_frames, cycle);
            break;
        }
        case PlaybackLoopBehavior::Kind::Loop:
            frame = std::fmod(rendered_frames, cycle);
            break;
        }
        // The last frame is held during the intermission
        frame = std::clamp(frame, 0.0f, last);

        if (settings.direction == PlaybackDirection::Reverse)
            return std::min(range.end - frame, prev_frame(range.end));
        return range.start + frame;
    }

    float remap_on_transition(
        float rendered_frames,
        float playhead,
        const Composition& composition,
        PlaybackDirection from,
        PlaybackDirection to)
    {
        if (from == PlaybackDirection::Normal && to == PlaybackDirection::Reverse)
            return std::min(composition.frame_end - playhead, prev_frame(composition.frame_end));

        if (from == PlaybackDirection::Reverse && to == PlaybackDirection::Normal)
            return playhead;

        // Same direction: collapse accumulated loops into a single loop
        const float length = composition.length();
        const float wrapped = length > 0.0f ? std::fmod(rendered_frames, length) : 0.0f;
        return std::min(wrapped, prev_frame(composition.frame_end));
    }

    bool is_complete(float rendered_frames, const Composition& composition, float intermission)
    {
        return rendered_frames >= composition.length() + intermission;
    }
}
