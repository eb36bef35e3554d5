// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "playback/PlaybackSettings.hpp"

#include <sstream>

namespace lplay::playback
{
    const char* to_string(PlaybackDirection direction)
    {
        switch (direction)
        {
        case PlaybackDirection::Normal: return "normal";
        case PlaybackDirection::Reverse: return "reverse";
        }
        return "unknown";
    }

    std::string to_string(const PlaybackLoopBehavior& looping)
    {
        switch (looping.kind)
        {
        case PlaybackLoopBehavior::Kind::DoNotLoop: return "none";
        case PlaybackLoopBehavior::Kind::Amount: return std::to_string(looping.amount);
        case PlaybackLoopBehavior::Kind::Loop: return "loop";
        }
        return "unknown";
    }

    std::string to_string(const PlaybackSettings& settings)
    {
        std::ostringstream ss;
        ss << "PlaybackSettings(autoplay = " << (settings.autoplay ? "true" : "false")
            << ", direction = " << to_string(settings.direction)
            << ", speed = " << settings.speed
            << ", intermission = " << settings.intermission
            << ", looping = " << to_string(settings.looping)
            << ", segments = [" << settings.segments.start << ", " << settings.segments.end << "))";
        return ss.str();
    }
}
