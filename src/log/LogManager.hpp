// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "ILogManager.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lplay
{
    /// @brief Line-buffered logger.
    /// Each line is prefixed with the time elapsed since the first log call.
    class LogManager : public ILogManager
    {
    public:
        LogManager();
        ~LogManager();

        void log(const char* fmt, ...) override;
        void clear() override;

        /// Mirror every logged line to stdout
        void set_echo(bool enabled);
        bool echo() const;

        /// Snapshot of the buffered lines, oldest first
        std::vector<std::string> lines() const;

        /// Lines kept before the oldest are dropped
        void set_max_lines(size_t max_lines);

    private:
        mutable std::mutex mutex;
        std::vector<std::string> buffer;
        size_t max_lines = 4096;
        bool echo_enabled = false;
    };
}
