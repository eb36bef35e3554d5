// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LogManager.hpp"
#include <cstdarg>
#include <cstdio>
#include <string>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace
{
    std::string format_string(const char* fmt, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int length = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);
        if (length < 0)
            return {};

        std::string buffer(length, '\0');
        vsnprintf(buffer.data(), length + 1, fmt, args);
        return buffer;
    }

    std::string relative_time_string()
    {
        using namespace std::chrono;
        static auto start = steady_clock::now();
        auto now = steady_clock::now();
        auto elapsed = duration_cast<milliseconds>(now - start);

        int seconds = static_cast<int>(elapsed.count() / 1000);
        int millis = static_cast<int>(elapsed.count() % 1000);

        std::ostringstream oss;
        oss << "[+" << seconds << '.' << std::setw(3) << std::setfill('0') << millis << ']';
        return oss.str();
    }
}

namespace lplay
{
    LogManager::LogManager() = default;

    LogManager::~LogManager() = default;

    void LogManager::log(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::string formatted = format_string(fmt, args);
        va_end(args);

        std::string with_prefix = relative_time_string() + " " + formatted;

        std::lock_guard lock(mutex);
        if (echo_enabled)
            std::cout << with_prefix << std::endl;

        buffer.push_back(std::move(with_prefix));
        if (buffer.size() > max_lines)
            buffer.erase(buffer.begin(), buffer.begin() + (buffer.size() - max_lines));
    }

    void LogManager::clear()
    {
        std::lock_guard lock(mutex);
        buffer.clear();
    }

    void LogManager::set_echo(bool enabled)
    {
        std::lock_guard lock(mutex);
        echo_enabled = enabled;
    }

    bool LogManager::echo() const
    {
        std::lock_guard lock(mutex);
        return echo_enabled;
    }

    std::vector<std::string> LogManager::lines() const
    {
        std::lock_guard lock(mutex);
        return buffer;
    }

    void LogManager::set_max_lines(size_t max_lines)
    {
        std::lock_guard lock(mutex);
        this->max_lines = max_lines > 0 ? max_lines : 1;
        if (buffer.size() > this->max_lines)
            buffer.erase(buffer.begin(), buffer.begin() + (buffer.size() - this->max_lines));
    }
}
