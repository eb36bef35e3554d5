// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "LogGlobals.hpp"
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace
{
    std::mutex g_mutex;
    std::weak_ptr<lplay::ILogManager> g_logger;

    std::string vformat(const char* fmt, va_list args)
    {
        va_list args_copy;
        va_copy(args_copy, args);
        const int len = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);
        if (len < 0)
            return {};

        std::string result(len + 1, '\0');
        vsnprintf(result.data(), len + 1, fmt, args);
        result.resize(len);
        return result;
    }

    void emit(const char* level, const std::string& message)
    {
        std::shared_ptr<lplay::ILogManager> logger;
        {
            std::lock_guard lock(g_mutex);
            logger = g_logger.lock();
        }
        if (logger)
            logger->log("%s %s", level, message.c_str());
        else
            std::fprintf(stderr, "%s %s\n", level, message.c_str());
    }
}

namespace lplay::LogGlobals
{
    void set_logger(std::weak_ptr<ILogManager> logger)
    {
        std::lock_guard lock(g_mutex);
        g_logger = std::move(logger);
    }

    ILogManager* try_get()
    {
        std::lock_guard lock(g_mutex);
        if (auto logger = g_logger.lock())
            return logger.get();
        return nullptr;
    }

    void warn(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::string message = vformat(fmt, args);
        va_end(args);
        emit("[WARN]", message);
    }

    void error(const char* fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        std::string message = vformat(fmt, args);
        va_end(args);
        emit("[ERROR]", message);
    }
}
