#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace globe
{

class Logger
{
public:
    enum class Level
    {
        Info,
        Warning,
        Error,
    };

    // Opens the log file once; later calls are ignored. Console output is
    // always on.
    static void initialize(const std::filesystem::path& logPath);
    static void log(Level level, const std::string& message);

    // Drops everything below the given level.
    static void setMinimumLevel(Level level);

private:
    static const char* levelName(Level level);
    static std::string buildMessage(Level level, const std::string& message);

    static std::mutex s_mutex;
};

} // namespace globe
