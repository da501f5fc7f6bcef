#include "logging/Logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace globe
{

namespace
{
std::ofstream s_stream;
bool s_streamReady = false;
Logger::Level s_minimumLevel = Logger::Level::Info;

int severityRank(Logger::Level level)
{
    return static_cast<int>(level);
}
} // namespace

std::mutex Logger::s_mutex;

void Logger::initialize(const std::filesystem::path& logPath)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_stream.is_open())
    {
        return;
    }

    const std::filesystem::path directory = logPath.parent_path();
    if (!directory.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            std::cerr << "Cannot create log directory " << directory.string() << ": " << ec.message() << '\n';
        }
    }

    s_stream.open(logPath, std::ios::app);
    s_streamReady = s_stream.is_open();
    if (s_streamReady)
    {
        s_stream << buildMessage(Level::Info, "Threat globe logger initialized at " + logPath.string()) << '\n';
        s_stream.flush();
    }
}

void Logger::log(Level level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (severityRank(level) < severityRank(s_minimumLevel))
    {
        return;
    }

    const std::string formatted = buildMessage(level, message);
    std::ostream& console = level == Level::Error ? std::cerr : std::cout;
    console << formatted << '\n';
    if (s_streamReady)
    {
        s_stream << formatted << '\n';
        s_stream.flush();
    }
}

void Logger::setMinimumLevel(Level level)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_minimumLevel = level;
}

const char* Logger::levelName(Level level)
{
    switch (level)
    {
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "DEBUG";
}

std::string Logger::buildMessage(Level level, const std::string& message)
{
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    std::tm localTime = {};
    localtime_r(&secs, &localTime);
    std::ostringstream oss;
    oss << '[' << levelName(level) << ']';
    oss << '[' << std::put_time(&localTime, "%F %T") << '.' << std::setw(6) << std::setfill('0') << micros << "] ";
    oss << message;
    return oss.str();
}

} // namespace globe
