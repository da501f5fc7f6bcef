#include "sources/TextThreatSource.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "logging/Logger.hpp"

namespace globe
{

namespace
{
constexpr std::size_t kRecordFields = 5;
constexpr char kCommentMarker = '#';

std::string trim(const std::string& text)
{
    const auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last =
        std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::vector<std::string> splitFields(const std::string& line)
{
    std::vector<std::string> fields;
    std::istringstream stream(line);
    std::string field;
    while (std::getline(stream, field, ','))
    {
        fields.push_back(trim(field));
    }
    return fields;
}

bool parseReal(const std::string& text, double& value)
{
    if (text.empty())
    {
        return false;
    }
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

bool parseSeverity(const std::string& text, int& value)
{
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc() && result.ptr == end;
}

bool isHeader(const std::vector<std::string>& fields)
{
    if (fields.empty())
    {
        return false;
    }
    std::string first = fields.front();
    std::transform(first.begin(), first.end(), first.begin(), [](unsigned char c) { return std::tolower(c); });
    return first == "id";
}
} // namespace

TextThreatSource::TextThreatSource(std::filesystem::path path)
    : m_path(std::move(path))
{
    m_identifier = m_path.filename().string();
    Logger::log(Logger::Level::Info, "TextThreatSource watching file: " + m_path.string());
}

const std::string& TextThreatSource::identifier() const noexcept
{
    return m_identifier;
}

bool TextThreatSource::poll(utility::ThreatRecords& destination)
{
    std::error_code ec;
    const auto writeTime = std::filesystem::last_write_time(m_path, ec);
    if (ec)
    {
        if (!m_reportedMissing)
        {
            Logger::log(Logger::Level::Error, "Threat feed unavailable: " + m_path.string() + " (" + ec.message() + ")");
            m_reportedMissing = true;
        }
        return false;
    }
    m_reportedMissing = false;

    if (m_lastWriteTime && *m_lastWriteTime == writeTime)
    {
        return false;
    }

    utility::ThreatRecords records;
    if (!readFile(records))
    {
        return false;
    }

    m_lastWriteTime = writeTime;
    destination = std::move(records);
    return true;
}

std::size_t TextThreatSource::skippedLines() const noexcept
{
    return m_skippedLines;
}

bool TextThreatSource::parseLine(const std::string& line, utility::ThreatRecord& record)
{
    const std::vector<std::string> fields = splitFields(line);
    if (fields.size() != kRecordFields || fields[0].empty())
    {
        return false;
    }

    utility::ThreatRecord parsed;
    parsed.id = fields[0];
    if (!parseReal(fields[1], parsed.latitude) || !parseReal(fields[2], parsed.longitude))
    {
        return false;
    }
    parsed.category = utility::parseThreatCategory(fields[3]);
    if (!parseSeverity(fields[4], parsed.severity))
    {
        return false;
    }

    record = std::move(parsed);
    return true;
}

bool TextThreatSource::readFile(utility::ThreatRecords& destination)
{
    std::ifstream file(m_path, std::ios::in);
    if (!file)
    {
        Logger::log(Logger::Level::Error, "Failed to open threat feed: " + m_path.string());
        return false;
    }

    destination.clear();
    m_skippedLines = 0U;
    std::string line;
    std::size_t lineNumber = 0U;
    while (std::getline(file, line))
    {
        ++lineNumber;
        const std::string content = trim(line);
        if (content.empty() || content.front() == kCommentMarker)
        {
            continue;
        }
        if (destination.empty() && m_skippedLines == 0U && isHeader(splitFields(content)))
        {
            continue;
        }

        utility::ThreatRecord record;
        if (!parseLine(content, record))
        {
            ++m_skippedLines;
            Logger::log(Logger::Level::Warning,
                        m_identifier + ":" + std::to_string(lineNumber) + " skipped malformed record");
            continue;
        }
        destination.push_back(std::move(record));
    }

    Logger::log(Logger::Level::Info,
                "Loaded " + std::to_string(destination.size()) + " threat records from " + m_path.string());
    return true;
}

} // namespace globe
