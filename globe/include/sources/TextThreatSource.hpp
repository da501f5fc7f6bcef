#pragma once

#include "sources/BaseThreatSource.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace globe
{

// CSV feed with one "id,latitude,longitude,category,severity" record per
// line. Blank lines, '#' comments and a leading header row are skipped. The
// file is re-read whenever its modification time changes.
class TextThreatSource final : public BaseThreatSource
{
public:
    explicit TextThreatSource(std::filesystem::path path);
    ~TextThreatSource() override = default;

    const std::string& identifier() const noexcept override;
    bool poll(utility::ThreatRecords& destination) override;

    // Lines rejected by the last successful read.
    std::size_t skippedLines() const noexcept;

    static bool parseLine(const std::string& line, utility::ThreatRecord& record);

private:
    bool readFile(utility::ThreatRecords& destination);

    std::filesystem::path m_path;
    std::string m_identifier;
    std::optional<std::filesystem::file_time_type> m_lastWriteTime;
    std::size_t m_skippedLines = 0U;
    bool m_reportedMissing = false;
};

} // namespace globe
