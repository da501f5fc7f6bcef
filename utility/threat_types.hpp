#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace utility
{

enum class ThreatCategory : std::uint8_t
{
    Vulnerability = 0,
    Scam = 1,
    FinancialRisk = 2,
    Protection = 3,
    Unknown = 4
};

constexpr int kMinSeverity = 1;
constexpr int kMaxSeverity = 10;
constexpr float kHighSeverityThreshold = 7.0f;

struct ThreatRecord
{
    std::string id;
    double latitude = 0.0;
    double longitude = 0.0;
    ThreatCategory category = ThreatCategory::Unknown;
    int severity = kMinSeverity;
};

using ThreatRecords = std::vector<ThreatRecord>;

struct ThreatColors
{
    glm::vec3 fill{0.0f};
    glm::vec3 glow{0.0f};
};

struct Cluster
{
    std::string id;
    glm::vec3 position{0.0f};
    std::vector<std::string> memberIds;
    float averageSeverity = 0.0f;
    ThreatCategory dominantCategory = ThreatCategory::Unknown;
    ThreatColors colors;

    bool isSingleton() const noexcept
    {
        return memberIds.size() == 1U;
    }
};

ThreatCategory parseThreatCategory(const std::string& text);
const char* threatCategoryName(ThreatCategory category);

// Fill/glow pair for a category, brighter when severity >= kHighSeverityThreshold.
ThreatColors threatColors(ThreatCategory category, float severity);

// Clamps coordinates and severity into their valid ranges. Non-finite
// coordinates become 0. Returns true if anything was changed.
bool sanitizeRecord(ThreatRecord& record);

// Marker sphere radius for a cluster in world units.
float markerRadius(const Cluster& cluster);

} // namespace utility
