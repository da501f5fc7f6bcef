#include "utility/threat_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "utility/math_utils.hpp"

namespace utility
{
namespace
{
constexpr float kSingletonMarkerRadius = 0.02f;
constexpr float kMaxMarkerRadius = 0.05f;
constexpr float kMarkerRadiusPerMember = 0.005f;

glm::vec3 rgb(std::uint32_t hex)
{
    return glm::vec3(static_cast<float>((hex >> 16U) & 0xFFU) / 255.0f,
                     static_cast<float>((hex >> 8U) & 0xFFU) / 255.0f,
                     static_cast<float>(hex & 0xFFU) / 255.0f);
}

std::string normalizeCategoryText(const std::string& text)
{
    std::string normalized;
    normalized.reserve(text.size());
    for (const char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            continue;
        }
        normalized.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return normalized;
}
} // namespace

ThreatCategory parseThreatCategory(const std::string& text)
{
    const std::string normalized = normalizeCategoryText(text);
    if (normalized == "vulnerability")
    {
        return ThreatCategory::Vulnerability;
    }
    if (normalized == "scam")
    {
        return ThreatCategory::Scam;
    }
    if (normalized == "financial_risk" || normalized == "financialrisk")
    {
        return ThreatCategory::FinancialRisk;
    }
    if (normalized == "protection")
    {
        return ThreatCategory::Protection;
    }
    return ThreatCategory::Unknown;
}

const char* threatCategoryName(ThreatCategory category)
{
    switch (category)
    {
    case ThreatCategory::Vulnerability:
        return "vulnerability";
    case ThreatCategory::Scam:
        return "scam";
    case ThreatCategory::FinancialRisk:
        return "financial_risk";
    case ThreatCategory::Protection:
        return "protection";
    case ThreatCategory::Unknown:
        break;
    }
    return "unknown";
}

ThreatColors threatColors(ThreatCategory category, float severity)
{
    const bool high = severity >= kHighSeverityThreshold;
    switch (category)
    {
    case ThreatCategory::Vulnerability:
        return high ? ThreatColors{rgb(0xFF0000), rgb(0xFF4444)} : ThreatColors{rgb(0xDD0000), rgb(0xFF2222)};
    case ThreatCategory::Scam:
        return high ? ThreatColors{rgb(0xFF8800), rgb(0xFFAA44)} : ThreatColors{rgb(0xEE7700), rgb(0xFF9933)};
    case ThreatCategory::FinancialRisk:
        return high ? ThreatColors{rgb(0xFFFF00), rgb(0xFFFF66)} : ThreatColors{rgb(0xEEEE00), rgb(0xFFFF44)};
    case ThreatCategory::Protection:
        return high ? ThreatColors{rgb(0x0088FF), rgb(0x44AAFF)} : ThreatColors{rgb(0x0066DD), rgb(0x3399FF)};
    case ThreatCategory::Unknown:
        break;
    }
    return ThreatColors{rgb(0x9CA3AF), rgb(0xD1D5DB)};
}

bool sanitizeRecord(ThreatRecord& record)
{
    bool changed = false;

    const auto clampCoordinate = [&changed](double& value, double limit)
    {
        if (!std::isfinite(value))
        {
            value = 0.0;
            changed = true;
            return;
        }
        const double clamped = clamp(value, -limit, limit);
        if (clamped != value)
        {
            value = clamped;
            changed = true;
        }
    };

    clampCoordinate(record.latitude, 90.0);
    clampCoordinate(record.longitude, 180.0);

    const int severity = clamp(record.severity, kMinSeverity, kMaxSeverity);
    if (severity != record.severity)
    {
        record.severity = severity;
        changed = true;
    }

    if (static_cast<std::uint8_t>(record.category) > static_cast<std::uint8_t>(ThreatCategory::Unknown))
    {
        record.category = ThreatCategory::Unknown;
        changed = true;
    }

    return changed;
}

float markerRadius(const Cluster& cluster)
{
    if (cluster.memberIds.size() <= 1U)
    {
        return kSingletonMarkerRadius;
    }
    return std::min(kMaxMarkerRadius,
                    kSingletonMarkerRadius + static_cast<float>(cluster.memberIds.size()) * kMarkerRadiusPerMember);
}

} // namespace utility
