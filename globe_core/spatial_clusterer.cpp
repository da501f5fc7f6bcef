#include "globe_core/spatial_clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "logging/Logger.hpp"
#include "utility/geo_projection.hpp"

namespace globe::core
{
namespace
{
constexpr float kMinCellSize = 1e-3f;
constexpr const char* kClusterIdPrefix = "cluster-";
} // namespace

std::size_t SpatialClusterer::CellKeyHash::operator()(const CellKey& key) const noexcept
{
    std::size_t hash = 1469598103934665603ULL;
    for (const std::int32_t value : key)
    {
        hash ^= static_cast<std::size_t>(static_cast<std::uint32_t>(value));
        hash *= 1099511628211ULL;
    }
    return hash;
}

SpatialClusterer::SpatialClusterer(ClusterSettings settings)
    : m_settings(settings)
{
}

std::vector<utility::Cluster> SpatialClusterer::cluster(const utility::ThreatRecords& records, const ZoomBand& band)
{
    if (records.empty())
    {
        return {};
    }

    m_sanitized = records;
    std::size_t sanitizedCount = 0U;
    for (auto& record : m_sanitized)
    {
        if (utility::sanitizeRecord(record))
        {
            ++sanitizedCount;
        }
    }
    if (sanitizedCount > 0U)
    {
        Logger::log(Logger::Level::Warning,
                    "Clamped " + std::to_string(sanitizedCount) + " out-of-range threat records before clustering");
    }

    std::vector<utility::Cluster> clusters = band.near ? clusterNear(m_sanitized) : clusterGrid(m_sanitized);
    Logger::log(Logger::Level::Info,
                "Clustered " + std::to_string(records.size()) + " records into " + std::to_string(clusters.size()) +
                    " clusters for zoom band " + std::to_string(band.index) + (band.near ? " (near)" : ""));
    return clusters;
}

void SpatialClusterer::applySettings(const ClusterSettings& settings)
{
    m_settings = settings;
}

const ClusterSettings& SpatialClusterer::settings() const noexcept
{
    return m_settings;
}

std::vector<utility::Cluster> SpatialClusterer::clusterNear(const utility::ThreatRecords& records) const
{
    const std::size_t count = std::min(records.size(), m_settings.maxNearClusters);
    if (count < records.size())
    {
        Logger::log(Logger::Level::Warning,
                    "Near view capped at " + std::to_string(count) + " of " + std::to_string(records.size()) +
                        " records");
    }

    std::vector<utility::Cluster> clusters;
    clusters.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const auto& record = records[i];
        clusters.push_back(makeSingleton(
            record, utility::latLonToSphere(record.latitude, record.longitude, m_settings.markerRadius)));
    }
    return clusters;
}

std::vector<utility::Cluster> SpatialClusterer::clusterGrid(const utility::ThreatRecords& records)
{
    m_cellIndex.clear();
    m_cells.clear();
    m_cellIndex.reserve(records.size());

    for (const auto& record : records)
    {
        const glm::vec3 position = utility::latLonToSphere(record.latitude, record.longitude, m_settings.markerRadius);
        const CellKey key = cellFor(position);
        const auto inserted = m_cellIndex.emplace(key, m_cells.size());
        if (inserted.second)
        {
            m_cells.emplace_back();
        }
        Cell& cell = m_cells[inserted.first->second];
        cell.members.push_back(&record);
        cell.positions.push_back(position);
    }

    std::vector<utility::Cluster> clusters;
    clusters.reserve(records.size());
    for (const Cell& cell : m_cells)
    {
        if (cell.members.size() <= m_settings.individualThreshold)
        {
            for (std::size_t i = 0; i < cell.members.size(); ++i)
            {
                clusters.push_back(makeSingleton(*cell.members[i], cell.positions[i]));
            }
        }
        else
        {
            clusters.push_back(collapseCell(cell));
        }
    }

    capClusters(clusters);
    return clusters;
}

SpatialClusterer::CellKey SpatialClusterer::cellFor(const glm::vec3& position) const
{
    const float cellSize = std::max(m_settings.cellSize, kMinCellSize);
    return {static_cast<std::int32_t>(std::floor(position.x / cellSize)),
            static_cast<std::int32_t>(std::floor(position.y / cellSize)),
            static_cast<std::int32_t>(std::floor(position.z / cellSize))};
}

utility::Cluster SpatialClusterer::makeSingleton(const utility::ThreatRecord& record, const glm::vec3& position) const
{
    utility::Cluster cluster;
    cluster.id = record.id;
    cluster.position = position;
    cluster.memberIds.push_back(record.id);
    cluster.averageSeverity = static_cast<float>(record.severity);
    cluster.dominantCategory = record.category;
    cluster.colors = utility::threatColors(record.category, cluster.averageSeverity);
    return cluster;
}

utility::Cluster SpatialClusterer::collapseCell(const Cell& cell) const
{
    const utility::ThreatRecord& anchor = *cell.members.front();

    utility::Cluster cluster;
    cluster.id = kClusterIdPrefix + anchor.id;
    cluster.position = cell.positions.front();
    cluster.memberIds.reserve(cell.members.size());

    double totalSeverity = 0.0;
    for (const auto* member : cell.members)
    {
        cluster.memberIds.push_back(member->id);
        totalSeverity += static_cast<double>(member->severity);
    }

    cluster.averageSeverity = static_cast<float>(totalSeverity / static_cast<double>(cell.members.size()));
    cluster.dominantCategory = dominantCategory(cell.members);
    cluster.colors = utility::threatColors(cluster.dominantCategory, cluster.averageSeverity);
    return cluster;
}

void SpatialClusterer::capClusters(std::vector<utility::Cluster>& clusters) const
{
    if (clusters.size() <= m_settings.maxClusters)
    {
        return;
    }

    Logger::log(Logger::Level::Warning,
                "Cluster budget exceeded: keeping " + std::to_string(m_settings.maxClusters) + " of " +
                    std::to_string(clusters.size()) + " clusters by severity");
    std::stable_sort(clusters.begin(),
                     clusters.end(),
                     [](const utility::Cluster& lhs, const utility::Cluster& rhs)
                     { return lhs.averageSeverity > rhs.averageSeverity; });
    clusters.resize(m_settings.maxClusters);
}

utility::ThreatCategory dominantCategory(const std::vector<const utility::ThreatRecord*>& members)
{
    constexpr std::size_t kCategoryCount = static_cast<std::size_t>(utility::ThreatCategory::Unknown) + 1U;
    std::array<std::size_t, kCategoryCount> counts{};
    std::vector<utility::ThreatCategory> firstSeen;
    firstSeen.reserve(kCategoryCount);

    for (const auto* member : members)
    {
        const auto index = static_cast<std::size_t>(member->category);
        if (counts[index] == 0U)
        {
            firstSeen.push_back(member->category);
        }
        ++counts[index];
    }

    utility::ThreatCategory best = utility::ThreatCategory::Unknown;
    std::size_t bestCount = 0U;
    for (const auto category : firstSeen)
    {
        const std::size_t count = counts[static_cast<std::size_t>(category)];
        if (count > bestCount)
        {
            best = category;
            bestCount = count;
        }
    }
    return best;
}

} // namespace globe::core
