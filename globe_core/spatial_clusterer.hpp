#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "globe_core/processing_common.hpp"
#include "utility/threat_types.hpp"

namespace globe::core
{

class SpatialClusterer
{
public:
    explicit SpatialClusterer(ClusterSettings settings = {});

    // Near bands return one singleton per record, capped at maxNearClusters in
    // input order. Other bands bucket records into a uniform 3-D grid: sparse
    // cells stay individual, dense cells collapse into one cluster. The result
    // never exceeds maxClusters; when capping, clusters are ordered by
    // aggregate severity (descending, stable on cell first-seen order).
    std::vector<utility::Cluster> cluster(const utility::ThreatRecords& records, const ZoomBand& band);

    void applySettings(const ClusterSettings& settings);
    const ClusterSettings& settings() const noexcept;

private:
    using CellKey = std::array<std::int32_t, 3>;

    struct CellKeyHash
    {
        std::size_t operator()(const CellKey& key) const noexcept;
    };

    struct Cell
    {
        std::vector<const utility::ThreatRecord*> members;
        std::vector<glm::vec3> positions;
    };

    std::vector<utility::Cluster> clusterNear(const utility::ThreatRecords& records) const;
    std::vector<utility::Cluster> clusterGrid(const utility::ThreatRecords& records);
    CellKey cellFor(const glm::vec3& position) const;
    utility::Cluster makeSingleton(const utility::ThreatRecord& record, const glm::vec3& position) const;
    utility::Cluster collapseCell(const Cell& cell) const;
    void capClusters(std::vector<utility::Cluster>& clusters) const;

    ClusterSettings m_settings;

    // Scratch storage reused between passes.
    std::unordered_map<CellKey, std::size_t, CellKeyHash> m_cellIndex;
    std::vector<Cell> m_cells;
    utility::ThreatRecords m_sanitized;
};

// Plurality vote over categories. Ties go to the category whose first member
// appears earliest in the given order.
utility::ThreatCategory dominantCategory(const std::vector<const utility::ThreatRecord*>& members);

} // namespace globe::core
