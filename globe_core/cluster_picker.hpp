#pragma once

#include <optional>
#include <vector>

#include <glm/glm.hpp>

#include "utility/threat_types.hpp"

namespace globe::core
{

struct PickResult
{
    const utility::Cluster* cluster = nullptr;
    // Member records, most severe first.
    utility::ThreatRecords members;
};

// Resolves a world-space hit to the nearest cluster and expands it back into
// the records it stands for.
class ClusterPicker
{
public:
    static std::optional<PickResult> pick(const std::vector<utility::Cluster>& clusters,
                                          const utility::ThreatRecords& records,
                                          const glm::vec3& worldPoint,
                                          float tolerance);
};

} // namespace globe::core
