#include "globe_core/cluster_picker.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <unordered_map>

namespace globe::core
{

std::optional<PickResult> ClusterPicker::pick(const std::vector<utility::Cluster>& clusters,
                                              const utility::ThreatRecords& records,
                                              const glm::vec3& worldPoint,
                                              float tolerance)
{
    const utility::Cluster* best = nullptr;
    float bestDistance = std::numeric_limits<float>::max();
    for (const auto& cluster : clusters)
    {
        const float distance = glm::length(cluster.position - worldPoint);
        if (distance <= tolerance && distance < bestDistance)
        {
            best = &cluster;
            bestDistance = distance;
        }
    }
    if (best == nullptr)
    {
        return std::nullopt;
    }

    PickResult result;
    result.cluster = best;

    std::unordered_map<std::string, const utility::ThreatRecord*> byId;
    byId.reserve(records.size());
    for (const auto& record : records)
    {
        byId.emplace(record.id, &record);
    }

    result.members.reserve(best->memberIds.size());
    for (const auto& id : best->memberIds)
    {
        const auto it = byId.find(id);
        if (it != byId.end())
        {
            result.members.push_back(*it->second);
        }
    }

    std::stable_sort(result.members.begin(),
                     result.members.end(),
                     [](const utility::ThreatRecord& lhs, const utility::ThreatRecord& rhs)
                     { return lhs.severity > rhs.severity; });
    return result;
}

} // namespace globe::core
