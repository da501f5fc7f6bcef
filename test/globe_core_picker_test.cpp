#include "globe_core/cluster_picker.hpp"

#include "test_helpers.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace
{
utility::Cluster makeCluster(const std::string& id, const glm::vec3& position, std::vector<std::string> members)
{
    utility::Cluster cluster;
    cluster.id = id;
    cluster.position = position;
    cluster.memberIds = std::move(members);
    return cluster;
}
} // namespace

TEST(ClusterPickerTest, MissOutsideTolerance)
{
    const std::vector<utility::Cluster> clusters = {makeCluster("a", glm::vec3(2.05f, 0.0f, 0.0f), {"a"})};
    const auto result =
        globe::core::ClusterPicker::pick(clusters, {test_helpers::makeRecord("a", 0.0, 0.0)}, glm::vec3(0.0f, 2.05f, 0.0f), 0.1f);
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(globe::core::ClusterPicker::pick({}, {}, glm::vec3(0.0f), 1.0f).has_value());
}

TEST(ClusterPickerTest, PicksNearestAndExpandsMembersBySeverity)
{
    const utility::ThreatRecords records = {
        test_helpers::makeRecord("low", 0.0, 0.0, utility::ThreatCategory::Scam, 2),
        test_helpers::makeRecord("high", 0.0, 0.0, utility::ThreatCategory::Scam, 9),
        test_helpers::makeRecord("mid", 0.0, 0.0, utility::ThreatCategory::Scam, 5),
        test_helpers::makeRecord("other", 0.0, 0.0, utility::ThreatCategory::Scam, 10),
    };
    const std::vector<utility::Cluster> clusters = {
        makeCluster("far", glm::vec3(2.0f, 0.1f, 0.0f), {"other"}),
        makeCluster("cluster-low", glm::vec3(2.0f, 0.0f, 0.0f), {"low", "high", "missing", "mid"}),
    };

    const auto result = globe::core::ClusterPicker::pick(clusters, records, glm::vec3(2.0f, 0.02f, 0.0f), 0.2f);
    ASSERT_TRUE(result.has_value());
    ASSERT_NE(result->cluster, nullptr);
    EXPECT_EQ(result->cluster->id, "cluster-low");

    ASSERT_EQ(result->members.size(), 3U);
    EXPECT_EQ(result->members[0].id, "high");
    EXPECT_EQ(result->members[1].id, "mid");
    EXPECT_EQ(result->members[2].id, "low");
}
