#include "globe_core/spatial_clusterer.hpp"

#include "test_helpers.hpp"
#include "utility/geo_projection.hpp"

#include <array>
#include <cmath>
#include <set>
#include <string>
#include <unordered_map>

#include <gtest/gtest.h>

namespace
{
using utility::ThreatCategory;

const globe::core::ZoomBand kFarBand{0U, 25.0f, false};
const globe::core::ZoomBand kNearBand{7U, 6.5f, true};

std::array<int, 3> cellOf(const utility::ThreatRecord& record, float cellSize)
{
    const glm::vec3 p = utility::latLonToSphere(record.latitude, record.longitude, 2.05f);
    return {static_cast<int>(std::floor(p.x / cellSize)),
            static_cast<int>(std::floor(p.y / cellSize)),
            static_cast<int>(std::floor(p.z / cellSize))};
}
} // namespace

TEST(SpatialClustererTest, EmptyInputYieldsNoClusters)
{
    globe::core::SpatialClusterer clusterer;
    EXPECT_TRUE(clusterer.cluster({}, kFarBand).empty());
    EXPECT_TRUE(clusterer.cluster({}, kNearBand).empty());
}

TEST(SpatialClustererTest, NearBandTruncatesToFirstTwoHundredSingletons)
{
    const auto records = test_helpers::makeRecordGrid(500U, 10.0, 20.0, 2.0);
    globe::core::SpatialClusterer clusterer;

    const auto clusters = clusterer.cluster(records, kNearBand);
    ASSERT_EQ(clusters.size(), 200U);
    for (std::size_t i = 0; i < clusters.size(); ++i)
    {
        EXPECT_TRUE(clusters[i].isSingleton());
        EXPECT_EQ(clusters[i].id, records[i].id);
        EXPECT_FLOAT_EQ(clusters[i].averageSeverity, static_cast<float>(records[i].severity));
    }
}

TEST(SpatialClustererTest, SparseCellKeepsMembersIndividual)
{
    const utility::ThreatRecords records = {
        test_helpers::makeRecord("a", 10.0, 10.0, ThreatCategory::Scam, 3),
        test_helpers::makeRecord("b", 10.0, 10.0, ThreatCategory::Scam, 4),
        test_helpers::makeRecord("c", 10.0, 10.0, ThreatCategory::Protection, 5),
    };
    globe::core::SpatialClusterer clusterer;

    const auto clusters = clusterer.cluster(records, kFarBand);
    ASSERT_EQ(clusters.size(), 3U);
    EXPECT_EQ(clusters[0].id, "a");
    EXPECT_EQ(clusters[2].dominantCategory, ThreatCategory::Protection);
}

TEST(SpatialClustererTest, DenseCellCollapsesWithMeanSeverityAndPlurality)
{
    globe::core::ClusterSettings settings;
    settings.individualThreshold = 1U;
    globe::core::SpatialClusterer clusterer(settings);

    const utility::ThreatRecords records = {
        test_helpers::makeRecord("first", 45.0, 45.0, ThreatCategory::FinancialRisk, 2),
        test_helpers::makeRecord("second", 45.0, 45.0, ThreatCategory::FinancialRisk, 8),
    };

    const auto clusters = clusterer.cluster(records, kFarBand);
    ASSERT_EQ(clusters.size(), 1U);
    const auto& cluster = clusters.front();
    EXPECT_EQ(cluster.id, "cluster-first");
    EXPECT_EQ(cluster.dominantCategory, ThreatCategory::FinancialRisk);
    EXPECT_FLOAT_EQ(cluster.averageSeverity, 5.0f);
    EXPECT_EQ(cluster.memberIds, (std::vector<std::string>{"first", "second"}));
    const glm::vec3 anchor = utility::latLonToSphere(45.0, 45.0, 2.05f);
    EXPECT_NEAR(glm::length(cluster.position - anchor), 0.0f, 1e-5f);
    EXPECT_FALSE(cluster.isSingleton());
}

TEST(SpatialClustererTest, DefaultThresholdCollapsesFourMembers)
{
    globe::core::SpatialClusterer clusterer;
    const utility::ThreatRecords records = {
        test_helpers::makeRecord("v1", -20.0, 130.0, ThreatCategory::Vulnerability, 9),
        test_helpers::makeRecord("s1", -20.0, 130.0, ThreatCategory::Scam, 7),
        test_helpers::makeRecord("s2", -20.0, 130.0, ThreatCategory::Scam, 7),
        test_helpers::makeRecord("v2", -20.0, 130.0, ThreatCategory::Vulnerability, 9),
    };

    const auto clusters = clusterer.cluster(records, kFarBand);
    ASSERT_EQ(clusters.size(), 1U);
    // Two-way tie resolves to the first category seen.
    EXPECT_EQ(clusters.front().dominantCategory, ThreatCategory::Vulnerability);
    EXPECT_FLOAT_EQ(clusters.front().averageSeverity, 8.0f);
    EXPECT_EQ(clusters.front().memberIds.size(), 4U);
    const auto expected = utility::threatColors(ThreatCategory::Vulnerability, 8.0f);
    EXPECT_EQ(clusters.front().colors.fill, expected.fill);
}

TEST(SpatialClustererTest, ClustersNeverSpanCellsAndCoverInput)
{
    const auto records = test_helpers::makeRecordGrid(300U, 30.0, -10.0, 20.0);
    globe::core::SpatialClusterer clusterer;
    const float cellSize = clusterer.settings().cellSize;

    const auto clusters = clusterer.cluster(records, kFarBand);
    ASSERT_LE(clusters.size(), 150U);

    std::unordered_map<std::string, const utility::ThreatRecord*> byId;
    for (const auto& record : records)
    {
        byId.emplace(record.id, &record);
    }

    std::set<std::string> covered;
    for (const auto& cluster : clusters)
    {
        ASSERT_FALSE(cluster.memberIds.empty());
        const auto cell = cellOf(*byId.at(cluster.memberIds.front()), cellSize);
        for (const auto& id : cluster.memberIds)
        {
            EXPECT_EQ(cellOf(*byId.at(id), cellSize), cell) << cluster.id;
            EXPECT_TRUE(covered.insert(id).second) << id;
        }
    }
    EXPECT_EQ(covered.size(), records.size());
}

TEST(SpatialClustererTest, CapKeepsMostSevereInStableOrder)
{
    globe::core::ClusterSettings settings;
    settings.cellSize = 0.01f;
    settings.maxClusters = 10U;
    globe::core::SpatialClusterer clusterer(settings);

    const auto records = test_helpers::makeRecordGrid(40U, -60.0, -120.0, 100.0);
    const auto clusters = clusterer.cluster(records, kFarBand);
    ASSERT_EQ(clusters.size(), 10U);

    const std::vector<std::string> expected = {
        "rec-9", "rec-19", "rec-29", "rec-39", "rec-8", "rec-18", "rec-28", "rec-38", "rec-7", "rec-17"};
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        EXPECT_EQ(clusters[i].id, expected[i]);
    }

    const auto again = clusterer.cluster(records, kFarBand);
    ASSERT_EQ(again.size(), clusters.size());
    for (std::size_t i = 0; i < again.size(); ++i)
    {
        EXPECT_EQ(again[i].id, clusters[i].id);
    }
}

TEST(SpatialClustererTest, OutOfRangeRecordsAreClampedNotDropped)
{
    utility::ThreatRecords records = {test_helpers::makeRecord("polar", 200.0, 0.0, ThreatCategory::Scam, 40)};
    globe::core::SpatialClusterer clusterer;

    const auto clusters = clusterer.cluster(records, kFarBand);
    ASSERT_EQ(clusters.size(), 1U);
    EXPECT_NEAR(clusters.front().position.y, 2.05f, 1e-4f);
    EXPECT_FLOAT_EQ(clusters.front().averageSeverity, 10.0f);
    // Caller data is untouched.
    EXPECT_DOUBLE_EQ(records.front().latitude, 200.0);
}

TEST(SpatialClustererTest, DominantCategoryPrefersPluralityThenFirstSeen)
{
    const auto a = test_helpers::makeRecord("a", 0.0, 0.0, ThreatCategory::Protection);
    const auto b = test_helpers::makeRecord("b", 0.0, 0.0, ThreatCategory::Scam);
    const auto c = test_helpers::makeRecord("c", 0.0, 0.0, ThreatCategory::Scam);

    EXPECT_EQ(globe::core::dominantCategory({&a, &b, &c}), ThreatCategory::Scam);
    EXPECT_EQ(globe::core::dominantCategory({&a, &b}), ThreatCategory::Protection);
    EXPECT_EQ(globe::core::dominantCategory({&b, &a}), ThreatCategory::Scam);
}
