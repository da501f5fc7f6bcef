#include "config/GlobeConfig.hpp"

#include "IniFileParser.h"
#include "test_helpers.hpp"

#include <vector>

#include <gtest/gtest.h>

TEST(GlobeConfigTest, LoadsAllSections)
{
    const auto dir = test_helpers::makeTempDir("globe_config");
    const auto path = dir / "Globe.ini";
    test_helpers::writeFile(path, test_helpers::buildGlobeConfigIni(12.0f, 7.0f, 80U, "feed.csv"));

    globe::GlobeConfig config;
    ASSERT_TRUE(config.load(path));
    const auto& settings = config.settings();

    EXPECT_FLOAT_EQ(settings.zoom.farBound, 12.0f);
    EXPECT_FLOAT_EQ(settings.zoom.nearBound, 7.0f);
    EXPECT_EQ(settings.zoom.levels, (std::vector<float>{20.0f, 12.0f, 7.0f}));
    EXPECT_FLOAT_EQ(settings.clustering.cellSize, 0.25f);
    EXPECT_EQ(settings.clustering.maxClusters, 80U);
    EXPECT_EQ(settings.clustering.maxNearClusters, 200U);
    EXPECT_EQ(settings.heatmap.width, 256);
    EXPECT_EQ(settings.heatmap.height, 128);
    EXPECT_EQ(settings.heatmap.cacheCapacity, 4U);
    EXPECT_FLOAT_EQ(settings.pipeline.recomputeInterval_s, 0.1f);
    EXPECT_EQ(config.recordFile(), dir / "feed.csv");

    test_helpers::fs::remove_all(dir);
}

TEST(GlobeConfigTest, InvalidValuesFallBackToDefaults)
{
    const auto dir = test_helpers::makeTempDir("globe_config_invalid");
    const auto path = dir / "Globe.ini";
    std::string content = test_helpers::buildGlobeConfigIni(5.0f, 8.0f, 0U, "");
    content += "[Heatmap]\nalphaFloor=0.9\nalphaCeiling=0.1\n";
    test_helpers::writeFile(path, content);

    globe::GlobeConfig config;
    ASSERT_TRUE(config.load(path));
    const globe::core::VisualizationSettings defaults;
    const auto& settings = config.settings();

    EXPECT_FLOAT_EQ(settings.zoom.farBound, defaults.zoom.farBound);
    EXPECT_FLOAT_EQ(settings.zoom.nearBound, defaults.zoom.nearBound);
    EXPECT_EQ(settings.clustering.maxClusters, defaults.clustering.maxClusters);
    EXPECT_FLOAT_EQ(settings.heatmap.alphaFloor, defaults.heatmap.alphaFloor);
    EXPECT_FLOAT_EQ(settings.heatmap.alphaCeiling, defaults.heatmap.alphaCeiling);
    EXPECT_TRUE(config.recordFile().empty());

    test_helpers::fs::remove_all(dir);
}

TEST(GlobeConfigTest, MalformedLevelsKeepDefaults)
{
    const auto dir = test_helpers::makeTempDir("globe_config_levels");
    const auto path = dir / "Globe.ini";
    test_helpers::writeFile(path, "[Zoom]\nlevels=20, near, 7\n");

    globe::GlobeConfig config;
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.settings().zoom.levels, globe::core::ZoomSettings{}.levels);

    test_helpers::fs::remove_all(dir);
}

TEST(GlobeConfigTest, AbsoluteRecordFileIsKept)
{
    const auto dir = test_helpers::makeTempDir("globe_config_abs");
    const auto feed = dir / "elsewhere" / "feed.csv";
    const auto path = dir / "Globe.ini";
    test_helpers::writeFile(path, "[Feed]\nrecordFile=" + feed.string() + "\n");

    globe::GlobeConfig config;
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.recordFile(), feed);

    test_helpers::fs::remove_all(dir);
}

TEST(GlobeConfigTest, UnreadableFileFails)
{
    const auto dir = test_helpers::makeTempDir("globe_config_bad");

    globe::GlobeConfig config;
    EXPECT_FALSE(config.load(dir / "missing.ini"));

    const auto path = dir / "Broken.ini";
    test_helpers::writeFile(path, "[Zoom]\nthis line has no separator\n");
    EXPECT_FALSE(config.load(path));

    test_helpers::fs::remove_all(dir);
}

TEST(IniFileParserTest, ReadsTypedValues)
{
    const auto dir = test_helpers::makeTempDir("ini_parser");
    const auto path = dir / "values.ini";
    test_helpers::writeFile(path,
                            "[Section]\n"
                            "count=12\n"
                            "count=99\n"
                            "negative=-3\n"
                            "ratio=0.25\n"
                            "enabled=yes\n"
                            "list=1.5, 2.5,3\n");

    IniFileParser parser;
    ASSERT_TRUE(parser.parseFile(path.string()));
    EXPECT_EQ(parser.parseError(), 0);
    EXPECT_TRUE(parser.hasValue("section", "COUNT"));

    int count = 0;
    parser.readInteger("Section", "count", count);
    EXPECT_EQ(count, 12);

    std::size_t size = 7U;
    parser.readSize("Section", "negative", size);
    EXPECT_EQ(size, 7U);

    double ratio = 0.0;
    parser.readScalar("Section", "ratio", ratio);
    EXPECT_DOUBLE_EQ(ratio, 0.25);

    bool enabled = false;
    parser.readBoolean("Section", "enabled", enabled);
    EXPECT_TRUE(enabled);

    std::vector<float> list;
    ASSERT_TRUE(parser.getRealList("Section", "list", list));
    EXPECT_EQ(list, (std::vector<float>{1.5f, 2.5f, 3.0f}));
    EXPECT_FALSE(parser.getRealList("Section", "missing", list));
    EXPECT_EQ(list.size(), 3U);

    EXPECT_EQ(parser.getString("Section", "missing", "fallback"), "fallback");

    test_helpers::fs::remove_all(dir);
}
