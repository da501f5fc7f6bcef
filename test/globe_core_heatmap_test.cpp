#include "globe_core/heatmap_synthesizer.hpp"

#include "test_helpers.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace
{
using utility::ThreatCategory;

globe::core::HeatmapSettings smallRaster(std::size_t capacity = 10U)
{
    globe::core::HeatmapSettings settings;
    settings.width = 256;
    settings.height = 128;
    settings.cacheCapacity = capacity;
    return settings;
}
} // namespace

TEST(HeatmapFingerprintTest, IgnoresRecordOrder)
{
    const utility::ThreatRecords forward = {
        test_helpers::makeRecord("a", 10.0, 20.0, ThreatCategory::Scam, 3),
        test_helpers::makeRecord("b", -5.0, 100.0, ThreatCategory::Protection, 9),
    };
    const utility::ThreatRecords reversed = {forward[1], forward[0]};

    EXPECT_EQ(globe::core::computeFingerprint(forward), globe::core::computeFingerprint(reversed));
    EXPECT_NE(globe::core::computeFingerprint(forward).find('|'), std::string::npos);
}

TEST(HeatmapFingerprintTest, ChangesWithContent)
{
    utility::ThreatRecords records = {test_helpers::makeRecord("a", 10.0, 20.0, ThreatCategory::Scam, 3)};
    const std::string before = globe::core::computeFingerprint(records);

    records.front().severity = 4;
    EXPECT_NE(globe::core::computeFingerprint(records), before);
    records.front().severity = 3;
    records.front().category = ThreatCategory::Vulnerability;
    EXPECT_NE(globe::core::computeFingerprint(records), before);
}

TEST(HeatmapFingerprintTest, DistinguishesSubMicrodegreeOffsets)
{
    const utility::ThreatRecords base = {test_helpers::makeRecord("a", 10.0, 20.0, ThreatCategory::Scam, 3)};
    utility::ThreatRecords shifted = base;
    shifted.front().latitude += 1e-9;
    EXPECT_NE(globe::core::computeFingerprint(shifted), globe::core::computeFingerprint(base));

    shifted = base;
    shifted.front().longitude -= 1e-9;
    EXPECT_NE(globe::core::computeFingerprint(shifted), globe::core::computeFingerprint(base));
}

TEST(HeatmapSynthesizerTest, EmptyInputYieldsNoTexture)
{
    globe::core::HeatmapCache cache(4U);
    globe::core::HeatmapSynthesizer synthesizer(smallRaster(), cache);

    EXPECT_EQ(synthesizer.synthesize({}), nullptr);
    EXPECT_EQ(synthesizer.paintCount(), 0U);
    EXPECT_EQ(cache.size(), 0U);
}

TEST(HeatmapSynthesizerTest, ReorderedRecordsReuseCachedTexture)
{
    globe::core::HeatmapCache cache(4U);
    globe::core::HeatmapSynthesizer synthesizer(smallRaster(), cache);

    auto records = test_helpers::makeRecordGrid(12U, -30.0, -60.0, 90.0);
    const auto first = synthesizer.synthesize(records);
    std::reverse(records.begin(), records.end());
    const auto second = synthesizer.synthesize(records);

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(synthesizer.paintCount(), 1U);
    EXPECT_EQ(cache.hits(), 1U);
    EXPECT_EQ(first->recordCount(), 12U);
    EXPECT_EQ(first->width(), 256);
    EXPECT_EQ(first->height(), 128);
}

TEST(HeatmapSynthesizerTest, PaintsGlowAroundRecordCenter)
{
    globe::core::HeatmapCache cache(4U);
    globe::core::HeatmapSynthesizer synthesizer(smallRaster(), cache);

    const auto texture =
        synthesizer.synthesize({test_helpers::makeRecord("center", 0.0, 0.0, ThreatCategory::Vulnerability, 8)});
    ASSERT_NE(texture, nullptr);

    const auto center = texture->pixel(128, 64);
    EXPECT_GT(center[3], 0U);
    EXPECT_GT(center[0], center[1]);

    const auto corner = texture->pixel(10, 10);
    EXPECT_EQ(corner[3], 0U);
    EXPECT_EQ(texture->pixel(-1, 0)[3], 0U);
    EXPECT_EQ(texture->pixel(256, 0)[3], 0U);
}

TEST(HeatmapSynthesizerTest, OutputIsPremultiplied)
{
    globe::core::HeatmapCache cache(4U);
    globe::core::HeatmapSynthesizer synthesizer(smallRaster(), cache);

    const auto texture = synthesizer.synthesize(test_helpers::makeRecordGrid(30U, -40.0, -40.0, 60.0));
    ASSERT_NE(texture, nullptr);

    const auto& pixels = texture->pixels();
    ASSERT_EQ(pixels.size(), 256U * 128U * 4U);
    for (std::size_t i = 0; i < pixels.size(); i += 4U)
    {
        ASSERT_LE(pixels[i], pixels[i + 3U]);
        ASSERT_LE(pixels[i + 1U], pixels[i + 3U]);
        ASSERT_LE(pixels[i + 2U], pixels[i + 3U]);
    }
}

TEST(HeatmapSynthesizerTest, SplatsWrapAcrossAntimeridian)
{
    globe::core::HeatmapCache cache(4U);
    globe::core::HeatmapSynthesizer synthesizer(smallRaster(), cache);

    const auto texture =
        synthesizer.synthesize({test_helpers::makeRecord("edge", 0.0, 179.9, ThreatCategory::Protection, 5)});
    ASSERT_NE(texture, nullptr);

    EXPECT_GT(texture->pixel(250, 64)[3], 0U);
    EXPECT_GT(texture->pixel(3, 64)[3], 0U);
    EXPECT_EQ(texture->pixel(128, 64)[3], 0U);
}

TEST(HeatmapSynthesizerTest, EvictionRunsCallbackForStaleTexture)
{
    globe::core::HeatmapCache cache(2U);
    std::vector<std::string> evicted;
    cache.setEvictionCallback([&evicted](const std::string&, std::shared_ptr<globe::core::HeatmapTexture>& texture)
                              { evicted.push_back(texture->fingerprint()); });
    globe::core::HeatmapSynthesizer synthesizer(smallRaster(2U), cache);

    const auto first = synthesizer.synthesize({test_helpers::makeRecord("one", 0.0, 0.0)});
    synthesizer.synthesize({test_helpers::makeRecord("two", 10.0, 10.0)});
    synthesizer.synthesize({test_helpers::makeRecord("three", 20.0, 20.0)});

    ASSERT_EQ(evicted.size(), 1U);
    EXPECT_EQ(evicted.front(), first->fingerprint());
    EXPECT_EQ(synthesizer.paintCount(), 3U);
    EXPECT_EQ(cache.size(), 2U);
}

TEST(HeatmapSynthesizerTest, ResolutionChangeFlushesCache)
{
    globe::core::HeatmapCache cache(4U);
    globe::core::HeatmapSynthesizer synthesizer(smallRaster(), cache);
    const utility::ThreatRecords records = {test_helpers::makeRecord("a", 5.0, 5.0)};

    synthesizer.synthesize(records);
    auto settings = smallRaster();
    settings.width = 128;
    settings.height = 64;
    synthesizer.applySettings(settings);
    EXPECT_EQ(cache.size(), 0U);

    const auto texture = synthesizer.synthesize(records);
    ASSERT_NE(texture, nullptr);
    EXPECT_EQ(texture->width(), 128);
    EXPECT_EQ(synthesizer.paintCount(), 2U);
}

TEST(HeatmapTextureTest, ReleaseDropsPixels)
{
    globe::core::HeatmapTexture texture(4, 2, "fp", 1U);
    texture.pixels()[3] = 200U;
    EXPECT_EQ(texture.pixel(0, 0)[3], 200U);

    texture.release();
    EXPECT_TRUE(texture.released());
    EXPECT_TRUE(texture.pixels().empty());
    EXPECT_EQ(texture.pixel(0, 0)[3], 0U);
}
