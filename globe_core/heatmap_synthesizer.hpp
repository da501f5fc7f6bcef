#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "globe_core/bounded_lru_cache.hpp"
#include "globe_core/processing_common.hpp"
#include "utility/threat_types.hpp"

namespace globe::core
{

// Equirectangular RGBA8 raster, row 0 at latitude +90. Colors are
// premultiplied by alpha so the surface can composite it additively.
class HeatmapTexture
{
public:
    HeatmapTexture(int width, int height, std::string fingerprint, std::size_t recordCount);

    int width() const noexcept;
    int height() const noexcept;
    const std::string& fingerprint() const noexcept;
    std::size_t recordCount() const noexcept;

    const std::vector<std::uint8_t>& pixels() const noexcept;
    std::vector<std::uint8_t>& pixels() noexcept;

    // RGBA at (x, y); zero when out of bounds or released.
    std::array<std::uint8_t, 4> pixel(int x, int y) const;

    // Frees the pixel storage. Called when the cache evicts the raster.
    void release();
    bool released() const noexcept;

private:
    int m_width;
    int m_height;
    std::string m_fingerprint;
    std::size_t m_recordCount;
    std::vector<std::uint8_t> m_pixels;
    bool m_released = false;
};

using HeatmapTextureHandle = std::shared_ptr<const HeatmapTexture>;
using HeatmapCache = BoundedLruCache<std::string, std::shared_ptr<HeatmapTexture>>;

// Canonical content key: one "id-lat-lon-severity-category" entry per record,
// sorted and joined with '|'. Insensitive to record order.
std::string computeFingerprint(const utility::ThreatRecords& records);

class HeatmapSynthesizer
{
public:
    HeatmapSynthesizer(HeatmapSettings settings, HeatmapCache& cache);

    // Returns the cached raster for this record multiset, painting it on a
    // miss. An empty set yields nullptr.
    HeatmapTextureHandle synthesize(const utility::ThreatRecords& records);

    void applySettings(const HeatmapSettings& settings);
    const HeatmapSettings& settings() const noexcept;

    // Number of rasters painted so far (cache misses).
    std::size_t paintCount() const noexcept;

private:
    std::shared_ptr<HeatmapTexture> paint(const utility::ThreatRecords& records, std::string fingerprint);
    void splat(const utility::ThreatRecord& record);
    void blur();
    void resolve(HeatmapTexture& texture) const;

    HeatmapSettings m_settings;
    HeatmapCache& m_cache;
    std::size_t m_paintCount = 0U;

    // Premultiplied RGBA accumulation buffers, reused between paints.
    std::vector<float> m_accumulator;
    std::vector<float> m_scratch;
};

} // namespace globe::core
