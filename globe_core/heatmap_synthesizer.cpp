#include "globe_core/heatmap_synthesizer.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

#include "logging/Logger.hpp"
#include "utility/geo_projection.hpp"
#include "utility/math_utils.hpp"

namespace globe::core
{
namespace
{
constexpr std::size_t kChannels = 4U;

struct GradientStop
{
    float offset;
    float alphaFactor;
};

constexpr std::array<GradientStop, 5> kGradientStops = {{
    {0.0f, 1.0f},
    {0.2f, 0.8f},
    {0.5f, 0.6f},
    {0.8f, 0.3f},
    {1.0f, 0.0f},
}};

float gradientFactor(float t)
{
    if (t <= 0.0f)
    {
        return kGradientStops.front().alphaFactor;
    }
    for (std::size_t i = 1; i < kGradientStops.size(); ++i)
    {
        const GradientStop& upper = kGradientStops[i];
        if (t <= upper.offset)
        {
            const GradientStop& lower = kGradientStops[i - 1U];
            const float span = (t - lower.offset) / (upper.offset - lower.offset);
            return utility::lerp(lower.alphaFactor, upper.alphaFactor, span);
        }
    }
    return kGradientStops.back().alphaFactor;
}

int wrapColumn(int x, int width)
{
    const int wrapped = x % width;
    return wrapped < 0 ? wrapped + width : wrapped;
}

std::uint8_t toByte(float value)
{
    return static_cast<std::uint8_t>(std::lround(utility::clamp(value, 0.0f, 1.0f) * 255.0f));
}
} // namespace

HeatmapTexture::HeatmapTexture(int width, int height, std::string fingerprint, std::size_t recordCount)
    : m_width(std::max(1, width))
    , m_height(std::max(1, height))
    , m_fingerprint(std::move(fingerprint))
    , m_recordCount(recordCount)
    , m_pixels(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height) * kChannels, 0U)
{
}

int HeatmapTexture::width() const noexcept
{
    return m_width;
}

int HeatmapTexture::height() const noexcept
{
    return m_height;
}

const std::string& HeatmapTexture::fingerprint() const noexcept
{
    return m_fingerprint;
}

std::size_t HeatmapTexture::recordCount() const noexcept
{
    return m_recordCount;
}

const std::vector<std::uint8_t>& HeatmapTexture::pixels() const noexcept
{
    return m_pixels;
}

std::vector<std::uint8_t>& HeatmapTexture::pixels() noexcept
{
    return m_pixels;
}

std::array<std::uint8_t, 4> HeatmapTexture::pixel(int x, int y) const
{
    if (m_released || x < 0 || y < 0 || x >= m_width || y >= m_height)
    {
        return {0U, 0U, 0U, 0U};
    }
    const std::size_t offset =
        (static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x)) * kChannels;
    return {m_pixels[offset], m_pixels[offset + 1U], m_pixels[offset + 2U], m_pixels[offset + 3U]};
}

void HeatmapTexture::release()
{
    std::vector<std::uint8_t>().swap(m_pixels);
    m_released = true;
}

bool HeatmapTexture::released() const noexcept
{
    return m_released;
}

std::string computeFingerprint(const utility::ThreatRecords& records)
{
    std::vector<std::string> entries;
    entries.reserve(records.size());
    for (const auto& record : records)
    {
        std::ostringstream entry;
        entry << std::setprecision(std::numeric_limits<double>::max_digits10);
        entry << record.id << '-' << record.latitude << '-' << record.longitude << '-' << record.severity << '-'
              << utility::threatCategoryName(record.category);
        entries.push_back(entry.str());
    }
    std::sort(entries.begin(), entries.end());

    std::string fingerprint;
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        if (i > 0U)
        {
            fingerprint.push_back('|');
        }
        fingerprint += entries[i];
    }
    return fingerprint;
}

HeatmapSynthesizer::HeatmapSynthesizer(HeatmapSettings settings, HeatmapCache& cache)
    : m_settings(settings)
    , m_cache(cache)
{
}

HeatmapTextureHandle HeatmapSynthesizer::synthesize(const utility::ThreatRecords& records)
{
    if (records.empty())
    {
        return nullptr;
    }

    utility::ThreatRecords sanitized = records;
    for (auto& record : sanitized)
    {
        utility::sanitizeRecord(record);
    }

    std::string fingerprint = computeFingerprint(sanitized);
    if (auto* cached = m_cache.find(fingerprint))
    {
        Logger::log(Logger::Level::Info,
                    "Heatmap cache hit for " + std::to_string(sanitized.size()) + " records");
        return *cached;
    }

    std::shared_ptr<HeatmapTexture> texture = paint(sanitized, fingerprint);
    m_cache.insert(fingerprint, texture);
    return texture;
}

void HeatmapSynthesizer::applySettings(const HeatmapSettings& settings)
{
    const bool rasterChanged = settings.width != m_settings.width || settings.height != m_settings.height;
    m_settings = settings;
    m_cache.setCapacity(settings.cacheCapacity);
    if (rasterChanged)
    {
        // Cached rasters no longer match the requested resolution.
        m_cache.clear();
    }
}

const HeatmapSettings& HeatmapSynthesizer::settings() const noexcept
{
    return m_settings;
}

std::size_t HeatmapSynthesizer::paintCount() const noexcept
{
    return m_paintCount;
}

std::shared_ptr<HeatmapTexture> HeatmapSynthesizer::paint(const utility::ThreatRecords& records,
                                                          std::string fingerprint)
{
    const int width = std::max(1, m_settings.width);
    const int height = std::max(1, m_settings.height);
    auto texture = std::make_shared<HeatmapTexture>(width, height, std::move(fingerprint), records.size());

    m_accumulator.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * kChannels, 0.0f);
    for (const auto& record : records)
    {
        splat(record);
    }
    blur();
    resolve(*texture);

    ++m_paintCount;
    Logger::log(Logger::Level::Info,
                "Painted heatmap " + std::to_string(width) + "x" + std::to_string(height) + " from " +
                    std::to_string(records.size()) + " records");
    return texture;
}

void HeatmapSynthesizer::splat(const utility::ThreatRecord& record)
{
    const int width = std::max(1, m_settings.width);
    const int height = std::max(1, m_settings.height);

    const glm::vec2 uv = utility::latLonToEquirect(record.latitude, record.longitude);
    const float centerX = uv.x * static_cast<float>(width);
    const float centerY = uv.y * static_cast<float>(height);

    const float severity = static_cast<float>(record.severity);
    const float radius = std::max(m_settings.minRadius, severity * m_settings.radiusPerSeverity);
    if (!(radius > 0.0f))
    {
        return;
    }
    const float alpha =
        utility::clamp(severity / 10.0f + m_settings.alphaBase, m_settings.alphaFloor, m_settings.alphaCeiling);
    const glm::vec3 color = utility::threatColors(record.category, severity).glow;

    const int minY = std::max(0, static_cast<int>(std::floor(centerY - radius)));
    const int maxY = std::min(height - 1, static_cast<int>(std::ceil(centerY + radius)));
    const int minX = static_cast<int>(std::floor(centerX - radius));
    const int maxX = static_cast<int>(std::ceil(centerX + radius));

    for (int y = minY; y <= maxY; ++y)
    {
        const float dy = static_cast<float>(y) + 0.5f - centerY;
        for (int x = minX; x <= maxX; ++x)
        {
            const float dx = static_cast<float>(x) + 0.5f - centerX;
            const float t = std::sqrt(dx * dx + dy * dy) / radius;
            if (t >= 1.0f)
            {
                continue;
            }

            const float a = alpha * gradientFactor(t);
            const std::size_t offset =
                (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                 static_cast<std::size_t>(wrapColumn(x, width))) *
                kChannels;
            m_accumulator[offset] += color.r * a;
            m_accumulator[offset + 1U] += color.g * a;
            m_accumulator[offset + 2U] += color.b * a;
            m_accumulator[offset + 3U] += a;
        }
    }
}

void HeatmapSynthesizer::blur()
{
    const int radius = std::max(0, m_settings.blurRadius);
    if (radius == 0)
    {
        return;
    }

    const int width = std::max(1, m_settings.width);
    const int height = std::max(1, m_settings.height);
    const float weight = 1.0f / static_cast<float>(2 * radius + 1);
    m_scratch.assign(m_accumulator.size(), 0.0f);

    const auto index = [width](int x, int y)
    { return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * kChannels; };

    // Horizontal pass wraps across the antimeridian.
    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
        {
            const std::size_t out = index(x, y);
            for (int k = -radius; k <= radius; ++k)
            {
                const std::size_t in = index(wrapColumn(x + k, width), y);
                for (std::size_t c = 0; c < kChannels; ++c)
                {
                    m_scratch[out + c] += m_accumulator[in + c] * weight;
                }
            }
        }
    }

    // Vertical pass treats rows beyond the poles as empty.
    std::fill(m_accumulator.begin(), m_accumulator.end(), 0.0f);
    for (int y = 0; y < height; ++y)
    {
        const int fromY = std::max(0, y - radius);
        const int toY = std::min(height - 1, y + radius);
        for (int x = 0; x < width; ++x)
        {
            const std::size_t out = index(x, y);
            for (int k = fromY; k <= toY; ++k)
            {
                const std::size_t in = index(x, k);
                for (std::size_t c = 0; c < kChannels; ++c)
                {
                    m_accumulator[out + c] += m_scratch[in + c] * weight;
                }
            }
        }
    }
}

void HeatmapSynthesizer::resolve(HeatmapTexture& texture) const
{
    std::vector<std::uint8_t>& pixels = texture.pixels();
    for (std::size_t i = 0; i + kChannels <= m_accumulator.size() && i + kChannels <= pixels.size(); i += kChannels)
    {
        // Additive compositing saturates per channel.
        const float alpha = std::min(1.0f, m_accumulator[i + 3U]);
        pixels[i] = toByte(m_accumulator[i]);
        pixels[i + 1U] = toByte(m_accumulator[i + 1U]);
        pixels[i + 2U] = toByte(m_accumulator[i + 2U]);
        pixels[i + 3U] = toByte(alpha);
    }
}

} // namespace globe::core
