#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace globe::core
{

enum class VisualizationMode : std::uint8_t
{
    Heatmap = 0,
    Pixels = 1
};

const char* visualizationModeName(VisualizationMode mode);

struct ZoomSettings
{
    float farBound = 9.0f;
    float nearBound = 6.0f;
    float minDistance = 4.0f;
    float maxDistance = 25.0f;
    float modeMidpoint = 0.5f;
    float transitionDuration_s = 1.2f;
    float progressEventThreshold = 0.001f;
    std::vector<float> levels = {25.0f, 22.0f, 19.0f, 16.0f, 13.0f, 10.0f, 8.0f, 6.5f, 5.0f};
};

struct ClusterSettings
{
    float cellSize = 0.5f;
    std::size_t individualThreshold = 3U;
    std::size_t maxClusters = 150U;
    std::size_t maxNearClusters = 200U;
    float markerRadius = 2.05f;
    float nearBandDistance = 10.0f;
};

struct HeatmapSettings
{
    int width = 1024;
    int height = 512;
    int blurRadius = 2;
    float minRadius = 12.0f;
    float radiusPerSeverity = 4.0f;
    float alphaBase = 0.3f;
    float alphaFloor = 0.35f;
    float alphaCeiling = 0.8f;
    std::size_t cacheCapacity = 10U;
};

struct PipelineSettings
{
    float recomputeInterval_s = 1.0f / 20.0f;
    float opacitySmoothingRate = 6.0f;
    float opacityEpsilon = 0.01f;
};

struct VisualizationSettings
{
    ZoomSettings zoom;
    ClusterSettings clustering;
    HeatmapSettings heatmap;
    PipelineSettings pipeline;
};

// Discretized camera distance used to gate re-clustering.
struct ZoomBand
{
    std::size_t index = 0U;
    float distance = 0.0f;
    bool near = false;

    bool operator==(const ZoomBand& other) const noexcept
    {
        return index == other.index && near == other.near;
    }
    bool operator!=(const ZoomBand& other) const noexcept
    {
        return !(*this == other);
    }
};

} // namespace globe::core
