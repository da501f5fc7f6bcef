#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "globe_core/heatmap_synthesizer.hpp"
#include "globe_core/processing_common.hpp"
#include "globe_core/spatial_clusterer.hpp"
#include "globe_core/zoom_state_machine.hpp"
#include "utility/threat_types.hpp"

namespace globe::core
{

struct FrameOutput
{
    VisualizationMode mode = VisualizationMode::Heatmap;
    float progress = 0.0f;
    ZoomBand band;
    float heatOpacity = 1.0f;
    float clusterOpacity = 0.0f;
    std::vector<utility::Cluster> clusters;
    // Null when there are no records or the heat layer is invisible.
    HeatmapTextureHandle heatmap;
    bool clustersRecomputed = false;
    bool heatmapRecomputed = false;
};

struct TextureCacheStats
{
    std::size_t size = 0U;
    std::size_t capacity = 0U;
    std::size_t hits = 0U;
    std::size_t misses = 0U;
    std::size_t evictions = 0U;
    std::size_t paints = 0U;
};

// Per-frame driver that turns a camera distance into the renderable state of
// both layers. Owns the clusterer, the synthesizer and the texture cache.
class VisualizationPipeline
{
public:
    using TextureEvictionCallback = std::function<void(const HeatmapTexture& texture)>;

    explicit VisualizationPipeline(VisualizationSettings settings = {});

    // Replaces the record set. Derived layers are rebuilt on the next update.
    void setRecords(const utility::ThreatRecords& records);
    const utility::ThreatRecords& records() const noexcept;
    std::uint64_t recordRevision() const noexcept;

    const FrameOutput& update(float distance, double time_s);
    const FrameOutput& output() const noexcept;
    const ZoomState& zoomState() const noexcept;

    void setModeCallback(ZoomStateMachine::ModeCallback callback);
    void setZoomLevelCallback(ZoomStateMachine::ZoomLevelCallback callback);
    // Runs before an evicted raster's pixels are released.
    void setTextureEvictionCallback(TextureEvictionCallback callback);

    void applySettings(const VisualizationSettings& settings);
    const VisualizationSettings& settings() const noexcept;

    TextureCacheStats textureCacheStats() const noexcept;

private:
    void smoothOpacities(float dt_s);
    bool shouldRecluster(double time_s) const;
    void recluster(double time_s);
    bool heatLayerVisible() const;
    void refreshHeatmap();

    VisualizationSettings m_settings;
    ZoomStateMachine m_zoom;
    SpatialClusterer m_clusterer;
    HeatmapCache m_textureCache;
    HeatmapSynthesizer m_synthesizer;
    TextureEvictionCallback m_onTextureEvicted;

    utility::ThreatRecords m_records;
    std::uint64_t m_revision = 0U;

    FrameOutput m_output;
    std::optional<double> m_lastTime_s;

    std::optional<std::uint64_t> m_clusteredRevision;
    ZoomBand m_clusteredBand;
    double m_lastClusterTime_s = 0.0;

    std::optional<std::uint64_t> m_heatmapRevision;
    HeatmapTextureHandle m_heatmap;
};

} // namespace globe::core
