#include "globe_core/visualization_pipeline.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "logging/Logger.hpp"
#include "utility/math_utils.hpp"

namespace globe::core
{

VisualizationPipeline::VisualizationPipeline(VisualizationSettings settings)
    : m_settings(std::move(settings))
    , m_zoom(m_settings.zoom, m_settings.clustering.nearBandDistance)
    , m_clusterer(m_settings.clustering)
    , m_textureCache(m_settings.heatmap.cacheCapacity)
    , m_synthesizer(m_settings.heatmap, m_textureCache)
{
    m_textureCache.setEvictionCallback(
        [this](const std::string&, std::shared_ptr<HeatmapTexture>& texture)
        {
            if (!texture)
            {
                return;
            }
            Logger::log(Logger::Level::Info,
                        "Evicting heatmap texture built from " + std::to_string(texture->recordCount()) + " records");
            if (m_onTextureEvicted)
            {
                m_onTextureEvicted(*texture);
            }
            texture->release();
        });
}

void VisualizationPipeline::setRecords(const utility::ThreatRecords& records)
{
    m_records = records;
    std::size_t adjusted = 0U;
    for (auto& record : m_records)
    {
        if (utility::sanitizeRecord(record))
        {
            ++adjusted;
        }
    }
    if (adjusted > 0U)
    {
        Logger::log(Logger::Level::Warning,
                    "Sanitized " + std::to_string(adjusted) + " of " + std::to_string(m_records.size()) +
                        " incoming threat records");
    }
    ++m_revision;
}

const utility::ThreatRecords& VisualizationPipeline::records() const noexcept
{
    return m_records;
}

std::uint64_t VisualizationPipeline::recordRevision() const noexcept
{
    return m_revision;
}

const FrameOutput& VisualizationPipeline::update(float distance, double time_s)
{
    const ZoomState& zoom = m_zoom.update(distance, time_s);
    m_output.mode = zoom.mode;
    m_output.progress = zoom.progress;
    m_output.band = zoom.band;
    m_output.clustersRecomputed = false;
    m_output.heatmapRecomputed = false;

    if (!m_lastTime_s)
    {
        m_output.heatOpacity = 1.0f - zoom.progress;
        m_output.clusterOpacity = zoom.progress;
    }
    else
    {
        smoothOpacities(static_cast<float>(std::max(0.0, time_s - *m_lastTime_s)));
    }
    m_lastTime_s = time_s;

    if (shouldRecluster(time_s))
    {
        recluster(time_s);
    }

    if (heatLayerVisible())
    {
        refreshHeatmap();
        m_output.heatmap = m_heatmap;
    }
    else
    {
        m_output.heatmap = nullptr;
    }

    return m_output;
}

const FrameOutput& VisualizationPipeline::output() const noexcept
{
    return m_output;
}

const ZoomState& VisualizationPipeline::zoomState() const noexcept
{
    return m_zoom.state();
}

void VisualizationPipeline::setModeCallback(ZoomStateMachine::ModeCallback callback)
{
    m_zoom.setModeCallback(std::move(callback));
}

void VisualizationPipeline::setZoomLevelCallback(ZoomStateMachine::ZoomLevelCallback callback)
{
    m_zoom.setZoomLevelCallback(std::move(callback));
}

void VisualizationPipeline::setTextureEvictionCallback(TextureEvictionCallback callback)
{
    m_onTextureEvicted = std::move(callback);
}

void VisualizationPipeline::applySettings(const VisualizationSettings& settings)
{
    m_settings = settings;
    m_zoom.applySettings(settings.zoom, settings.clustering.nearBandDistance);
    m_clusterer.applySettings(settings.clustering);
    m_synthesizer.applySettings(settings.heatmap);
    m_clusteredRevision.reset();
    m_heatmapRevision.reset();
    m_heatmap.reset();
}

const VisualizationSettings& VisualizationPipeline::settings() const noexcept
{
    return m_settings;
}

TextureCacheStats VisualizationPipeline::textureCacheStats() const noexcept
{
    TextureCacheStats stats;
    stats.size = m_textureCache.size();
    stats.capacity = m_textureCache.capacity();
    stats.hits = m_textureCache.hits();
    stats.misses = m_textureCache.misses();
    stats.evictions = m_textureCache.evictions();
    stats.paints = m_synthesizer.paintCount();
    return stats;
}

void VisualizationPipeline::smoothOpacities(float dt_s)
{
    const float factor = std::min(1.0f, dt_s * m_settings.pipeline.opacitySmoothingRate);
    m_output.heatOpacity = utility::lerp(m_output.heatOpacity, 1.0f - m_output.progress, factor);
    m_output.clusterOpacity = utility::lerp(m_output.clusterOpacity, m_output.progress, factor);
}

bool VisualizationPipeline::shouldRecluster(double time_s) const
{
    if (!m_clusteredRevision || *m_clusteredRevision != m_revision)
    {
        return true;
    }
    if (m_output.band == m_clusteredBand)
    {
        return false;
    }
    return time_s - m_lastClusterTime_s >= static_cast<double>(m_settings.pipeline.recomputeInterval_s);
}

void VisualizationPipeline::recluster(double time_s)
{
    m_output.clusters = m_clusterer.cluster(m_records, m_output.band);
    m_output.clustersRecomputed = true;
    m_clusteredRevision = m_revision;
    m_clusteredBand = m_output.band;
    m_lastClusterTime_s = time_s;
}

bool VisualizationPipeline::heatLayerVisible() const
{
    const float epsilon = m_settings.pipeline.opacityEpsilon;
    const float target = 1.0f - m_output.progress;
    return m_output.heatOpacity >= epsilon || target >= epsilon;
}

void VisualizationPipeline::refreshHeatmap()
{
    if (m_heatmapRevision && *m_heatmapRevision == m_revision)
    {
        return;
    }
    m_heatmap = m_synthesizer.synthesize(m_records);
    m_heatmapRevision = m_revision;
    m_output.heatmapRecomputed = true;
}

} // namespace globe::core
