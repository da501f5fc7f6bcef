#include "config/GlobeConfig.hpp"

#include <algorithm>
#include <string>

#include "IniFileParser.h"
#include "logging/Logger.hpp"

namespace globe
{
namespace
{
void warnReset(const std::string& what)
{
    Logger::log(Logger::Level::Warning, "GlobeConfig: invalid " + what + ", using defaults");
}

void readZoomSection(const IniFileParser& parser, core::ZoomSettings& zoom)
{
    const std::string section = "Zoom";
    parser.readScalar(section, "farBound", zoom.farBound);
    parser.readScalar(section, "nearBound", zoom.nearBound);
    parser.readScalar(section, "minDistance", zoom.minDistance);
    parser.readScalar(section, "maxDistance", zoom.maxDistance);
    parser.readScalar(section, "transitionDuration", zoom.transitionDuration_s);

    if (parser.hasValue(section, "levels") && !parser.getRealList(section, "levels", zoom.levels))
    {
        Logger::log(Logger::Level::Warning, "GlobeConfig: could not parse [Zoom] levels, keeping defaults");
    }

    const core::ZoomSettings defaults;
    if (!(zoom.farBound > zoom.nearBound))
    {
        warnReset("[Zoom] farBound/nearBound");
        zoom.farBound = defaults.farBound;
        zoom.nearBound = defaults.nearBound;
    }
    if (!(zoom.maxDistance > zoom.minDistance) || zoom.minDistance <= 0.0f)
    {
        warnReset("[Zoom] minDistance/maxDistance");
        zoom.minDistance = defaults.minDistance;
        zoom.maxDistance = defaults.maxDistance;
    }
    zoom.transitionDuration_s = std::max(0.0f, zoom.transitionDuration_s);
    if (zoom.levels.empty())
    {
        zoom.levels = defaults.levels;
    }
}

void readClusteringSection(const IniFileParser& parser, core::ClusterSettings& clustering)
{
    const std::string section = "Clustering";
    parser.readScalar(section, "cellSize", clustering.cellSize);
    parser.readSize(section, "individualThreshold", clustering.individualThreshold);
    parser.readSize(section, "maxClusters", clustering.maxClusters);
    parser.readSize(section, "maxNearClusters", clustering.maxNearClusters);
    parser.readScalar(section, "markerRadius", clustering.markerRadius);
    parser.readScalar(section, "nearBandDistance", clustering.nearBandDistance);

    const core::ClusterSettings defaults;
    if (!(clustering.cellSize > 0.0f))
    {
        warnReset("[Clustering] cellSize");
        clustering.cellSize = defaults.cellSize;
    }
    if (clustering.maxClusters == 0U || clustering.maxNearClusters == 0U)
    {
        warnReset("[Clustering] cluster caps");
        clustering.maxClusters = defaults.maxClusters;
        clustering.maxNearClusters = defaults.maxNearClusters;
    }
}

void readHeatmapSection(const IniFileParser& parser, core::HeatmapSettings& heatmap)
{
    const std::string section = "Heatmap";
    parser.readInteger(section, "width", heatmap.width);
    parser.readInteger(section, "height", heatmap.height);
    parser.readInteger(section, "blurRadius", heatmap.blurRadius);
    parser.readScalar(section, "minRadius", heatmap.minRadius);
    parser.readScalar(section, "radiusPerSeverity", heatmap.radiusPerSeverity);
    parser.readScalar(section, "alphaFloor", heatmap.alphaFloor);
    parser.readScalar(section, "alphaCeiling", heatmap.alphaCeiling);
    parser.readSize(section, "cacheCapacity", heatmap.cacheCapacity);

    const core::HeatmapSettings defaults;
    if (heatmap.width <= 0 || heatmap.height <= 0)
    {
        warnReset("[Heatmap] width/height");
        heatmap.width = defaults.width;
        heatmap.height = defaults.height;
    }
    if (heatmap.alphaFloor > heatmap.alphaCeiling)
    {
        warnReset("[Heatmap] alphaFloor/alphaCeiling");
        heatmap.alphaFloor = defaults.alphaFloor;
        heatmap.alphaCeiling = defaults.alphaCeiling;
    }
    heatmap.blurRadius = std::max(0, heatmap.blurRadius);
    heatmap.cacheCapacity = std::max<std::size_t>(1U, heatmap.cacheCapacity);
}

void readPipelineSection(const IniFileParser& parser, core::PipelineSettings& pipeline)
{
    const std::string section = "Pipeline";
    parser.readScalar(section, "recomputeInterval", pipeline.recomputeInterval_s);
    parser.readScalar(section, "opacitySmoothingRate", pipeline.opacitySmoothingRate);
    parser.readScalar(section, "opacityEpsilon", pipeline.opacityEpsilon);

    pipeline.recomputeInterval_s = std::max(0.0f, pipeline.recomputeInterval_s);
    pipeline.opacitySmoothingRate = std::max(0.0f, pipeline.opacitySmoothingRate);
}
} // namespace

bool GlobeConfig::load(const std::filesystem::path& path)
{
    m_settings = core::VisualizationSettings{};
    m_recordFile.clear();

    IniFileParser parser;
    if (!parser.parseFile(path.string()))
    {
        Logger::log(Logger::Level::Error,
                    "GlobeConfig failed to parse " + path.string() + " (error " +
                        std::to_string(parser.parseError()) + ")");
        return false;
    }

    readZoomSection(parser, m_settings.zoom);
    readClusteringSection(parser, m_settings.clustering);
    readHeatmapSection(parser, m_settings.heatmap);
    readPipelineSection(parser, m_settings.pipeline);

    std::string recordFile;
    parser.readString("Feed", "recordFile", recordFile);
    if (!recordFile.empty())
    {
        m_recordFile = recordFile;
        if (m_recordFile.is_relative())
        {
            m_recordFile = path.parent_path() / m_recordFile;
        }
    }

    Logger::log(Logger::Level::Info, "Loaded globe configuration from " + path.string());
    return true;
}

const core::VisualizationSettings& GlobeConfig::settings() const noexcept
{
    return m_settings;
}

const std::filesystem::path& GlobeConfig::recordFile() const noexcept
{
    return m_recordFile;
}

} // namespace globe
