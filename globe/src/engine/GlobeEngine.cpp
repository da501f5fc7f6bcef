#include "engine/GlobeEngine.hpp"

#include "globe_core/cluster_picker.hpp"
#include "logging/Logger.hpp"

#include <filesystem>
#include <string>
#include <thread>
#include <utility>

namespace globe
{

GlobeEngine::GlobeEngine(std::unique_ptr<BaseThreatSource> source, core::VisualizationSettings settings)
    : m_source(std::move(source))
    , m_pipeline(std::move(settings))
{
}

GlobeEngine::~GlobeEngine() = default;

bool GlobeEngine::initialize()
{
    if (!m_source)
    {
        Logger::log(Logger::Level::Error, "No threat source configured");
        return false;
    }

    Logger::initialize(std::filesystem::current_path() / "threat_globe.log");
    Logger::log(Logger::Level::Info, "Initializing globe engine for source: " + m_source->identifier());

    m_pipeline.setTextureEvictionCallback(
        [this](const core::HeatmapTexture& texture) { m_visualizer.releaseTexture(texture); });
    m_pipeline.setZoomLevelCallback(
        [](const core::ZoomBand& band)
        {
            Logger::log(Logger::Level::Info,
                        "Zoom level " + std::to_string(band.index) + " at distance " + std::to_string(band.distance) +
                            (band.near ? " (near)" : ""));
        });
    m_visualizer.setPickCallback([this](const glm::vec3& worldPoint, float tolerance)
                                 { handlePick(worldPoint, tolerance); });

    const bool visualizerReady = m_visualizer.initialize();
    Logger::log(visualizerReady ? Logger::Level::Info : Logger::Level::Error,
                visualizerReady ? "Visualizer initialized" : "Visualizer failed to initialize");
    m_initialized = visualizerReady;
    m_startTime = std::chrono::steady_clock::now();
    return visualizerReady;
}

void GlobeEngine::run()
{
    if (!m_initialized && !initialize())
    {
        return;
    }

    while (!m_visualizer.windowShouldClose())
    {
        const auto frameStart = std::chrono::steady_clock::now();

        pollSource();
        const double time_s = std::chrono::duration<double>(frameStart - m_startTime).count();
        const core::FrameOutput& frame = m_pipeline.update(m_visualizer.cameraDistance(), time_s);
        presentFrame(frame);
        m_visualizer.render();
        ++m_frameCount;

        const auto frameDuration = std::chrono::steady_clock::now() - frameStart;
        if (frameDuration < kTargetFrameDuration)
        {
            std::this_thread::sleep_for(kTargetFrameDuration - frameDuration);
        }
    }

    Logger::log(Logger::Level::Info, "Globe engine stopped after " + std::to_string(m_frameCount) + " frames");
}

const core::VisualizationPipeline& GlobeEngine::pipeline() const noexcept
{
    return m_pipeline;
}

std::size_t GlobeEngine::frameCount() const noexcept
{
    return m_frameCount;
}

void GlobeEngine::pollSource()
{
    utility::ThreatRecords records;
    if (m_source->poll(records))
    {
        m_pipeline.setRecords(records);
    }
}

void GlobeEngine::presentFrame(const core::FrameOutput& frame)
{
    m_visualizer.updateHeatmap(frame.heatmap, frame.heatOpacity);
    m_visualizer.updateClusters(frame.clusters, frame.clustersRecomputed, frame.clusterOpacity);

    visualization::GlobeVisualizer::Status status;
    status.mode = frame.mode;
    status.progress = frame.progress;
    status.zoomLevel = frame.band.distance;
    status.nearBand = frame.band.near;
    status.recordCount = m_pipeline.records().size();
    status.cache = m_pipeline.textureCacheStats();
    m_visualizer.updateStatus(status);
}

void GlobeEngine::handlePick(const glm::vec3& worldPoint, float tolerance)
{
    const core::FrameOutput& frame = m_pipeline.output();
    if (frame.clusterOpacity <= m_pipeline.settings().pipeline.opacityEpsilon)
    {
        return;
    }

    const auto result = core::ClusterPicker::pick(frame.clusters, m_pipeline.records(), worldPoint, tolerance);
    if (!result)
    {
        return;
    }

    const std::string title = result->cluster->isSingleton()
                                  ? result->cluster->id
                                  : result->cluster->id + " (" + std::to_string(result->members.size()) + " threats)";
    Logger::log(Logger::Level::Info, "Selected " + title);
    m_visualizer.updateSelection(title, result->members);
}

} // namespace globe
