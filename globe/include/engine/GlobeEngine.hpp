#pragma once

#include "globe_core/visualization_pipeline.hpp"
#include "sources/BaseThreatSource.hpp"
#include "visualization/GlobeVisualizer.hpp"

#include <glm/glm.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

namespace globe
{

class GlobeEngine
{
public:
    explicit GlobeEngine(std::unique_ptr<BaseThreatSource> source, core::VisualizationSettings settings = {});
    ~GlobeEngine();

    bool initialize();
    void run();

    const core::VisualizationPipeline& pipeline() const noexcept;
    std::size_t frameCount() const noexcept;

private:
    void pollSource();
    void presentFrame(const core::FrameOutput& frame);
    void handlePick(const glm::vec3& worldPoint, float tolerance);

    static constexpr std::chrono::milliseconds kTargetFrameDuration{16};

    std::unique_ptr<BaseThreatSource> m_source;
    // Outlives the pipeline, whose eviction callback refers to it.
    visualization::GlobeVisualizer m_visualizer;
    core::VisualizationPipeline m_pipeline;
    std::chrono::steady_clock::time_point m_startTime;
    std::size_t m_frameCount = 0U;
    bool m_initialized = false;
};

} // namespace globe
