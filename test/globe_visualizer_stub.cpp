#include "visualization/GlobeVisualizer.hpp"

#include <unordered_map>
#include <utility>

namespace visualization
{
namespace
{
std::unordered_map<const GlobeVisualizer*, int> g_renderCounts;
constexpr int kCloseAfterFrames = 1;
} // namespace

GlobeVisualizer::~GlobeVisualizer()
{
    g_renderCounts.erase(this);
}

bool GlobeVisualizer::initialize()
{
    g_renderCounts[this] = 0;
    return true;
}

void GlobeVisualizer::updateHeatmap(const globe::core::HeatmapTextureHandle& texture, float opacity)
{
    m_heatmap = texture;
    m_heatOpacity = opacity;
}

void GlobeVisualizer::updateClusters(const std::vector<utility::Cluster>& clusters, bool changed, float opacity)
{
    m_clusterOpacity = opacity;
    if (changed)
    {
        m_clusterCount = clusters.size();
    }
}

void GlobeVisualizer::updateStatus(const Status& status)
{
    m_status = status;
}

void GlobeVisualizer::updateSelection(const std::string& title, const utility::ThreatRecords& members)
{
    m_selectionTitle = title;
    m_selection = members;
}

void GlobeVisualizer::releaseTexture(const globe::core::HeatmapTexture& texture)
{
    m_textures.erase(&texture);
}

void GlobeVisualizer::setPickCallback(PickCallback callback)
{
    m_pickCallback = std::move(callback);
}

void GlobeVisualizer::render()
{
    auto& count = g_renderCounts[this];
    ++count;
}

bool GlobeVisualizer::windowShouldClose() const
{
    auto it = g_renderCounts.find(this);
    if (it == g_renderCounts.end())
    {
        return false;
    }
    return it->second >= kCloseAfterFrames;
}

float GlobeVisualizer::cameraDistance() const
{
    return m_camera.distance;
}

} // namespace visualization
