#pragma once

#include "visualization/Shader.hpp"

#include "globe_core/heatmap_synthesizer.hpp"
#include "globe_core/visualization_pipeline.hpp"
#include "utility/threat_types.hpp"

#include <GL/glew.h>
#include <glm/glm.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct GLFWwindow;

namespace visualization
{

class GlobeVisualizer
{
public:
    // Receives the marker-shell point under a left click.
    using PickCallback = std::function<void(const glm::vec3& worldPoint, float tolerance)>;

    struct Status
    {
        globe::core::VisualizationMode mode = globe::core::VisualizationMode::Heatmap;
        float progress = 0.0F;
        float zoomLevel = 0.0F;
        bool nearBand = false;
        std::size_t recordCount = 0U;
        globe::core::TextureCacheStats cache;
    };

    GlobeVisualizer() = default;
    ~GlobeVisualizer();

    bool initialize();
    void updateHeatmap(const globe::core::HeatmapTextureHandle& texture, float opacity);
    void updateClusters(const std::vector<utility::Cluster>& clusters, bool changed, float opacity);
    void updateStatus(const Status& status);
    void updateSelection(const std::string& title, const utility::ThreatRecords& members);
    // Deletes the GPU copy of a raster the texture cache is evicting.
    void releaseTexture(const globe::core::HeatmapTexture& texture);
    void setPickCallback(PickCallback callback);
    void render();
    bool windowShouldClose() const;
    float cameraDistance() const;

private:
    struct GlobeVertex
    {
        glm::vec3 position;
        glm::vec2 uv;
    };

    struct MarkerVertex
    {
        glm::vec3 position;
        glm::vec3 fill;
        glm::vec3 glow;
        float size;
    };

    struct Camera
    {
        float distance = 25.0F;
        float yaw = 0.0F;
        float pitch = 15.0F;
        float fov = 45.0F;
        bool rotating = false;
        bool dragged = false;
        double lastX = 0.0;
        double lastY = 0.0;
        double pressX = 0.0;
        double pressY = 0.0;
    };

    void cleanup();
    void buildSphereMesh();
    void uploadMarkerBuffer();
    GLuint textureFor(const globe::core::HeatmapTexture& texture);
    glm::mat4 computeViewProjection() const;
    glm::vec3 computeCameraPosition() const;
    bool pickShellPoint(double xpos, double ypos, glm::vec3& hit) const;
    void processCursorPos(double xpos, double ypos);
    void processScroll(double yoffset);
    void processMouseButton(int button, int action);
    static void cursorPosCallback(GLFWwindow* window, double xpos, double ypos);
    static void scrollCallback(GLFWwindow* window, double xoffset, double yoffset);
    static void mouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    void drawUI();
    void drawGlobe(const glm::mat4& viewProjection);
    void drawHeatLayer(const glm::mat4& viewProjection);
    void drawMarkers(const glm::mat4& viewProjection);

    GLFWwindow* m_window = nullptr;
    GLuint m_sphereVao = 0;
    GLuint m_sphereVbo = 0;
    GLuint m_sphereEbo = 0;
    GLuint m_markerVao = 0;
    GLuint m_markerVbo = 0;
    GLsizei m_sphereIndexCount = 0;
    Shader m_globeShader;
    Shader m_markerShader;

    std::vector<GlobeVertex> m_sphereVertices;
    std::vector<unsigned int> m_sphereIndices;
    std::vector<MarkerVertex> m_markerVertices;
    bool m_markersDirty = false;

    std::unordered_map<const globe::core::HeatmapTexture*, GLuint> m_textures;
    globe::core::HeatmapTextureHandle m_heatmap;
    float m_heatOpacity = 1.0F;
    float m_clusterOpacity = 0.0F;
    std::size_t m_clusterCount = 0U;

    Status m_status;
    std::string m_selectionTitle;
    utility::ThreatRecords m_selection;
    PickCallback m_pickCallback;

    bool m_showHeatLayer = true;
    bool m_showMarkers = true;
    float m_haloScale = 3.0F;
    float m_heatIntensity = 1.0F;
    glm::vec3 m_oceanColor = glm::vec3(0.04F, 0.09F, 0.18F);
    Camera m_camera;
    int m_activeMouseButton = -1;
};

} // namespace visualization
