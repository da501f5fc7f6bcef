#include "visualization/GlobeVisualizer.hpp"

#include "logging/Logger.hpp"
#include "utility/geo_projection.hpp"

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

namespace visualization
{

namespace
{
constexpr const char* kGlobeVertexShaderPath = "shaders/globe.vs";
constexpr const char* kGlobeFragmentShaderPath = "shaders/globe.fs";
constexpr const char* kMarkerVertexShaderPath = "shaders/marker.vs";
constexpr const char* kMarkerFragmentShaderPath = "shaders/marker.fs";
constexpr int kSphereStacks = 64;
constexpr int kSphereSlices = 128;
constexpr float kHeatShellRadius = 2.01F;
constexpr float kMinCameraDistance = 4.0F;
constexpr float kMaxCameraDistance = 25.0F;
constexpr float kScrollStep = 0.75F;
constexpr double kClickSlopPixels = 4.0;
constexpr float kPickBaseTolerance = 0.04F;
constexpr float kPickTolerancePerDistance = 0.006F;
} // namespace

GlobeVisualizer::~GlobeVisualizer()
{
    cleanup();
}

bool GlobeVisualizer::initialize()
{
    if (!glfwInit())
    {
        globe::Logger::log(globe::Logger::Level::Error, "Failed to initialize GLFW");
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    m_window = glfwCreateWindow(1280, 720, "ThreatGlobe", nullptr, nullptr);
    if (!m_window)
    {
        globe::Logger::log(globe::Logger::Level::Error, "Failed to create GLFW window");
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSwapInterval(1);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetCursorPosCallback(m_window, GlobeVisualizer::cursorPosCallback);
    glfwSetScrollCallback(m_window, GlobeVisualizer::scrollCallback);
    glfwSetMouseButtonCallback(m_window, GlobeVisualizer::mouseButtonCallback);

    glewExperimental = GL_TRUE;
    if (glewInit() != GLEW_OK)
    {
        globe::Logger::log(globe::Logger::Level::Error, "Failed to initialize GLEW");
        return false;
    }

    glEnable(GL_PROGRAM_POINT_SIZE);
    glEnable(GL_BLEND);
    glEnable(GL_DEPTH_TEST);

    if (!m_globeShader.load(kGlobeVertexShaderPath, kGlobeFragmentShaderPath) ||
        !m_markerShader.load(kMarkerVertexShaderPath, kMarkerFragmentShaderPath))
    {
        globe::Logger::log(globe::Logger::Level::Error, "Failed to load globe shaders");
        return false;
    }

    buildSphereMesh();

    glGenVertexArrays(1, &m_sphereVao);
    glGenBuffers(1, &m_sphereVbo);
    glGenBuffers(1, &m_sphereEbo);
    glBindVertexArray(m_sphereVao);
    glBindBuffer(GL_ARRAY_BUFFER, m_sphereVbo);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(m_sphereVertices.size() * sizeof(GlobeVertex)),
                 m_sphereVertices.data(),
                 GL_STATIC_DRAW);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_sphereEbo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(m_sphereIndices.size() * sizeof(unsigned int)),
                 m_sphereIndices.data(),
                 GL_STATIC_DRAW);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(GlobeVertex), reinterpret_cast<void*>(offsetof(GlobeVertex, position)));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(GlobeVertex), reinterpret_cast<void*>(offsetof(GlobeVertex, uv)));
    glBindVertexArray(0);
    m_sphereIndexCount = static_cast<GLsizei>(m_sphereIndices.size());

    glGenVertexArrays(1, &m_markerVao);
    glGenBuffers(1, &m_markerVbo);
    glBindVertexArray(m_markerVao);
    glBindBuffer(GL_ARRAY_BUFFER, m_markerVbo);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(MarkerVertex), reinterpret_cast<void*>(offsetof(MarkerVertex, position)));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(MarkerVertex), reinterpret_cast<void*>(offsetof(MarkerVertex, fill)));
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(2, 3, GL_FLOAT, GL_FALSE, sizeof(MarkerVertex), reinterpret_cast<void*>(offsetof(MarkerVertex, glow)));
    glEnableVertexAttribArray(3);
    glVertexAttribPointer(3, 1, GL_FLOAT, GL_FALSE, sizeof(MarkerVertex), reinterpret_cast<void*>(offsetof(MarkerVertex, size)));
    glBindVertexArray(0);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    static std::string iniPath;
    const std::filesystem::path visualizationIni = std::filesystem::path("visualization") / "imgui.ini";
    iniPath = std::filesystem::exists(visualizationIni) ? visualizationIni.string() : std::string("imgui.ini");
    io.IniFilename = iniPath.c_str();
    ImGui_ImplGlfw_InitForOpenGL(m_window, true);
    ImGui_ImplOpenGL3_Init("#version 330 core");

    return true;
}

void GlobeVisualizer::cleanup()
{
    if (!m_window)
    {
        return;
    }

    for (auto& entry : m_textures)
    {
        glDeleteTextures(1, &entry.second);
    }
    m_textures.clear();

    if (m_markerVbo != 0)
    {
        glDeleteBuffers(1, &m_markerVbo);
        m_markerVbo = 0;
    }
    if (m_sphereVbo != 0)
    {
        glDeleteBuffers(1, &m_sphereVbo);
        m_sphereVbo = 0;
    }
    if (m_sphereEbo != 0)
    {
        glDeleteBuffers(1, &m_sphereEbo);
        m_sphereEbo = 0;
    }
    if (m_markerVao != 0)
    {
        glDeleteVertexArrays(1, &m_markerVao);
        m_markerVao = 0;
    }
    if (m_sphereVao != 0)
    {
        glDeleteVertexArrays(1, &m_sphereVao);
        m_sphereVao = 0;
    }
    m_globeShader.release();
    m_markerShader.release();

    if (ImGui::GetCurrentContext() != nullptr)
    {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::SaveIniSettingsToDisk(ImGui::GetIO().IniFilename);
        ImGui::DestroyContext();
    }
    glfwDestroyWindow(m_window);
    glfwTerminate();
    m_window = nullptr;
}

void GlobeVisualizer::buildSphereMesh()
{
    m_sphereVertices.clear();
    m_sphereIndices.clear();
    m_sphereVertices.reserve(static_cast<std::size_t>((kSphereStacks + 1) * (kSphereSlices + 1)));
    for (int stack = 0; stack <= kSphereStacks; ++stack)
    {
        const double latitude = 90.0 - 180.0 * static_cast<double>(stack) / kSphereStacks;
        for (int slice = 0; slice <= kSphereSlices; ++slice)
        {
            const double longitude = -180.0 + 360.0 * static_cast<double>(slice) / kSphereSlices;
            GlobeVertex vertex{};
            vertex.position = utility::latLonToSphere(latitude, longitude, 1.0F);
            vertex.uv = utility::latLonToEquirect(latitude, longitude);
            m_sphereVertices.push_back(vertex);
        }
    }

    const unsigned int rowLength = static_cast<unsigned int>(kSphereSlices + 1);
    for (int stack = 0; stack < kSphereStacks; ++stack)
    {
        for (int slice = 0; slice < kSphereSlices; ++slice)
        {
            const unsigned int a = static_cast<unsigned int>(stack) * rowLength + static_cast<unsigned int>(slice);
            const unsigned int b = a + rowLength;
            m_sphereIndices.insert(m_sphereIndices.end(), {a, b, a + 1U, a + 1U, b, b + 1U});
        }
    }
}

void GlobeVisualizer::updateHeatmap(const globe::core::HeatmapTextureHandle& texture, float opacity)
{
    m_heatmap = texture;
    m_heatOpacity = opacity;
}

void GlobeVisualizer::updateClusters(const std::vector<utility::Cluster>& clusters, bool changed, float opacity)
{
    m_clusterOpacity = opacity;
    if (!changed)
    {
        return;
    }

    m_markerVertices.clear();
    m_markerVertices.reserve(clusters.size());
    for (const auto& cluster : clusters)
    {
        MarkerVertex vertex{};
        vertex.position = cluster.position;
        vertex.fill = cluster.colors.fill;
        vertex.glow = cluster.colors.glow;
        vertex.size = utility::markerRadius(cluster);
        m_markerVertices.push_back(vertex);
    }
    m_clusterCount = clusters.size();
    m_markersDirty = true;
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
    const auto it = m_textures.find(&texture);
    if (it == m_textures.end())
    {
        return;
    }
    if (m_window)
    {
        glDeleteTextures(1, &it->second);
    }
    m_textures.erase(it);
}

void GlobeVisualizer::setPickCallback(PickCallback callback)
{
    m_pickCallback = std::move(callback);
}

GLuint GlobeVisualizer::textureFor(const globe::core::HeatmapTexture& texture)
{
    const auto it = m_textures.find(&texture);
    if (it != m_textures.end())
    {
        return it->second;
    }
    if (texture.released())
    {
        return 0;
    }

    GLuint id = 0;
    glGenTextures(1, &id);
    glBindTexture(GL_TEXTURE_2D, id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D,
                 0,
                 GL_RGBA8,
                 texture.width(),
                 texture.height(),
                 0,
                 GL_RGBA,
                 GL_UNSIGNED_BYTE,
                 texture.pixels().data());
    glBindTexture(GL_TEXTURE_2D, 0);
    m_textures.emplace(&texture, id);
    return id;
}

void GlobeVisualizer::uploadMarkerBuffer()
{
    if (!m_markersDirty)
    {
        return;
    }
    glBindBuffer(GL_ARRAY_BUFFER, m_markerVbo);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(m_markerVertices.size() * sizeof(MarkerVertex)),
                 m_markerVertices.data(),
                 GL_DYNAMIC_DRAW);
    m_markersDirty = false;
}

glm::vec3 GlobeVisualizer::computeCameraPosition() const
{
    const float yaw = glm::radians(m_camera.yaw);
    const float pitch = glm::radians(m_camera.pitch);
    const glm::vec3 direction(std::cos(pitch) * std::sin(yaw), std::sin(pitch), std::cos(pitch) * std::cos(yaw));
    return direction * m_camera.distance;
}

glm::mat4 GlobeVisualizer::computeViewProjection() const
{
    int width = 1280;
    int height = 720;
    if (m_window)
    {
        glfwGetFramebufferSize(m_window, &width, &height);
    }

    const float aspect = width > 0 && height > 0 ? static_cast<float>(width) / height : 1.0F;
    const glm::mat4 projection = glm::perspective(glm::radians(m_camera.fov), aspect, 0.05F, 100.0F);
    const glm::mat4 view = glm::lookAt(computeCameraPosition(), glm::vec3(0.0F), glm::vec3(0.0F, 1.0F, 0.0F));
    return projection * view;
}

bool GlobeVisualizer::pickShellPoint(double xpos, double ypos, glm::vec3& hit) const
{
    int width = 0;
    int height = 0;
    glfwGetWindowSize(m_window, &width, &height);
    if (width <= 0 || height <= 0)
    {
        return false;
    }

    const float ndcX = static_cast<float>(2.0 * xpos / width - 1.0);
    const float ndcY = static_cast<float>(1.0 - 2.0 * ypos / height);
    const glm::mat4 inverse = glm::inverse(computeViewProjection());
    glm::vec4 nearPoint = inverse * glm::vec4(ndcX, ndcY, -1.0F, 1.0F);
    glm::vec4 farPoint = inverse * glm::vec4(ndcX, ndcY, 1.0F, 1.0F);
    nearPoint /= nearPoint.w;
    farPoint /= farPoint.w;

    const glm::vec3 origin(nearPoint);
    const glm::vec3 direction = glm::normalize(glm::vec3(farPoint) - origin);
    const float radius = utility::kMarkerShellRadius;
    const float b = glm::dot(origin, direction);
    const float c = glm::dot(origin, origin) - radius * radius;
    const float discriminant = b * b - c;
    if (discriminant < 0.0F)
    {
        return false;
    }

    const float t = -b - std::sqrt(discriminant);
    if (t < 0.0F)
    {
        return false;
    }
    hit = origin + direction * t;
    return true;
}

void GlobeVisualizer::processCursorPos(double xpos, double ypos)
{
    if (!m_camera.rotating || m_activeMouseButton == -1)
    {
        m_camera.lastX = xpos;
        m_camera.lastY = ypos;
        return;
    }

    const float dx = static_cast<float>(xpos - m_camera.lastX);
    const float dy = static_cast<float>(ypos - m_camera.lastY);
    m_camera.lastX = xpos;
    m_camera.lastY = ypos;
    if (std::abs(xpos - m_camera.pressX) > kClickSlopPixels || std::abs(ypos - m_camera.pressY) > kClickSlopPixels)
    {
        m_camera.dragged = true;
    }

    // Rotation rate scales with distance.
    const float rate = 0.05F * m_camera.distance;
    m_camera.yaw -= dx * rate;
    m_camera.pitch = std::clamp(m_camera.pitch + dy * rate, -85.0F, 85.0F);
}

void GlobeVisualizer::processScroll(double yoffset)
{
    m_camera.distance = std::clamp(m_camera.distance - static_cast<float>(yoffset) * kScrollStep,
                                   kMinCameraDistance,
                                   kMaxCameraDistance);
}

void GlobeVisualizer::processMouseButton(int button, int action)
{
    if (ImGui::GetCurrentContext() != nullptr && ImGui::GetIO().WantCaptureMouse)
    {
        return;
    }

    if (action == GLFW_PRESS && button == GLFW_MOUSE_BUTTON_LEFT)
    {
        m_activeMouseButton = button;
        m_camera.rotating = true;
        m_camera.dragged = false;
        glfwGetCursorPos(m_window, &m_camera.lastX, &m_camera.lastY);
        m_camera.pressX = m_camera.lastX;
        m_camera.pressY = m_camera.lastY;
        return;
    }

    if (action == GLFW_RELEASE && button == m_activeMouseButton)
    {
        const bool click = !m_camera.dragged;
        m_activeMouseButton = -1;
        m_camera.rotating = false;

        glm::vec3 hit(0.0F);
        if (click && m_pickCallback && pickShellPoint(m_camera.lastX, m_camera.lastY, hit))
        {
            m_pickCallback(hit, kPickBaseTolerance + kPickTolerancePerDistance * m_camera.distance);
        }
    }
}

void GlobeVisualizer::cursorPosCallback(GLFWwindow* window, double xpos, double ypos)
{
    if (auto* self = reinterpret_cast<GlobeVisualizer*>(glfwGetWindowUserPointer(window)))
    {
        self->processCursorPos(xpos, ypos);
    }
}

void GlobeVisualizer::scrollCallback(GLFWwindow* window, double /*xoffset*/, double yoffset)
{
    if (ImGui::GetCurrentContext() != nullptr && ImGui::GetIO().WantCaptureMouse)
    {
        return;
    }
    if (auto* self = reinterpret_cast<GlobeVisualizer*>(glfwGetWindowUserPointer(window)))
    {
        self->processScroll(yoffset);
    }
}

void GlobeVisualizer::mouseButtonCallback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    if (auto* self = reinterpret_cast<GlobeVisualizer*>(glfwGetWindowUserPointer(window)))
    {
        self->processMouseButton(button, action);
    }
}

void GlobeVisualizer::drawUI()
{
    ImGui::SetNextWindowPos(ImVec2(10.0F, 10.0F), ImGuiCond_FirstUseEver);
    ImGui::Begin("Threat globe");

    ImGui::Text("Mode: %s", globe::core::visualizationModeName(m_status.mode));
    ImGui::ProgressBar(m_status.progress, ImVec2(-1.0F, 0.0F), "transition");
    ImGui::Text("Heat opacity: %.2f  Marker opacity: %.2f", m_heatOpacity, m_clusterOpacity);
    ImGui::Text("Zoom level: %.1f%s", m_status.zoomLevel, m_status.nearBand ? " (near)" : "");
    ImGui::SliderFloat("Distance", &m_camera.distance, kMinCameraDistance, kMaxCameraDistance, "%.2f");

    ImGui::Separator();
    ImGui::Text("Records: %zu", m_status.recordCount);
    ImGui::Text("Clusters: %zu", m_clusterCount);
    ImGui::Text("Texture cache: %zu / %zu", m_status.cache.size, m_status.cache.capacity);
    ImGui::Text("Hits: %zu  Misses: %zu  Evictions: %zu", m_status.cache.hits, m_status.cache.misses, m_status.cache.evictions);
    ImGui::Text("Rasters painted: %zu  On GPU: %zu", m_status.cache.paints, m_textures.size());

    if (ImGui::CollapsingHeader("Display", ImGuiTreeNodeFlags_DefaultOpen))
    {
        ImGui::Checkbox("Heat layer", &m_showHeatLayer);
        ImGui::Checkbox("Markers", &m_showMarkers);
        ImGui::SliderFloat("Heat intensity", &m_heatIntensity, 0.2F, 3.0F, "%.2f");
        ImGui::SliderFloat("Halo scale", &m_haloScale, 1.0F, 6.0F, "%.1f");
        ImGui::ColorEdit3("Ocean", &m_oceanColor.x);
    }

    if (!m_selection.empty() && ImGui::CollapsingHeader("Selection", ImGuiTreeNodeFlags_DefaultOpen))
    {
        ImGui::TextUnformatted(m_selectionTitle.c_str());
        for (const auto& record : m_selection)
        {
            const glm::vec3 glow = utility::threatColors(record.category, static_cast<float>(record.severity)).glow;
            ImGui::TextColored(ImVec4(glow.r, glow.g, glow.b, 1.0F),
                               "%s  %s  sev %d  (%.2f, %.2f)",
                               record.id.c_str(),
                               utility::threatCategoryName(record.category),
                               record.severity,
                               record.latitude,
                               record.longitude);
        }
        if (ImGui::Button("Clear selection"))
        {
            m_selection.clear();
            m_selectionTitle.clear();
        }
    }

    ImGui::End();
}

void GlobeVisualizer::drawGlobe(const glm::mat4& viewProjection)
{
    m_globeShader.use();
    glUniformMatrix4fv(m_globeShader.uniformLocation("uViewProjection"), 1, GL_FALSE, glm::value_ptr(viewProjection));
    glUniform1f(m_globeShader.uniformLocation("uRadius"), utility::kGlobeRadius);
    glUniform1i(m_globeShader.uniformLocation("uUseTexture"), 0);
    glUniform3f(m_globeShader.uniformLocation("uBaseColor"), m_oceanColor.r, m_oceanColor.g, m_oceanColor.b);
    glUniform1f(m_globeShader.uniformLocation("uOpacity"), 1.0F);

    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glDepthMask(GL_TRUE);
    glBindVertexArray(m_sphereVao);
    glDrawElements(GL_TRIANGLES, m_sphereIndexCount, GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
}

void GlobeVisualizer::drawHeatLayer(const glm::mat4& viewProjection)
{
    const GLuint texture = textureFor(*m_heatmap);
    if (texture == 0)
    {
        return;
    }

    m_globeShader.use();
    glUniformMatrix4fv(m_globeShader.uniformLocation("uViewProjection"), 1, GL_FALSE, glm::value_ptr(viewProjection));
    glUniform1f(m_globeShader.uniformLocation("uRadius"), kHeatShellRadius);
    glUniform1i(m_globeShader.uniformLocation("uUseTexture"), 1);
    glUniform1i(m_globeShader.uniformLocation("uHeatmap"), 0);
    glUniform1f(m_globeShader.uniformLocation("uOpacity"), m_heatOpacity * m_heatIntensity);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texture);
    glBlendFunc(GL_ONE, GL_ONE);
    glDepthMask(GL_FALSE);
    glBindVertexArray(m_sphereVao);
    glDrawElements(GL_TRIANGLES, m_sphereIndexCount, GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
    glDepthMask(GL_TRUE);
    glBindTexture(GL_TEXTURE_2D, 0);
}

void GlobeVisualizer::drawMarkers(const glm::mat4& viewProjection)
{
    uploadMarkerBuffer();

    int height = 720;
    int width = 1280;
    glfwGetFramebufferSize(m_window, &width, &height);
    const float projectionScale = static_cast<float>(height) / std::tan(glm::radians(m_camera.fov) * 0.5F);

    m_markerShader.use();
    glUniformMatrix4fv(m_markerShader.uniformLocation("uViewProjection"), 1, GL_FALSE, glm::value_ptr(viewProjection));
    glUniform1f(m_markerShader.uniformLocation("uProjectionScale"), projectionScale * m_haloScale);
    glUniform1f(m_markerShader.uniformLocation("uHaloScale"), m_haloScale);
    glUniform1f(m_markerShader.uniformLocation("uOpacity"), m_clusterOpacity);

    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glDepthMask(GL_FALSE);
    glBindVertexArray(m_markerVao);
    glDrawArrays(GL_POINTS, 0, static_cast<GLsizei>(m_markerVertices.size()));
    glBindVertexArray(0);
    glDepthMask(GL_TRUE);
}

void GlobeVisualizer::render()
{
    if (!m_window)
    {
        return;
    }

    glfwPollEvents();
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
    drawUI();

    int width = 1280;
    int height = 720;
    glfwGetFramebufferSize(m_window, &width, &height);
    glViewport(0, 0, width, height);
    glClearColor(0.01F, 0.01F, 0.03F, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    const glm::mat4 vp = computeViewProjection();
    drawGlobe(vp);

    if (m_showHeatLayer && m_heatmap && m_heatOpacity > 0.0F)
    {
        drawHeatLayer(vp);
    }

    if (m_showMarkers && !m_markerVertices.empty() && m_clusterOpacity > 0.0F)
    {
        drawMarkers(vp);
    }

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    glfwSwapBuffers(m_window);
}

bool GlobeVisualizer::windowShouldClose() const
{
    return !m_window || glfwWindowShouldClose(m_window);
}

float GlobeVisualizer::cameraDistance() const
{
    return m_camera.distance;
}

} // namespace visualization
