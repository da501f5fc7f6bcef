#pragma once

#include <functional>
#include <optional>

#include "globe_core/processing_common.hpp"

namespace globe::core
{

// Eased blend that runs while the displayed progress catches up after a mode
// change.
struct TransitionAnimation
{
    double startTime_s = 0.0;
    float duration_s = 0.0f;
    float fromProgress = 0.0f;
};

struct ZoomState
{
    float distance = 0.0f;
    VisualizationMode mode = VisualizationMode::Heatmap;
    float progress = 0.0f;
    float rawProgress = 0.0f;
    ZoomBand band;
    std::optional<TransitionAnimation> animation;
};

class ZoomStateMachine
{
public:
    using ModeCallback = std::function<void(VisualizationMode mode, float progress)>;
    using ZoomLevelCallback = std::function<void(const ZoomBand& band)>;

    explicit ZoomStateMachine(ZoomSettings settings = {}, float nearBandDistance = 10.0f);

    // Advances the state for one frame. The first call initializes without
    // animating. The mode follows the displayed progress against a single
    // midpoint and is not re-derived while a transition runs. Non-finite
    // distances reuse the last valid distance.
    const ZoomState& update(float distance, double time_s);

    const ZoomState& state() const noexcept;
    bool initialized() const noexcept;

    // Smootherstep of the distance between farBound (0) and nearBound (1).
    float rawProgress(float distance) const;

    // Nearest configured zoom level to the distance.
    ZoomBand bandFor(float distance) const;

    void setModeCallback(ModeCallback callback);
    void setZoomLevelCallback(ZoomLevelCallback callback);

    void applySettings(const ZoomSettings& settings, float nearBandDistance);
    const ZoomSettings& settings() const noexcept;

private:
    float sanitizeDistance(float distance);
    VisualizationMode modeFor(float progress) const;
    float animatedProgress(double time_s);
    void notify(bool modeChanged, bool bandChanged);

    ZoomSettings m_settings;
    float m_nearBandDistance;
    ZoomState m_state;
    bool m_initialized = false;
    std::optional<float> m_lastValidDistance;
    float m_lastNotifiedProgress = 0.0f;
    ModeCallback m_onModeChange;
    ZoomLevelCallback m_onZoomLevelChange;
};

} // namespace globe::core
