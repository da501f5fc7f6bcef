#include "globe_core/zoom_state_machine.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <utility>

#include "logging/Logger.hpp"
#include "utility/math_utils.hpp"

namespace globe::core
{

const char* visualizationModeName(VisualizationMode mode)
{
    switch (mode)
    {
    case VisualizationMode::Heatmap:
        return "heatmap";
    case VisualizationMode::Pixels:
        return "pixels";
    }
    return "unknown";
}

ZoomStateMachine::ZoomStateMachine(ZoomSettings settings, float nearBandDistance)
    : m_settings(std::move(settings))
    , m_nearBandDistance(nearBandDistance)
{
}

const ZoomState& ZoomStateMachine::update(float distance, double time_s)
{
    const float clamped = sanitizeDistance(distance);
    const float raw = rawProgress(clamped);
    const ZoomBand band = bandFor(clamped);

    m_state.distance = clamped;
    m_state.rawProgress = raw;

    if (!m_initialized)
    {
        m_initialized = true;
        m_state.mode = modeFor(raw);
        m_state.progress = raw;
        m_state.band = band;
        m_state.animation.reset();
        Logger::log(Logger::Level::Info,
                    std::string("Zoom state initialized in ") + visualizationModeName(m_state.mode) + " mode at distance " +
                        std::to_string(clamped));
        notify(true, true);
        return m_state;
    }

    const float previousProgress = m_state.progress;
    m_state.progress = animatedProgress(time_s);

    // The mode is held while a transition is still easing in.
    bool modeChanged = false;
    if (!m_state.animation)
    {
        const VisualizationMode mode = modeFor(m_state.progress);
        if (mode != m_state.mode)
        {
            m_state.animation = TransitionAnimation{time_s, m_settings.transitionDuration_s, previousProgress};
            m_state.mode = mode;
            m_state.progress = animatedProgress(time_s);
            modeChanged = true;
            Logger::log(Logger::Level::Info,
                        std::string("Visualization mode changed to ") + visualizationModeName(mode) + " at distance " +
                            std::to_string(clamped));
        }
    }

    const bool bandChanged = band != m_state.band;
    m_state.band = band;
    notify(modeChanged, bandChanged);
    return m_state;
}

const ZoomState& ZoomStateMachine::state() const noexcept
{
    return m_state;
}

bool ZoomStateMachine::initialized() const noexcept
{
    return m_initialized;
}

float ZoomStateMachine::rawProgress(float distance) const
{
    const float farBound = m_settings.farBound;
    const float nearBound = m_settings.nearBound;
    if (distance >= farBound)
    {
        return 0.0f;
    }
    if (distance <= nearBound)
    {
        return 1.0f;
    }
    if (!(farBound > nearBound))
    {
        return 0.0f;
    }
    return utility::smootherstep((farBound - distance) / (farBound - nearBound));
}

ZoomBand ZoomStateMachine::bandFor(float distance) const
{
    ZoomBand band;
    band.distance = distance;
    float bestGap = std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < m_settings.levels.size(); ++i)
    {
        const float gap = std::fabs(m_settings.levels[i] - distance);
        if (gap < bestGap)
        {
            bestGap = gap;
            band.index = i;
            band.distance = m_settings.levels[i];
        }
    }
    band.near = band.distance <= m_nearBandDistance;
    return band;
}

void ZoomStateMachine::setModeCallback(ModeCallback callback)
{
    m_onModeChange = std::move(callback);
}

void ZoomStateMachine::setZoomLevelCallback(ZoomLevelCallback callback)
{
    m_onZoomLevelChange = std::move(callback);
}

void ZoomStateMachine::applySettings(const ZoomSettings& settings, float nearBandDistance)
{
    m_settings = settings;
    m_nearBandDistance = nearBandDistance;
}

const ZoomSettings& ZoomStateMachine::settings() const noexcept
{
    return m_settings;
}

float ZoomStateMachine::sanitizeDistance(float distance)
{
    if (std::isfinite(distance))
    {
        m_lastValidDistance = distance;
    }
    else if (!m_lastValidDistance)
    {
        Logger::log(Logger::Level::Warning, "Non-finite camera distance with no prior value, using max distance");
        m_lastValidDistance = m_settings.maxDistance;
    }
    return utility::clamp(*m_lastValidDistance, m_settings.minDistance, m_settings.maxDistance);
}

VisualizationMode ZoomStateMachine::modeFor(float progress) const
{
    return progress < m_settings.modeMidpoint ? VisualizationMode::Heatmap : VisualizationMode::Pixels;
}

float ZoomStateMachine::animatedProgress(double time_s)
{
    if (!m_state.animation)
    {
        return m_state.rawProgress;
    }

    const TransitionAnimation& animation = *m_state.animation;
    float t = 1.0f;
    if (animation.duration_s > 0.0f)
    {
        t = static_cast<float>((time_s - animation.startTime_s) / static_cast<double>(animation.duration_s));
    }
    if (t >= 1.0f)
    {
        m_state.animation.reset();
        return m_state.rawProgress;
    }

    const float eased = utility::easeInOutCubic(t);
    return utility::clamp(utility::lerp(animation.fromProgress, m_state.rawProgress, eased), 0.0f, 1.0f);
}

void ZoomStateMachine::notify(bool modeChanged, bool bandChanged)
{
    const bool progressMoved =
        std::fabs(m_state.progress - m_lastNotifiedProgress) > m_settings.progressEventThreshold;
    if (modeChanged || progressMoved)
    {
        m_lastNotifiedProgress = m_state.progress;
        if (m_onModeChange)
        {
            m_onModeChange(m_state.mode, m_state.progress);
        }
    }
    if (bandChanged && m_onZoomLevelChange)
    {
        m_onZoomLevelChange(m_state.band);
    }
}

} // namespace globe::core
