#pragma once

#include <filesystem>
#include <string>

#include "globe_core/processing_common.hpp"

namespace globe
{

class GlobeConfig
{
public:
    // Reads [Zoom], [Clustering], [Heatmap], [Pipeline] and [Feed]. Missing
    // keys keep their defaults; inconsistent values fall back to defaults with
    // a warning. Returns false if the file cannot be parsed.
    bool load(const std::filesystem::path& path);

    const core::VisualizationSettings& settings() const noexcept;

    // Record feed path, resolved against the config file's directory. Empty
    // when [Feed] recordFile is not set.
    const std::filesystem::path& recordFile() const noexcept;

private:
    core::VisualizationSettings m_settings;
    std::filesystem::path m_recordFile;
};

} // namespace globe
