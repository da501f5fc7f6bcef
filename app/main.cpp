#include "config/GlobeConfig.hpp"
#include "engine/GlobeEngine.hpp"
#include "logging/Logger.hpp"
#include "sources/TextThreatSource.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>

int main(int argc, char** argv)
{
    const std::filesystem::path configPath = argc > 1 ? std::filesystem::path(argv[1])
                                                      : std::filesystem::current_path() / "config" / "Globe.ini";

    globe::GlobeConfig config;
    globe::core::VisualizationSettings settings;
    std::filesystem::path recordFile = std::filesystem::current_path() / "data" / "sample_threats.csv";
    if (std::filesystem::exists(configPath))
    {
        if (!config.load(configPath))
        {
            return EXIT_FAILURE;
        }
        settings = config.settings();
        if (!config.recordFile().empty())
        {
            recordFile = config.recordFile();
        }
    }
    else
    {
        globe::Logger::log(globe::Logger::Level::Warning,
                           "Config " + configPath.string() + " not found, using built-in defaults");
    }

    if (argc > 2)
    {
        recordFile = argv[2];
    }

    globe::GlobeEngine engine(std::make_unique<globe::TextThreatSource>(recordFile), settings);
    if (!engine.initialize())
    {
        return EXIT_FAILURE;
    }
    engine.run();
    return EXIT_SUCCESS;
}
