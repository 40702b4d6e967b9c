#include "app.h"

#include <lumen/core/log.h>
#include <lumen/scene/demo_scenes.h>
#include <lumen/scene/scene_loader.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

bool App::init(const lumen::RenderConfig& config)
{
    m_config = config;

    std::optional<lumen::Scene> scene = config.demoScene.empty()
        ? lumen::loadScene(config.scenePath)
        : lumen::makeDemoScene(config.demoScene, config.seed);
    if (!scene)
        return false;

    m_scene = std::move(*scene);
    lumen::applyOverrides(m_scene, m_config);

    m_renderer.setThreadCount(m_config.threads);
    m_renderer.setSeed(m_config.seed);
    return true;
}

bool App::run()
{
    const uint32_t frames = std::max(1u, m_config.frames);
    for (uint32_t i = 0; i < frames; ++i)
    {
        std::string path = lumen::frameOutputPath(m_config.outputPath, i, frames);
        lumen::Log::info("Rendering " + path);

        // Each frame turns the textured spheres a further 1/frames of a revolution
        lumen::Scene frame = m_scene;
        lumen::rotateTextures(frame.objects, static_cast<double>(i) / frames);

        if (!m_renderer.renderToFile(path, frame))
            return false;
    }
    return true;
}
