#pragma once

#include <lumen/scene/scene.h>

#include <cstdint>
#include <optional>
#include <string>

namespace lumen
{

struct RenderConfig
{
    std::string scenePath;   // JSON scene file
    std::string demoScene;   // used instead of scenePath when set
    std::string outputPath = "out.png";

    // Overrides applied on top of the loaded scene
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    std::optional<uint32_t> samplesPerPixel;
    std::optional<uint32_t> maxDepth;

    uint32_t threads = 0;    // 0 = hardware concurrency
    uint32_t frames = 1;
    uint32_t seed = 0;
};

// Resolution overrides leave the camera aspect untouched.
void applyOverrides(Scene& scene, const RenderConfig& config);

// "out.png" -> "out_007.png". Single-frame renders keep the path unchanged.
std::string frameOutputPath(const std::string& outputPath, uint32_t frame, uint32_t frames);

} // namespace lumen
