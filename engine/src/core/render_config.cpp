#include <lumen/core/render_config.h>

#include <cstdio>
#include <filesystem>

namespace lumen
{

void applyOverrides(Scene& scene, const RenderConfig& config)
{
    if (config.width)
        scene.width = *config.width;
    if (config.height)
        scene.height = *config.height;
    if (config.samplesPerPixel)
        scene.samplesPerPixel = *config.samplesPerPixel;
    if (config.maxDepth)
        scene.maxDepth = *config.maxDepth;
}

std::string frameOutputPath(const std::string& outputPath, uint32_t frame, uint32_t frames)
{
    if (frames <= 1)
        return outputPath;

    std::filesystem::path p(outputPath);
    std::string ext = p.has_extension() ? p.extension().string() : std::string(".png");

    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "_%03u", frame);

    std::filesystem::path out = p.parent_path() / (p.stem().string() + suffix + ext);
    return out.string();
}

} // namespace lumen
