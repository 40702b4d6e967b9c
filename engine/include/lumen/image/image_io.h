#pragma once

#include <lumen/core/math.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lumen
{

// Decoded RGB8 image, shared read-only between materials and render workers.
struct TextureData
{
    std::vector<uint8_t> pixels; // RGB, 3 bytes per pixel, top row first
    int width = 0;
    int height = 0;
    std::string path;            // source file, kept so scenes can be written back

    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }

    // Nearest texel; coordinates are clamped into the image.
    Color texel(int x, int y) const
    {
        x = std::clamp(x, 0, width - 1);
        y = std::clamp(y, 0, height - 1);
        size_t idx = (static_cast<size_t>(y) * width + x) * 3;
        return Color(pixels[idx]     / 255.0f,
                     pixels[idx + 1] / 255.0f,
                     pixels[idx + 2] / 255.0f);
    }
};

// Decodes any format stb_image understands into RGB8.
// Returns nullptr and logs on failure.
std::shared_ptr<const TextureData> loadTexture(const std::string& path);

// Writes packed RGB8 pixels as PNG. Returns false and logs on failure.
bool writePNG(const std::string& path, const std::vector<uint8_t>& pixels,
              uint32_t width, uint32_t height);

} // namespace lumen
