#include <lumen/image/image_io.h>
#include <lumen/core/log.h>

#include <stb_image.h>
#include <stb_image_write.h>

namespace lumen
{

std::shared_ptr<const TextureData> loadTexture(const std::string& path)
{
    int w, h, ch;
    stbi_set_flip_vertically_on_load(false);
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &ch, 3);
    if (!data)
    {
        const char* reason = stbi_failure_reason();
        Log::error("Failed to load texture: " + path +
                   (reason ? " (" + std::string(reason) + ")" : ""));
        return nullptr;
    }

    auto tex = std::make_shared<TextureData>();
    tex->width  = w;
    tex->height = h;
    tex->path   = path;
    tex->pixels.assign(data, data + static_cast<size_t>(w) * h * 3);
    stbi_image_free(data);

    Log::info("Loaded texture: " + path + " (" + std::to_string(w) + "x" +
              std::to_string(h) + ")");
    return tex;
}

bool writePNG(const std::string& path, const std::vector<uint8_t>& pixels,
              uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0 ||
        pixels.size() != static_cast<size_t>(width) * height * 3)
    {
        Log::error("Refusing to write " + path + ": pixel buffer does not match " +
                   std::to_string(width) + "x" + std::to_string(height));
        return false;
    }

    int w = static_cast<int>(width);
    int h = static_cast<int>(height);
    if (stbi_write_png(path.c_str(), w, h, 3, pixels.data(), w * 3) == 0)
    {
        Log::error("Failed to write image: " + path);
        return false;
    }
    return true;
}

} // namespace lumen
