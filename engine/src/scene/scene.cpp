#include <lumen/scene/scene.h>

#include <cmath>

namespace lumen
{

std::vector<uint32_t> findLights(const std::vector<Sphere>& objects)
{
    std::vector<uint32_t> lights;
    for (uint32_t i = 0; i < static_cast<uint32_t>(objects.size()); ++i)
    {
        if (isEmissive(objects[i].material))
            lights.push_back(i);
    }
    return lights;
}

void rotateTextures(std::vector<Sphere>& objects, double delta)
{
    for (auto& sphere : objects)
    {
        if (auto* tex = std::get_if<TexturedDiffuseMaterial>(&sphere.material))
        {
            double offset = tex->hOffset + delta;
            tex->hOffset = offset - std::floor(offset);
        }
    }
}

} // namespace lumen
