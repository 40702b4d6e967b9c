#include <lumen/raytracing/integrator.h>
#include <lumen/raytracing/material.h>

#include <cmath>
#include <limits>

namespace lumen
{

namespace
{

// Chance per light of sending probe rays toward the emitters from a hit.
constexpr double LIGHT_SAMPLE_PROB = 0.1;
constexpr double LIGHT_SAMPLE_PROB_DIELECTRIC = 0.05;

const Color SKY_HORIZON{1.0f, 1.0f, 1.0f};
const Color SKY_ZENITH{0.5f, 0.7f, 1.0f};

Color trace(const Ray& ray, const Scene& scene, const std::vector<uint32_t>& lights,
            int maxDepth, int depth, bool sampleLights, RNG& rng)
{
    if (depth <= 0)
        return Color(0.0f);

    HitRecord hit;
    if (!hitWorld(scene.objects, ray, HIT_EPSILON, std::numeric_limits<double>::max(), hit))
        return sampleSky(scene.sky, ray.direction);

    const Material& material = scene.objects[hit.objectIndex].material;

    ScatterRecord rec;
    if (!scatter(material, ray, hit, rng, rec))
        return Color(0.0f); // absorbed rays would not reach a light either

    // Direct light shortcut: probe every emitter's center, only near the
    // camera end of the path. Probes are not occlusion-tested and do not
    // spawn probes of their own.
    Color light(0.0f);
    double prob = isDielectric(material) ? LIGHT_SAMPLE_PROB_DIELECTRIC : LIGHT_SAMPLE_PROB;
    if (sampleLights && !lights.empty()
        && rng.nextDouble() > 1.0 - static_cast<double>(lights.size()) * prob
        && depth > maxDepth - 2)
    {
        for (uint32_t idx : lights)
        {
            Ray lightRay{ hit.point, scene.objects[idx].center - hit.point };
            Color target = trace(lightRay, scene, lights, 2, 1, false, rng);
            light += rec.attenuation * target;
        }
        light /= static_cast<float>(lights.size());
    }

    if (!rec.hasRay)
        return rec.attenuation;

    Color target = trace(rec.scattered, scene, lights, maxDepth, depth - 1, sampleLights, rng);
    return clamp01(light + rec.attenuation * target);
}

} // namespace

bool hitWorld(const std::vector<Sphere>& objects, const Ray& ray,
              double tMin, double tMax, HitRecord& rec)
{
    double closestSoFar = tMax;
    bool hitAnything = false;
    for (uint32_t i = 0; i < static_cast<uint32_t>(objects.size()); ++i)
    {
        HitRecord candidate;
        if (objects[i].hit(ray, tMin, closestSoFar, candidate))
        {
            closestSoFar = candidate.t;
            candidate.objectIndex = i;
            rec = candidate;
            hitAnything = true;
        }
    }
    return hitAnything;
}

Color sampleSky(const std::optional<Sky>& sky, const Vector3& direction)
{
    if (!sky)
        return Color(0.0f);

    if (sky->hasTexture())
    {
        const TextureData& tex = *sky->texture;
        double u, v;
        sphericalUV(direction, u, v);
        int x = static_cast<int>(u * (tex.width - 1));
        int y = static_cast<int>((1.0 - v) * (tex.height - 1));
        return tex.texel(x, y) * SKY_TEXTURE_SCALE;
    }

    Vector3 unit = glm::normalize(direction);
    float t = clamp01(static_cast<float>(0.5 * (unit.y + 1.0)));
    return SKY_HORIZON * (1.0f - t) + SKY_ZENITH * t;
}

Color rayColor(const Ray& ray, const Scene& scene, const std::vector<uint32_t>& lights,
               int maxDepth, int depth, RNG& rng)
{
    return trace(ray, scene, lights, maxDepth, depth, true, rng);
}

} // namespace lumen
