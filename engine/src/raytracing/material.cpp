#include <lumen/raytracing/material.h>

#include <cmath>

namespace lumen
{

static Vector3 diffuseDirection(const HitRecord& hit, RNG& rng)
{
    Vector3 dir = hit.normal + randomInUnitSphere(rng);
    if (nearZero(dir))
        dir = hit.normal;
    return dir;
}

bool DiffuseMaterial::scatter(const Ray&, const HitRecord& hit, RNG& rng,
                              ScatterRecord& out) const
{
    out.scattered = { hit.point, diffuseDirection(hit, rng) };
    out.attenuation = albedo;
    out.hasRay = true;
    return true;
}

bool MetalMaterial::scatter(const Ray& ray, const HitRecord& hit, RNG& rng,
                            ScatterRecord& out) const
{
    Vector3 reflected = reflect(ray.direction, hit.normal);
    Vector3 dir = reflected + randomInUnitSphere(rng) * fuzz;
    if (glm::dot(dir, hit.normal) <= 0.0)
        return false;

    out.scattered = { hit.point, dir };
    out.attenuation = albedo;
    out.hasRay = true;
    return true;
}

bool DielectricMaterial::scatter(const Ray& ray, const HitRecord& hit, RNG& rng,
                                 ScatterRecord& out) const
{
    double ratio = hit.frontFace ? 1.0 / ior : ior;

    Vector3 unitDirection = glm::normalize(ray.direction);
    double cosTheta = std::min(glm::dot(-unitDirection, hit.normal), 1.0);
    double sinTheta = std::sqrt(1.0 - cosTheta * cosTheta);

    // Total internal reflection forces the reflection branch
    bool cannotRefract = ratio * sinTheta > 1.0;

    Vector3 dir;
    if (cannotRefract || reflectance(cosTheta, ratio) > rng.nextDouble())
        dir = reflect(unitDirection, hit.normal);
    else
        dir = refract(unitDirection, hit.normal, ratio);

    out.scattered = { hit.point, dir };
    out.attenuation = Color(1.0f);
    out.hasRay = true;
    return true;
}

Color TexturedDiffuseMaterial::sample(double u, double v) const
{
    if (!texture || texture->empty())
        return albedo;

    double rot = u + hOffset;
    rot -= std::floor(rot);

    double uu = rot * texture->width;
    double vv = (1.0 - v) * (texture->height - 1);
    return texture->texel(static_cast<int>(std::floor(uu)),
                          static_cast<int>(std::floor(vv)));
}

bool TexturedDiffuseMaterial::scatter(const Ray&, const HitRecord& hit, RNG& rng,
                                      ScatterRecord& out) const
{
    out.scattered = { hit.point, diffuseDirection(hit, rng) };
    out.attenuation = sample(hit.u, hit.v);
    out.hasRay = true;
    return true;
}

bool EmissiveMaterial::scatter(const Ray&, const HitRecord&, RNG&,
                               ScatterRecord& out) const
{
    out.attenuation = Color(1.0f);
    out.hasRay = false;
    return true;
}

bool scatter(const Material& material, const Ray& ray, const HitRecord& hit,
             RNG& rng, ScatterRecord& out)
{
    return std::visit([&](const auto& m) { return m.scatter(ray, hit, rng, out); },
                      material);
}

} // namespace lumen
