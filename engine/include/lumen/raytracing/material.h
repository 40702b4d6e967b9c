#pragma once

#include <lumen/core/math.h>
#include <lumen/core/random.h>
#include <lumen/image/image_io.h>
#include <lumen/raytracing/hit.h>
#include <lumen/raytracing/ray.h>

#include <memory>
#include <variant>

namespace lumen
{

struct ScatterRecord
{
    Ray scattered;
    Color attenuation{0.0f};
    bool hasRay = false; // false: attenuation is final emitted radiance
};

// v - 2*dot(v,n)*n
inline Vector3 reflect(const Vector3& v, const Vector3& n)
{
    return v - n * (2.0 * glm::dot(v, n));
}

// Snell refraction of unit vector uv through a surface with normal n facing uv.
inline Vector3 refract(const Vector3& uv, const Vector3& n, double etaiOverEtat)
{
    double cosTheta = std::min(glm::dot(-uv, n), 1.0);
    Vector3 rOutPerp = (uv + n * cosTheta) * etaiOverEtat;
    Vector3 rOutParallel = n * -std::sqrt(std::abs(1.0 - lengthSquared(rOutPerp)));
    return rOutPerp + rOutParallel;
}

// Schlick approximation. r0 is the same for refIdx and 1/refIdx.
inline double reflectance(double cosine, double refIdx)
{
    double r0 = (1.0 - refIdx) / (1.0 + refIdx);
    r0 = r0 * r0;
    return r0 + (1.0 - r0) * std::pow(1.0 - cosine, 5.0);
}

struct DiffuseMaterial
{
    Color albedo{0.5f};

    bool scatter(const Ray& ray, const HitRecord& hit, RNG& rng, ScatterRecord& out) const;
};

struct MetalMaterial
{
    Color albedo{0.8f};
    double fuzz = 0.0;

    bool scatter(const Ray& ray, const HitRecord& hit, RNG& rng, ScatterRecord& out) const;
};

struct DielectricMaterial
{
    double ior = 1.5;

    bool scatter(const Ray& ray, const HitRecord& hit, RNG& rng, ScatterRecord& out) const;
};

struct TexturedDiffuseMaterial
{
    Color albedo{1.0f}; // kept for scene files; the texel is the attenuation
    std::shared_ptr<const TextureData> texture;
    double hOffset = 0.0; // horizontal rotation, fraction of a full turn

    Color sample(double u, double v) const;
    bool scatter(const Ray& ray, const HitRecord& hit, RNG& rng, ScatterRecord& out) const;
};

// Constant white radiance, no outgoing ray.
struct EmissiveMaterial
{
    bool scatter(const Ray& ray, const HitRecord& hit, RNG& rng, ScatterRecord& out) const;
};

using Material = std::variant<DiffuseMaterial,
                              MetalMaterial,
                              DielectricMaterial,
                              TexturedDiffuseMaterial,
                              EmissiveMaterial>;

// Returns false when the ray is absorbed.
bool scatter(const Material& material, const Ray& ray, const HitRecord& hit,
             RNG& rng, ScatterRecord& out);

inline bool isEmissive(const Material& material)
{
    return std::holds_alternative<EmissiveMaterial>(material);
}

inline bool isDielectric(const Material& material)
{
    return std::holds_alternative<DielectricMaterial>(material);
}

} // namespace lumen
