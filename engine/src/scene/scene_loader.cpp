#include <lumen/scene/scene_loader.h>
#include <lumen/core/log.h>
#include <lumen/image/image_io.h>

#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <variant>

namespace lumen
{

using json = nlohmann::json;

namespace
{

// Every texture path is decoded once and shared between materials.
class TextureCache
{
public:
    explicit TextureCache(std::filesystem::path baseDir) : m_baseDir(std::move(baseDir)) {}

    std::shared_ptr<const TextureData> get(const std::string& path)
    {
        std::string resolved = resolve(path);
        auto it = m_cache.find(resolved);
        if (it != m_cache.end())
            return it->second;

        auto tex = loadTexture(resolved);
        if (tex)
            m_cache[resolved] = tex;
        return tex;
    }

private:
    std::string resolve(const std::string& path) const
    {
        std::filesystem::path p(path);
        std::error_code ec;
        if (p.is_absolute() || std::filesystem::exists(p, ec) || m_baseDir.empty())
            return path;
        return (m_baseDir / p).string();
    }

    std::filesystem::path m_baseDir;
    std::unordered_map<std::string, std::shared_ptr<const TextureData>> m_cache;
};

Vector3 readVector(const json& j)
{
    return Vector3(j.at("x").get<double>(), j.at("y").get<double>(), j.at("z").get<double>());
}

json writeVector(const Vector3& v)
{
    return { { "x", v.x }, { "y", v.y }, { "z", v.z } };
}

// nlohmann casts negative and fractional numbers to unsigned without throwing
uint32_t readCount(const json& doc, const char* key, bool allowZero)
{
    const json& j = doc.at(key);
    bool inRange = j.is_number_unsigned()
        ? j.get<uint64_t>() <= UINT32_MAX
        : j.is_number_integer() && j.get<int64_t>() >= 0 && j.get<int64_t>() <= UINT32_MAX;
    if (!inRange)
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");

    uint32_t value = j.get<uint32_t>();
    if (value == 0 && !allowZero)
        throw std::invalid_argument(std::string(key) + " must be positive");
    return value;
}

Color readColor(const json& j)
{
    if (!j.is_array() || j.size() != 3)
        throw std::invalid_argument("color must be an array of 3 numbers");
    return Color(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
}

json writeColor(const Color& c)
{
    return json::array({ c.r, c.g, c.b });
}

bool readMaterial(const json& j, TextureCache& textures, Material& out)
{
    if (!j.is_object() || j.size() != 1)
    {
        Log::error("Material must be an object with exactly one kind");
        return false;
    }

    const std::string& kind = j.begin().key();
    const json& params = j.begin().value();

    if (kind == "Lambertian")
    {
        out = DiffuseMaterial{ readColor(params.at("albedo")) };
    }
    else if (kind == "Metal")
    {
        out = MetalMaterial{ readColor(params.at("albedo")), params.at("fuzz").get<double>() };
    }
    else if (kind == "Glass")
    {
        out = DielectricMaterial{ params.at("index_of_refraction").get<double>() };
    }
    else if (kind == "Texture")
    {
        TexturedDiffuseMaterial tex;
        tex.albedo = readColor(params.at("albedo"));
        tex.hOffset = params.value("h_offset", 0.0);
        tex.texture = textures.get(params.at("pixels").get<std::string>());
        if (!tex.texture)
            return false;
        out = tex;
    }
    else if (kind == "Light")
    {
        out = EmissiveMaterial{};
    }
    else
    {
        Log::error("Unknown material kind: " + kind);
        return false;
    }
    return true;
}

json writeMaterial(const Material& material)
{
    return std::visit([](const auto& m) -> json
    {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, DiffuseMaterial>)
            return { { "Lambertian", { { "albedo", writeColor(m.albedo) } } } };
        else if constexpr (std::is_same_v<T, MetalMaterial>)
            return { { "Metal", { { "albedo", writeColor(m.albedo) }, { "fuzz", m.fuzz } } } };
        else if constexpr (std::is_same_v<T, DielectricMaterial>)
            return { { "Glass", { { "index_of_refraction", m.ior } } } };
        else if constexpr (std::is_same_v<T, TexturedDiffuseMaterial>)
            return { { "Texture", {
                { "albedo", writeColor(m.albedo) },
                { "pixels", m.texture ? m.texture->path : std::string() },
                { "width", m.texture ? m.texture->width : 0 },
                { "height", m.texture ? m.texture->height : 0 },
                { "h_offset", m.hOffset } } } };
        else
            return { { "Light", json::object() } };
    }, material);
}

} // namespace

std::optional<Scene> parseScene(const json& doc, const std::filesystem::path& baseDir)
{
    TextureCache textures(baseDir);
    Scene scene;

    try
    {
        scene.width = readCount(doc, "width", false);
        scene.height = readCount(doc, "height", false);
        scene.samplesPerPixel = readCount(doc, "samples_per_pixel", true);
        scene.maxDepth = readCount(doc, "max_depth", true);

        const json& sky = doc.value("sky", json());
        if (!sky.is_null())
        {
            Sky s;
            std::string path = sky.value("texture", std::string());
            if (!path.empty())
            {
                s.texture = textures.get(path);
                if (!s.texture)
                    return std::nullopt;
            }
            scene.sky = s;
        }

        const json& cam = doc.at("camera");
        CameraParams params;
        params.lookFrom = readVector(cam.at("look_from"));
        params.lookAt = readVector(cam.at("look_at"));
        params.vup = readVector(cam.at("vup"));
        params.vfov = cam.at("vfov").get<double>();
        params.aspect = cam.at("aspect").get<double>();
        scene.camera = Camera(params);

        for (const json& obj : doc.at("objects"))
        {
            Sphere sphere;
            sphere.center = readVector(obj.at("center"));
            sphere.radius = obj.at("radius").get<double>();
            if (!readMaterial(obj.at("material"), textures, sphere.material))
                return std::nullopt;
            scene.objects.push_back(std::move(sphere));
        }
    }
    catch (const json::exception& e)
    {
        Log::error(std::string("Malformed scene: ") + e.what());
        return std::nullopt;
    }
    catch (const std::invalid_argument& e)
    {
        Log::error(std::string("Malformed scene: ") + e.what());
        return std::nullopt;
    }

    return scene;
}

std::optional<Scene> loadScene(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        Log::error("Failed to open scene: " + path);
        return std::nullopt;
    }

    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded())
    {
        Log::error("Failed to parse scene JSON: " + path);
        return std::nullopt;
    }

    auto scene = parseScene(doc, std::filesystem::path(path).parent_path());
    if (scene)
        Log::info("Loaded scene " + path + ": " + std::to_string(scene->objects.size()) +
                  " object(s), " + std::to_string(scene->width) + "x" +
                  std::to_string(scene->height));
    return scene;
}

json sceneToJson(const Scene& scene)
{
    json doc;
    doc["width"] = scene.width;
    doc["height"] = scene.height;
    doc["samples_per_pixel"] = scene.samplesPerPixel;
    doc["max_depth"] = scene.maxDepth;

    if (scene.sky)
        doc["sky"] = { { "texture", scene.sky->texture ? scene.sky->texture->path : std::string() } };
    else
        doc["sky"] = nullptr;

    const CameraParams& cam = scene.camera.getParams();
    doc["camera"] = {
        { "look_from", writeVector(cam.lookFrom) },
        { "look_at", writeVector(cam.lookAt) },
        { "vup", writeVector(cam.vup) },
        { "vfov", cam.vfov },
        { "aspect", cam.aspect },
    };

    json objects = json::array();
    for (const auto& sphere : scene.objects)
    {
        objects.push_back({
            { "center", writeVector(sphere.center) },
            { "radius", sphere.radius },
            { "material", writeMaterial(sphere.material) },
        });
    }
    doc["objects"] = std::move(objects);
    return doc;
}

bool saveScene(const std::string& path, const Scene& scene)
{
    std::ofstream file(path);
    if (!file)
    {
        Log::error("Failed to open " + path + " for writing");
        return false;
    }

    file << sceneToJson(scene).dump(2) << "\n";
    if (!file)
    {
        Log::error("Failed to write scene: " + path);
        return false;
    }
    return true;
}

} // namespace lumen
