#include <lumen/scene/demo_scenes.h>
#include <lumen/core/log.h>
#include <lumen/core/random.h>

namespace lumen
{

Scene makeBasicScene()
{
    Scene scene;
    scene.width = 400;
    scene.height = 300;
    scene.samplesPerPixel = 16;
    scene.maxDepth = 10;
    scene.sky = Sky::gradient();
    scene.camera = Camera(Vector3(0.0, 0.0, 0.0), Vector3(0.0, 0.0, -1.0),
                          Vector3(0.0, 1.0, 0.0), 90.0, 400.0 / 300.0);

    scene.objects.push_back({ Vector3(0.0, 0.0, -1.0), 0.5,
                              DiffuseMaterial{ Color(0.8f, 0.3f, 0.3f) } });
    scene.objects.push_back({ Vector3(0.0, -100.5, -1.0), 100.0,
                              DiffuseMaterial{ Color(0.8f, 0.8f, 0.0f) } });
    return scene;
}

Scene makeCoverScene(uint32_t seed)
{
    Scene scene;
    scene.width = 800;
    scene.height = 600;
    scene.samplesPerPixel = 64;
    scene.maxDepth = 50;
    scene.sky = Sky::gradient();
    scene.camera = Camera(Vector3(13.0, 2.0, 3.0), Vector3(0.0, 0.0, 0.0),
                          Vector3(0.0, 1.0, 0.0), 20.0, 800.0 / 600.0);

    auto& world = scene.objects;
    world.push_back({ Vector3(0.0, -1000.0, 0.0), 1000.0,
                      DiffuseMaterial{ Color(0.5f) } });

    RNG rng(hash(seed + 1u));
    for (int a = -11; a < 11; ++a)
    {
        for (int b = -11; b < 11; ++b)
        {
            double chooseMat = rng.nextDouble();
            Vector3 center(a + 0.9 * rng.nextDouble(), 0.2, b + 0.9 * rng.nextDouble());

            if (glm::length(center - Vector3(4.0, 0.2, 0.0)) < 0.9)
                continue;

            if (chooseMat < 0.8)
            {
                Color albedo(rng.next() * rng.next(),
                             rng.next() * rng.next(),
                             rng.next() * rng.next());
                world.push_back({ center, 0.2, DiffuseMaterial{ albedo } });
            }
            else if (chooseMat < 0.95)
            {
                Color albedo(0.5f * (1.0f + rng.next()),
                             0.5f * (1.0f + rng.next()),
                             0.5f * (1.0f + rng.next()));
                world.push_back({ center, 0.2, MetalMaterial{ albedo, 0.5 * rng.nextDouble() } });
            }
            else
            {
                world.push_back({ center, 0.2, DielectricMaterial{ 1.5 } });
            }
        }
    }

    world.push_back({ Vector3(0.0, 1.0, 0.0), 1.0, DielectricMaterial{ 1.5 } });
    world.push_back({ Vector3(-4.0, 1.0, 0.0), 1.0,
                      DiffuseMaterial{ Color(0.4f, 0.2f, 0.1f) } });
    world.push_back({ Vector3(4.0, 1.0, 0.0), 1.0,
                      MetalMaterial{ Color(0.7f, 0.6f, 0.5f), 0.0 } });
    return scene;
}

Scene makeShowcaseScene()
{
    Scene scene;
    scene.width = 800;
    scene.height = 600;
    scene.samplesPerPixel = 64;
    scene.maxDepth = 50;
    scene.camera = Camera(Vector3(-2.5, 1.0, 1.0), Vector3(0.0, 0.0, -1.0),
                          Vector3(0.0, 1.0, 0.0), 50.0, 800.0 / 600.0);

    auto& world = scene.objects;
    world.push_back({ Vector3(0.0, 0.0, -1.0), 0.5,
                      DiffuseMaterial{ Color(0.1f, 0.2f, 0.5f) } });
    world.push_back({ Vector3(-1.0, 0.2, -1.0), 0.1,
                      DiffuseMaterial{ Color(0.6f) } });
    world.push_back({ Vector3(0.0, -100.5, -1.0), 100.0,
                      MetalMaterial{ Color(0.8f), 0.0 } });
    world.push_back({ Vector3(0.0, 16.0, 20.0), 15.0, EmissiveMaterial{} });
    world.push_back({ Vector3(1.0, 0.5, -1.0), 0.5,
                      MetalMaterial{ Color(0.8f, 0.6f, 0.2f), 0.1 } });
    world.push_back({ Vector3(-1.2, 0.0, -1.0), 0.5, DielectricMaterial{ 1.5 } });
    world.push_back({ Vector3(-1.2, 0.0, -1.0), -0.45, DielectricMaterial{ 1.5 } });
    return scene;
}

std::optional<Scene> makeDemoScene(const std::string& name, uint32_t seed)
{
    if (name == "basic")
        return makeBasicScene();
    if (name == "cover")
        return makeCoverScene(seed);
    if (name == "showcase")
        return makeShowcaseScene();

    Log::error("Unknown demo scene: " + name);
    return std::nullopt;
}

std::vector<std::string> demoSceneNames()
{
    return { "basic", "cover", "showcase" };
}

} // namespace lumen
