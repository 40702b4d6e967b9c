#include <catch2/catch.hpp>
#include <lumen/raytracing/integrator.h>

#include <cmath>
#include <memory>

using namespace lumen;

static Scene emptyScene()
{
    Scene scene;
    scene.width = 80;
    scene.height = 60;
    scene.samplesPerPixel = 1;
    scene.maxDepth = 2;
    scene.camera = Camera(Vector3(0.0, 0.0, -3.0), Vector3(0.0), Vector3(0.0, 1.0, 0.0),
                          20.0, 1.333);
    return scene;
}

static bool isFinite(const Color& c)
{
    return std::isfinite(c.r) && std::isfinite(c.g) && std::isfinite(c.b);
}

TEST_CASE("Escaped rays see the gradient sky", "[integrator]")
{
    Scene scene = emptyScene();
    scene.sky = Sky::gradient();
    std::vector<uint32_t> lights;
    RNG rng(1);

    Color c = rayColor(Ray{ Vector3(0.0), Vector3(1.0, 0.0, 0.0) }, scene, lights, 2, 2, rng);
    REQUIRE(c.r == Approx(0.75f));
    REQUIRE(c.g == Approx(0.85f));
    REQUIRE(c.b == Approx(1.0f));

    Color up = rayColor(Ray{ Vector3(0.0), Vector3(0.0, 5.0, 0.0) }, scene, lights, 2, 2, rng);
    REQUIRE(up.r == Approx(0.5f));
    REQUIRE(up.g == Approx(0.7f));
    REQUIRE(up.b == Approx(1.0f));

    Color down = rayColor(Ray{ Vector3(0.0), Vector3(0.0, -1.0, 0.0) }, scene, lights, 2, 2, rng);
    REQUIRE(down == Color(1.0f));
}

TEST_CASE("No sky means a black background", "[integrator]")
{
    Scene scene = emptyScene();
    std::vector<uint32_t> lights;
    RNG rng(1);

    REQUIRE(rayColor(Ray{ Vector3(0.0), Vector3(0.0, 1.0, 0.0) }, scene, lights, 2, 2, rng)
            == Color(0.0f));
}

TEST_CASE("Exhausted depth returns black", "[integrator]")
{
    Scene scene = emptyScene();
    scene.sky = Sky::gradient();
    std::vector<uint32_t> lights;
    RNG rng(1);

    REQUIRE(rayColor(Ray{ Vector3(0.0), Vector3(1.0, 0.0, 0.0) }, scene, lights, 2, 0, rng)
            == Color(0.0f));
}

TEST_CASE("Textured sky is looked up by direction and dimmed", "[integrator]")
{
    auto tex = std::make_shared<TextureData>();
    tex->width = 2;
    tex->height = 2;
    tex->pixels = { 200, 100, 50,   0, 0, 0,
                    10, 20, 30,     0, 0, 0 };

    std::optional<Sky> sky = Sky{ tex };

    // Straight up: v = 1 selects the top row, u = 0.5 the first column
    Color top = sampleSky(sky, Vector3(0.0, 1.0, 0.0));
    REQUIRE(top.r == Approx(0.7f * 200.0f / 255.0f));
    REQUIRE(top.g == Approx(0.7f * 100.0f / 255.0f));
    REQUIRE(top.b == Approx(0.7f * 50.0f / 255.0f));

    Color bottom = sampleSky(sky, Vector3(0.0, -1.0, 0.0));
    REQUIRE(bottom.r == Approx(0.7f * 10.0f / 255.0f));
    REQUIRE(bottom.b == Approx(0.7f * 30.0f / 255.0f));
}

TEST_CASE("Looking straight at a light returns its radiance", "[integrator]")
{
    Scene scene = emptyScene();
    scene.objects.push_back({ Vector3(0.0, 0.0, -5.0), 1.0, EmissiveMaterial{} });
    std::vector<uint32_t> lights = findLights(scene.objects);
    RNG rng(1);

    Color c = rayColor(Ray{ Vector3(0.0), Vector3(0.0, 0.0, -1.0) }, scene, lights, 10, 10, rng);
    REQUIRE(c == Color(1.0f));
}

TEST_CASE("findLights returns only emissive objects", "[integrator]")
{
    std::vector<Sphere> world = {
        { Vector3(0.0, 0.0, -1.0), 0.5, EmissiveMaterial{} },
        { Vector3(0.0, 0.0, -1.0), 0.5, DiffuseMaterial{ Color(0.5f) } },
        { Vector3(2.0, 0.0, -1.0), 0.5, EmissiveMaterial{} },
    };

    auto lights = findLights(world);
    REQUIRE(lights.size() == 2);
    REQUIRE(lights[0] == 0);
    REQUIRE(lights[1] == 2);
    REQUIRE(findLights({}).empty());
}

TEST_CASE("Direct light sampling fires on a fraction of final bounces", "[integrator]")
{
    // A white diffuse floor lit by one light and nothing else. With a single
    // bounce the scattered ray runs out of depth, so any colour must come
    // from a light probe.
    Scene scene = emptyScene();
    scene.objects.push_back({ Vector3(0.0, -100.0, 0.0), 99.0, DiffuseMaterial{ Color(0.6f) } });
    scene.objects.push_back({ Vector3(0.0, 10.0, 0.0), 2.0, EmissiveMaterial{} });
    std::vector<uint32_t> lights = findLights(scene.objects);
    REQUIRE(lights.size() == 1);

    RNG rng(2024);
    Ray down{ Vector3(0.0, 0.0, 0.0), Vector3(0.0, -1.0, 0.0) };

    const int trials = 4000;
    int lit = 0;
    for (int i = 0; i < trials; ++i)
    {
        Color c = rayColor(down, scene, lights, 1, 1, rng);
        if (c != Color(0.0f))
        {
            ++lit;
            REQUIRE(c.r == Approx(0.6f));
        }
    }
    // 10% per light
    REQUIRE(lit > trials / 20);
    REQUIRE(lit < trials / 5);
}

TEST_CASE("Direct light sampling only runs near the camera end of a path", "[integrator]")
{
    Scene scene = emptyScene();
    scene.objects.push_back({ Vector3(0.0, -100.0, 0.0), 99.0, DiffuseMaterial{ Color(0.6f) } });
    scene.objects.push_back({ Vector3(0.0, 10.0, 0.0), 2.0, EmissiveMaterial{} });
    std::vector<uint32_t> lights = findLights(scene.objects);

    RNG rng(7);
    Ray down{ Vector3(0.0), Vector3(0.0, -1.0, 0.0) };
    // depth 1 of max 10 is deep in the path: the gate is closed, and the
    // scattered ray runs out of depth immediately
    for (int i = 0; i < 500; ++i)
        REQUIRE(rayColor(down, scene, lights, 10, 1, rng) == Color(0.0f));
}

TEST_CASE("Hollow glass bubble stays finite", "[integrator]")
{
    Scene scene = emptyScene();
    scene.sky = Sky::gradient();
    scene.objects.push_back({ Vector3(0.0, 0.0, -1.0), 0.5, DielectricMaterial{ 1.5 } });
    scene.objects.push_back({ Vector3(0.0, 0.0, -1.0), -0.5 * 0.99, DielectricMaterial{ 1.5 } });
    std::vector<uint32_t> lights = findLights(scene.objects);
    REQUIRE(lights.empty());

    RNG rng(42);
    for (int i = 0; i < 500; ++i)
    {
        Vector3 jitter = randomInUnitSphere(rng) * 0.3;
        Ray ray{ Vector3(0.0), Vector3(0.0, 0.0, -1.0) + jitter };
        Color c = rayColor(ray, scene, lights, 50, 50, rng);
        REQUIRE(isFinite(c));
        REQUIRE(c.r >= 0.0f);
        REQUIRE(c.r <= 1.0f);
        REQUIRE(c.b <= 1.0f);
    }
}

TEST_CASE("Many lights keep the recursion bounded", "[integrator]")
{
    // With twelve lights the sampling gate is always open; rays sent toward
    // a light must not sample the lights again.
    Scene scene = emptyScene();
    scene.objects.push_back({ Vector3(0.0, -100.0, 0.0), 99.0, DiffuseMaterial{ Color(0.5f) } });
    scene.objects.push_back({ Vector3(0.0, 3.0, 0.0), 0.5, DiffuseMaterial{ Color(0.5f) } });
    for (int i = 0; i < 12; ++i)
    {
        double angle = 2.0 * PI * i / 12.0;
        scene.objects.push_back({ Vector3(6.0 * std::cos(angle), 8.0, 6.0 * std::sin(angle)),
                                  0.5, EmissiveMaterial{} });
    }
    std::vector<uint32_t> lights = findLights(scene.objects);
    REQUIRE(lights.size() == 12);

    RNG rng(11);
    Ray down{ Vector3(0.0), Vector3(0.0, -1.0, 0.0) };
    for (int i = 0; i < 200; ++i)
    {
        Color c = rayColor(down, scene, lights, 3, 3, rng);
        REQUIRE(isFinite(c));
        REQUIRE(c.r >= 0.0f);
        REQUIRE(c.r <= 1.0f);
    }
}
