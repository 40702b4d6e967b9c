#include <catch2/catch.hpp>
#include <lumen/raytracing/cpu_raytracer.h>

#include <cmath>
#include <filesystem>
#include <vector>

using namespace lumen;

static Scene singleSphereScene(uint32_t size, uint32_t spp, uint32_t depth)
{
    Scene scene;
    scene.width = size;
    scene.height = size;
    scene.samplesPerPixel = spp;
    scene.maxDepth = depth;
    scene.sky = Sky::gradient();
    scene.camera = Camera(Vector3(0.0), Vector3(0.0, 0.0, -1.0), Vector3(0.0, 1.0, 0.0), 90.0, 1.0);
    scene.objects.push_back({ Vector3(0.0, 0.0, -1.0), 0.5, DiffuseMaterial{ Color(0.5f) } });
    return scene;
}

TEST_CASE("Rows are split into contiguous bands", "[renderer]")
{
    SECTION("Remainder goes to the first bands")
    {
        auto bands = CPURaytracer::partitionRows(10, 3);
        REQUIRE(bands.size() == 3);
        REQUIRE(bands[0] == std::make_pair(0u, 4u));
        REQUIRE(bands[1] == std::make_pair(4u, 7u));
        REQUIRE(bands[2] == std::make_pair(7u, 10u));
    }

    SECTION("More workers than rows")
    {
        auto bands = CPURaytracer::partitionRows(3, 8);
        REQUIRE(bands.size() == 3);
        for (uint32_t i = 0; i < 3; ++i)
        {
            REQUIRE(bands[i].first == i);
            REQUIRE(bands[i].second == i + 1);
        }
    }

    SECTION("Zero workers means one band")
    {
        auto bands = CPURaytracer::partitionRows(5, 0);
        REQUIRE(bands.size() == 1);
        REQUIRE(bands[0] == std::make_pair(0u, 5u));
    }

    SECTION("Empty image")
    {
        REQUIRE(CPURaytracer::partitionRows(0, 4).empty());
    }
}

TEST_CASE("Render fills a packed RGB buffer", "[renderer]")
{
    Scene scene = singleSphereScene(100, 1, 1);
    CPURaytracer tracer;
    tracer.setThreadCount(4);

    REQUIRE(tracer.render(scene));
    REQUIRE(tracer.getWidth() == 100);
    REQUIRE(tracer.getHeight() == 100);
    REQUIRE(tracer.getFrameCount() == 1);

    const auto& pixels = tracer.getPixelBuffer();
    REQUIRE(pixels.size() == 100 * 100 * 3);

    // With a depth of one the bounce off the sphere never reaches the sky
    size_t center = (50 * 100 + 50) * 3;
    REQUIRE(pixels[center] == 0);
    REQUIRE(pixels[center + 1] == 0);
    REQUIRE(pixels[center + 2] == 0);

    // Corners look past the sphere into the sky
    REQUIRE(pixels[0] > 0);
    REQUIRE(pixels[2] == 255);
}

TEST_CASE("Thread count does not change the image size", "[renderer]")
{
    Scene scene = singleSphereScene(17, 2, 3);
    for (uint32_t threads : { 1u, 2u, 5u, 17u, 64u })
    {
        CPURaytracer tracer;
        tracer.setThreadCount(threads);
        REQUIRE(tracer.render(scene));
        REQUIRE(tracer.getPixelBuffer().size() == 17 * 17 * 3);
    }
}

TEST_CASE("Zero-sized images are rejected", "[renderer]")
{
    Scene scene = singleSphereScene(10, 1, 1);
    scene.height = 0;

    CPURaytracer tracer;
    REQUIRE_FALSE(tracer.render(scene));
    REQUIRE(tracer.getPixelBuffer().empty());
    REQUIRE(tracer.getFrameCount() == 0);
}

TEST_CASE("Zero samples renders black", "[renderer]")
{
    Scene scene = singleSphereScene(4, 0, 5);
    CPURaytracer tracer;
    REQUIRE(tracer.render(scene));
    for (uint8_t value : tracer.getPixelBuffer())
        REQUIRE(value == 0);
}

static double meanPixelVariance(uint32_t spp)
{
    Scene scene = singleSphereScene(8, spp, 4);
    // a ground sphere gives the bounces something to land on
    scene.objects.push_back({ Vector3(0.0, -100.5, -1.0), 100.0, DiffuseMaterial{ Color(0.5f) } });

    const int renders = 20;
    const size_t count = 8 * 8 * 3;
    std::vector<double> sum(count, 0.0), sumSq(count, 0.0);

    CPURaytracer tracer;
    tracer.setThreadCount(2);
    tracer.setSeed(99);
    for (int i = 0; i < renders; ++i)
    {
        REQUIRE(tracer.render(scene));
        const auto& pixels = tracer.getPixelBuffer();
        for (size_t p = 0; p < count; ++p)
        {
            sum[p] += pixels[p];
            sumSq[p] += static_cast<double>(pixels[p]) * pixels[p];
        }
    }

    double total = 0.0;
    for (size_t p = 0; p < count; ++p)
    {
        double mean = sum[p] / renders;
        total += sumSq[p] / renders - mean * mean;
    }
    return total / count;
}

TEST_CASE("More samples reduce pixel noise", "[renderer]")
{
    double noisy = meanPixelVariance(1);
    double smooth = meanPixelVariance(16);
    REQUIRE(noisy > 0.0);
    REQUIRE(smooth < noisy);
}

TEST_CASE("Repeated renders use fresh random sequences", "[renderer]")
{
    Scene scene = singleSphereScene(16, 1, 4);
    CPURaytracer tracer;
    tracer.setSeed(5);

    REQUIRE(tracer.render(scene));
    std::vector<uint8_t> first = tracer.getPixelBuffer();
    REQUIRE(tracer.render(scene));
    REQUIRE(tracer.getFrameCount() == 2);
    REQUIRE(first != tracer.getPixelBuffer());
}

TEST_CASE("renderToFile writes a PNG", "[renderer]")
{
    Scene scene = singleSphereScene(12, 1, 2);
    CPURaytracer tracer;

    SECTION("Writable path")
    {
        auto path = std::filesystem::temp_directory_path() / "lumen_render_test.png";
        std::filesystem::remove(path);
        REQUIRE(tracer.renderToFile(path.string(), scene));
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(std::filesystem::file_size(path) > 0);
        std::filesystem::remove(path);
    }

    SECTION("Missing directory")
    {
        REQUIRE_FALSE(tracer.renderToFile("/nonexistent_lumen_dir/out.png", scene));
    }
}
