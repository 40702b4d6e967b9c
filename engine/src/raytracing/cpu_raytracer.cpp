#include <lumen/raytracing/cpu_raytracer.h>
#include <lumen/raytracing/integrator.h>
#include <lumen/image/image_io.h>
#include <lumen/core/log.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <thread>

namespace lumen
{

std::vector<std::pair<uint32_t, uint32_t>> CPURaytracer::partitionRows(uint32_t height,
                                                                       uint32_t workers)
{
    std::vector<std::pair<uint32_t, uint32_t>> bands;
    if (height == 0)
        return bands;

    workers = std::clamp(workers, 1u, height);
    uint32_t rowsPerBand = height / workers;
    uint32_t remainder = height % workers;

    uint32_t startRow = 0;
    for (uint32_t i = 0; i < workers; ++i)
    {
        uint32_t endRow = startRow + rowsPerBand + (i < remainder ? 1 : 0);
        bands.emplace_back(startRow, endRow);
        startRow = endRow;
    }
    return bands;
}

void CPURaytracer::renderRows(const Scene& scene, const std::vector<uint32_t>& lights,
                              uint32_t startRow, uint32_t endRow, uint32_t seed)
{
    RNG rng(seed);

    const double w = static_cast<double>(m_width);
    const double h = static_cast<double>(m_height);
    // Single-pixel images would divide by zero
    const double uDenom = std::max(w - 1.0, 1.0);
    const double vDenom = std::max(h - 1.0, 1.0);

    const int maxDepth = static_cast<int>(scene.maxDepth);
    const uint32_t samples = scene.samplesPerPixel;
    const float scale = samples > 0 ? 1.0f / static_cast<float>(samples) : 0.0f;

    for (uint32_t y = startRow; y < endRow; ++y)
    {
        uint8_t* row = m_pixelBuffer.data() + static_cast<size_t>(y) * m_width * 3;
        for (uint32_t x = 0; x < m_width; ++x)
        {
            Color sum(0.0f);
            for (uint32_t s = 0; s < samples; ++s)
            {
                double u = (static_cast<double>(x) + rng.nextDouble()) / uDenom;
                double v = (h - (static_cast<double>(y) + rng.nextDouble())) / vDenom;
                Ray ray = scene.camera.getRay(u, v);
                sum += rayColor(ray, scene, lights, maxDepth, maxDepth, rng);
            }

            // sqrt = gamma 2
            Color c = clamp01(Color(std::sqrt(sum.r * scale),
                                    std::sqrt(sum.g * scale),
                                    std::sqrt(sum.b * scale)));

            row[x * 3]     = static_cast<uint8_t>(std::lround(c.r * 255.0f));
            row[x * 3 + 1] = static_cast<uint8_t>(std::lround(c.g * 255.0f));
            row[x * 3 + 2] = static_cast<uint8_t>(std::lround(c.b * 255.0f));
        }
    }
}

bool CPURaytracer::render(const Scene& scene)
{
    m_width = scene.width;
    m_height = scene.height;
    m_pixelBuffer.clear();

    if (m_width == 0 || m_height == 0)
    {
        Log::error("Cannot render a " + std::to_string(m_width) + "x" +
                   std::to_string(m_height) + " image");
        return false;
    }
    if (scene.samplesPerPixel == 0)
        Log::warn("samples_per_pixel is 0, the image will be black");

    m_pixelBuffer.assign(static_cast<size_t>(m_width) * m_height * 3, 0);

    const std::vector<uint32_t> lights = findLights(scene.objects);

    uint32_t workers = m_threadCount > 0
        ? m_threadCount
        : std::max(1u, std::thread::hardware_concurrency());
    auto bands = partitionRows(m_height, workers);

    uint32_t frameSeed = hash(m_seed) ^ hash(m_frameCount * 0x9e3779b9u + 1u);

    auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> threads;
    threads.reserve(bands.size());
    for (const auto& band : bands)
    {
        uint32_t seed = frameSeed ^ hash(band.first + 0x68e31da4u);
        threads.emplace_back(&CPURaytracer::renderRows, this, std::cref(scene),
                             std::cref(lights), band.first, band.second, seed);
    }

    for (auto& t : threads)
        t.join();

    auto end = std::chrono::steady_clock::now();
    m_lastFrameMs = std::chrono::duration<double, std::milli>(end - start).count();
    ++m_frameCount;

    Log::info("Frame time: " + std::to_string(static_cast<long long>(m_lastFrameMs)) +
              "ms (" + std::to_string(m_width) + "x" + std::to_string(m_height) + ", " +
              std::to_string(scene.samplesPerPixel) + " spp, " +
              std::to_string(bands.size()) + " bands, " +
              std::to_string(lights.size()) + " lights)");
    return true;
}

bool CPURaytracer::renderToFile(const std::string& path, const Scene& scene)
{
    if (!render(scene))
        return false;
    return writePNG(path, m_pixelBuffer, m_width, m_height);
}

} // namespace lumen
