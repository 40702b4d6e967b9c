#pragma once

#include <lumen/scene/scene.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lumen
{

// Renders a Scene into a packed RGB8 buffer (row-major, top row first).
// The image is split into contiguous row bands, one per worker thread; each
// worker owns its RNG and its rows, and render() joins all of them.
class CPURaytracer
{
public:
    // 0 = one worker per hardware thread.
    void setThreadCount(uint32_t count) { m_threadCount = count; }
    uint32_t getThreadCount() const { return m_threadCount; }

    void setSeed(uint32_t seed) { m_seed = seed; }
    uint32_t getSeed() const { return m_seed; }

    // Returns false (and leaves the buffer empty) for a zero-sized image.
    bool render(const Scene& scene);

    // render() followed by writePNG().
    bool renderToFile(const std::string& path, const Scene& scene);

    const std::vector<uint8_t>& getPixelBuffer() const { return m_pixelBuffer; }

    uint32_t getWidth()  const { return m_width; }
    uint32_t getHeight() const { return m_height; }
    uint32_t getFrameCount() const { return m_frameCount; }
    double   getLastFrameMs() const { return m_lastFrameMs; }

    // Bands as [startRow, endRow) pairs; the first height % workers bands get
    // one extra row.
    static std::vector<std::pair<uint32_t, uint32_t>> partitionRows(uint32_t height,
                                                                    uint32_t workers);

private:
    void renderRows(const Scene& scene, const std::vector<uint32_t>& lights,
                    uint32_t startRow, uint32_t endRow, uint32_t seed);

    std::vector<uint8_t> m_pixelBuffer;
    uint32_t m_width = 0, m_height = 0;
    uint32_t m_threadCount = 0;
    uint32_t m_seed = 0;
    uint32_t m_frameCount = 0;
    double m_lastFrameMs = 0.0;
};

} // namespace lumen
