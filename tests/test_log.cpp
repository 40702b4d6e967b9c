#include <catch2/catch.hpp>
#include <lumen/core/log.h>
#include <lumen/raytracing/cpu_raytracer.h>

#include <thread>
#include <vector>

using namespace lumen;

TEST_CASE("Log records entries with their level", "[log]")
{
    Log::clear();
    Log::info("starting");
    Log::warn("low sample count");
    Log::error("disk full");

    auto entries = Log::getEntries();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].level == Log::Level::Info);
    REQUIRE(entries[0].message == "starting");
    REQUIRE(entries[1].level == Log::Level::Warn);
    REQUIRE(entries[2].level == Log::Level::Error);
    REQUIRE(entries[2].message == "disk full");
    REQUIRE(entries[0].timestamp <= entries[2].timestamp);

    Log::clear();
    REQUIRE(Log::getEntries().empty());
}

TEST_CASE("Log is safe to use from several threads", "[log]")
{
    Log::clear();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([t]()
        {
            for (int i = 0; i < 50; ++i)
                Log::info("worker " + std::to_string(t));
        });
    }
    for (auto& t : threads)
        t.join();

    REQUIRE(Log::getEntries().size() == 200);
    Log::clear();
}

TEST_CASE("Render failures are reported through the log", "[log]")
{
    Log::clear();

    Scene scene;
    scene.width = 0;
    CPURaytracer tracer;
    REQUIRE_FALSE(tracer.render(scene));

    auto entries = Log::getEntries();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].level == Log::Level::Error);
    Log::clear();
}
