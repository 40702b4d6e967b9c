#include "app.h"

#include <lumen/core/log.h>
#include <lumen/scene/demo_scenes.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

static void printUsage()
{
    std::cout << "Usage: lumen <scene.json | --demo NAME> <output.png> [options]\n"
              << "  --demo <NAME>       Built-in scene instead of a file (";
    for (const auto& name : lumen::demoSceneNames())
        std::cout << " " << name;
    std::cout << " )\n"
              << "  --width <W>         Override image width\n"
              << "  --height <H>        Override image height\n"
              << "  --samples <N>       Override samples per pixel\n"
              << "  --max-depth <D>     Override bounce limit\n"
              << "  --threads <T>       Worker threads (default: all cores)\n"
              << "  --frames <N>        Render N frames as <output>_000.png ...\n"
              << "  --seed <S>          Random seed\n";
}

static bool parseUInt(const std::string& flag, const std::string& value, uint32_t& out)
{
    try
    {
        size_t pos = 0;
        unsigned long v = std::stoul(value, &pos);
        if (pos != value.size() || v > UINT32_MAX)
            throw std::out_of_range(value);
        out = static_cast<uint32_t>(v);
        return true;
    }
    catch (const std::exception&)
    {
        lumen::Log::error("Invalid value for " + flag + ": " + value);
        return false;
    }
}

static std::optional<lumen::RenderConfig> parseArgs(int argc, char* argv[])
{
    lumen::RenderConfig config;
    std::vector<std::string> positional;

    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();
        uint32_t value = 0;

        if (arg == "--help")
        {
            printUsage();
            std::exit(0);
        }
        else if (arg == "--demo" && hasValue)
            config.demoScene = args[++i];
        else if (arg == "--width" && hasValue)
        {
            if (!parseUInt(arg, args[++i], value)) return std::nullopt;
            config.width = value;
        }
        else if (arg == "--height" && hasValue)
        {
            if (!parseUInt(arg, args[++i], value)) return std::nullopt;
            config.height = value;
        }
        else if (arg == "--samples" && hasValue)
        {
            if (!parseUInt(arg, args[++i], value)) return std::nullopt;
            config.samplesPerPixel = value;
        }
        else if (arg == "--max-depth" && hasValue)
        {
            if (!parseUInt(arg, args[++i], value)) return std::nullopt;
            config.maxDepth = value;
        }
        else if (arg == "--threads" && hasValue)
        {
            if (!parseUInt(arg, args[++i], config.threads)) return std::nullopt;
        }
        else if (arg == "--frames" && hasValue)
        {
            if (!parseUInt(arg, args[++i], config.frames)) return std::nullopt;
        }
        else if (arg == "--seed" && hasValue)
        {
            if (!parseUInt(arg, args[++i], config.seed)) return std::nullopt;
        }
        else if (arg.rfind("--", 0) == 0)
        {
            lumen::Log::error("Unknown or incomplete option: " + arg);
            return std::nullopt;
        }
        else
            positional.push_back(arg);
    }

    size_t expected = config.demoScene.empty() ? 2 : 1;
    if (positional.size() != expected)
    {
        printUsage();
        return std::nullopt;
    }

    if (config.demoScene.empty())
        config.scenePath = positional[0];
    config.outputPath = positional.back();
    return config;
}

int main(int argc, char* argv[])
{
    auto config = parseArgs(argc, argv);
    if (!config)
        return EXIT_FAILURE;

    App app;
    if (!app.init(*config))
        return EXIT_FAILURE;

    return app.run() ? EXIT_SUCCESS : EXIT_FAILURE;
}
