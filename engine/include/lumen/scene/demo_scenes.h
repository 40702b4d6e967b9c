#pragma once

#include <lumen/scene/scene.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lumen
{

// One diffuse sphere of radius 0.5 at (0,0,-1) resting on a large ground
// sphere, under the gradient sky.
Scene makeBasicScene();

// Ground, a 22x22 grid of small random diffuse/metal/glass spheres and three
// large spheres. The layout is reproducible from seed.
Scene makeCoverScene(uint32_t seed);

// Metal floor, a large light, metal and diffuse spheres and a hollow glass
// bubble. No sky: all light comes from the emissive sphere.
Scene makeShowcaseScene();

// Looks up one of the scenes above by name ("basic", "cover", "showcase").
std::optional<Scene> makeDemoScene(const std::string& name, uint32_t seed = 0);

std::vector<std::string> demoSceneNames();

} // namespace lumen
