#pragma once

#include <lumen/core/render_config.h>
#include <lumen/raytracing/cpu_raytracer.h>
#include <lumen/scene/scene.h>

struct App
{
    bool init(const lumen::RenderConfig& config);
    bool run();

private:
    lumen::RenderConfig  m_config;
    lumen::Scene         m_scene;
    lumen::CPURaytracer  m_renderer;
};
