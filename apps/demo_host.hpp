#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: demo_host.hpp
    МОДУЛЬ: apps
    ЗОРИЛГО: Demo программуудын нийтлэг командын мөрийн сонголт ба цонхгүй
            рендерийн давталт (N фрэйм рендерлээд PPM бичих).
*/


#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <murk/core/context.hpp>
#include <murk/core/log.hpp>
#include <murk/frame/frame_params.hpp>
#include <murk/gfx/image_io.hpp>
#include <murk/job/thread_pool_job_system.hpp>
#include <murk/renderer/renderer.hpp>
#include <murk/scene/demo_scene.hpp>

namespace demo
{
    struct DemoOptions
    {
        int width = 640;
        int height = 360;
        int scale = 2;
        float start_time = 0.0f;
        int frames = 1;
        size_t threads = 0;
        std::string capture_path{};
        bool no_window = false;
        bool animate = true;
    };

    inline DemoOptions parse_demo_options(int argc, char* argv[])
    {
        DemoOptions o{};
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i] ? argv[i] : "";
            if (arg == "--width" && i + 1 < argc)
            {
                o.width = std::max(16, std::atoi(argv[++i]));
            }
            else if (arg == "--height" && i + 1 < argc)
            {
                o.height = std::max(16, std::atoi(argv[++i]));
            }
            else if (arg == "--scale" && i + 1 < argc)
            {
                o.scale = std::clamp(std::atoi(argv[++i]), 1, 4);
            }
            else if (arg == "--time" && i + 1 < argc)
            {
                o.start_time = (float)std::atof(argv[++i]);
            }
            else if (arg == "--frames" && i + 1 < argc)
            {
                o.frames = std::max(1, std::atoi(argv[++i]));
            }
            else if (arg == "--threads" && i + 1 < argc)
            {
                o.threads = (size_t)std::max(0, std::atoi(argv[++i]));
            }
            else if (arg == "--capture" && i + 1 < argc)
            {
                o.capture_path = argv[++i];
            }
            else if (arg == "--no-window")
            {
                o.no_window = true;
            }
            else if (arg == "--static-light")
            {
                o.animate = false;
            }
            else
            {
                murk::log_warn("unknown argument: " + arg);
            }
        }
        return o;
    }

    inline std::string describe(const murk::FrameParams& fp)
    {
        const auto on_off = [](bool b) { return b ? "on" : "off"; };
        return std::to_string(fp.w) + "x" + std::to_string(fp.h)
            + " shadows=" + on_off(fp.pass.shadow.enable)
            + " fog=" + on_off(fp.pass.fog.enable)
            + " fog_self_shadow=" + on_off(fp.pass.fog.fog.self_shadowing)
            + " fog_depth_gating=" + on_off(fp.pass.fog.fog.depth_gating)
            + " fog_blend_in=" + on_off(fp.pass.fog.fog.blend_in)
            + " gizmo=" + on_off(fp.pass.light_gizmo.enable);
    }

    // Буцах код: 0 амжилттай, 1 рендер алдаа, 2 capture бичих алдаа.
    inline int run_headless(const DemoOptions& opt, murk::FrameParams fp)
    {
        const std::string capture = opt.capture_path.empty() ? std::string("murk_capture.ppm") : opt.capture_path;

        murk::ThreadPoolJobSystem jobs{opt.threads};
        murk::Context ctx{};
        ctx.job_system = &jobs;

        murk::Scene scene = murk::make_demo_scene(fp.w, fp.h);
        murk::Renderer renderer{};

        const float dt = 1.0f / 60.0f;
        for (int f = 0; f < opt.frames; ++f)
        {
            fp.dt = dt;
            fp.time = opt.start_time + dt * (float)f;
            if (opt.animate) murk::animate_point_light(scene.light, fp.time);

            const murk::Status st = renderer.render_frame(ctx, scene, fp);
            if (!st.ok)
            {
                murk::log_error("render failed: " + st.error);
                return 1;
            }
        }

        const murk::Status ws = murk::write_ldr_to_ppm(capture, renderer.output());
        if (!ws.ok)
        {
            murk::log_error("capture failed: " + ws.error);
            return 2;
        }

        char stats[192];
        std::snprintf(stats, sizeof(stats), "shadow=%.1fms pbr=%.1fms fog=%.1fms resolve=%.1fms tris=%llu",
            ctx.debug.ms_shadow, ctx.debug.ms_pbr, ctx.debug.ms_fog, ctx.debug.ms_resolve,
            (unsigned long long)ctx.debug.tri_raster);
        murk::log_info(std::string("last frame: ") + stats);
        murk::log_info("wrote " + capture);
        return 0;
    }
}
