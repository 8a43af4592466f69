#define SDL_MAIN_HANDLED

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: hello_fog_pbr.cpp
    МОДУЛЬ: apps
    ЗОРИЛГО: Demo тайзыг SDL2 цонхонд бодит хугацаанд харуулна.
            F1 сүүдэр, F2 манан, F3 манангийн өөрийн сүүдэр, F4 гүнээр хязгаарлах,
            F5 гэрлийн gizmo, Space зогсоох, Esc гарах.
*/

#include <chrono>
#include <cmath>
#include <string>

#include <murk/core/context.hpp>
#include <murk/core/log.hpp>
#include <murk/frame/frame_params_env.hpp>
#include <murk/gfx/image_io.hpp>
#include <murk/job/thread_pool_job_system.hpp>
#include <murk/platform/sdl/sdl_presenter.hpp>
#include <murk/renderer/renderer.hpp>
#include <murk/scene/demo_scene.hpp>

#include "demo_host.hpp"

int main(int argc, char* argv[])
{
    const demo::DemoOptions opt = demo::parse_demo_options(argc, argv);

    murk::FrameParams fp{};
    fp.w = opt.width;
    fp.h = opt.height;
    murk::apply_env_overrides(fp);
    murk::log_info("viewer: " + demo::describe(fp));
    if (opt.no_window) return demo::run_headless(opt, fp);

    murk::SdlPresenter presenter{"murk | fog + pbr", fp.w, fp.h, opt.scale};
    if (!presenter.valid())
    {
        murk::log_error("SDL presenter: " + presenter.error());
        return 1;
    }

    murk::ThreadPoolJobSystem jobs{opt.threads};
    murk::Context ctx{};
    ctx.job_system = &jobs;

    murk::Scene scene = murk::make_demo_scene(fp.w, fp.h);
    murk::Renderer renderer{};

    using clock = std::chrono::steady_clock;
    auto last = clock::now();
    float time_s = opt.start_time;
    bool paused = !opt.animate;
    float title_accum = 0.0f;
    int title_frames = 0;

    bool running = true;
    while (running)
    {
        const auto now = clock::now();
        const float dt = std::chrono::duration<float>(now - last).count();
        last = now;

        const murk::ViewerInput in = presenter.pump_input();
        if (in.quit) running = false;
        if (in.toggle_shadows) fp.pass.shadow.enable = !fp.pass.shadow.enable;
        if (in.toggle_fog) fp.pass.fog.enable = !fp.pass.fog.enable;
        if (in.toggle_fog_self_shadow) fp.pass.fog.fog.self_shadowing = !fp.pass.fog.fog.self_shadowing;
        if (in.toggle_fog_depth_gating) fp.pass.fog.fog.depth_gating = !fp.pass.fog.fog.depth_gating;
        if (in.toggle_light_gizmo) fp.pass.light_gizmo.enable = !fp.pass.light_gizmo.enable;
        if (in.toggle_pause) paused = !paused;
        if (in.toggle_shadows || in.toggle_fog || in.toggle_fog_self_shadow || in.toggle_fog_depth_gating || in.toggle_light_gizmo)
        {
            murk::log_info("viewer: " + demo::describe(fp));
        }

        if (!paused) time_s += dt;
        fp.dt = dt;
        fp.time = time_s;
        murk::animate_point_light(scene.light, time_s);

        const murk::Status st = renderer.render_frame(ctx, scene, fp);
        if (!st.ok)
        {
            murk::log_error("render failed: " + st.error);
            return 1;
        }
        const murk::Status ps = presenter.present(renderer.output());
        if (!ps.ok) murk::log_warn("present: " + ps.error);

        title_accum += dt;
        ++title_frames;
        if (title_accum >= 0.5f)
        {
            const int fps = (int)std::lround((float)title_frames / title_accum);
            presenter.set_title(
                "murk | fps=" + std::to_string(fps)
                + " | frame=" + std::to_string((int)std::lround(ctx.debug.ms_total())) + "ms"
                + " | shadows=" + (fp.pass.shadow.enable ? "on" : "off")
                + " | fog=" + (fp.pass.fog.enable ? "on" : "off"));
            title_accum = 0.0f;
            title_frames = 0;
        }
    }

    if (!opt.capture_path.empty())
    {
        const murk::Status ws = murk::write_ldr_to_ppm(opt.capture_path, renderer.output());
        if (!ws.ok)
        {
            murk::log_error("capture failed: " + ws.error);
            return 2;
        }
        murk::log_info("wrote " + opt.capture_path);
    }
    return 0;
}
