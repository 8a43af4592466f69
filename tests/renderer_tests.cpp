#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

#include <glm/glm.hpp>

#include "murk/core/context.hpp"
#include "murk/core/log.hpp"
#include "murk/frame/frame_params_env.hpp"
#include "murk/gfx/image_io.hpp"
#include "murk/job/thread_pool_job_system.hpp"
#include "murk/lighting/shadow_sample.hpp"
#include "murk/passes/pass_shadow_cube.hpp"
#include "murk/renderer/renderer.hpp"
#include "murk/resources/primitives.hpp"
#include "murk/scene/demo_scene.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    murk::FrameParams small_frame(int w, int h)
    {
        murk::FrameParams fp{};
        fp.w = w;
        fp.h = h;
        fp.time = 1.0f;
        fp.pass.shadow.map_size = 64;
        fp.pass.fog.fog.steps = 16;
        fp.pass.fog.fog.light_steps = 4;
        return fp;
    }

    bool any_lit(const murk::RT_ColorLDR& ldr)
    {
        for (const murk::Color& c : ldr.color.data)
        {
            if (c.r > 0 || c.g > 0 || c.b > 0) return true;
        }
        return false;
    }

    bool same_image(const murk::RT_ColorLDR& a, const murk::RT_ColorLDR& b)
    {
        if (a.w != b.w || a.h != b.h) return false;
        for (size_t i = 0; i < a.color.data.size(); ++i)
        {
            const murk::Color& ca = a.color.data[i];
            const murk::Color& cb = b.color.data[i];
            if (ca.r != cb.r || ca.g != cb.g || ca.b != cb.b) return false;
        }
        return true;
    }

    bool test_demo_scene_frame()
    {
        murk::FrameParams fp = small_frame(64, 36);
        murk::Scene scene = murk::make_demo_scene(fp.w, fp.h);
        murk::animate_point_light(scene.light, fp.time);

        murk::ThreadPoolJobSystem jobs{2};
        murk::Context ctx{};
        ctx.job_system = &jobs;
        murk::Renderer renderer{};

        const murk::Status st = renderer.render_frame(ctx, scene, fp);
        if (!st.ok) return false;
        if (ctx.frame_index != 1) return false;
        if (ctx.debug.tri_input == 0 || ctx.debug.tri_raster == 0) return false;
        if (renderer.output().w != 64 || renderer.output().h != 36) return false;
        if (!any_lit(renderer.output())) return false;

        // Geometry гүнийг бичсэн байх ёстой.
        bool wrote_depth = false;
        for (float d : renderer.targets().depth.depth.data)
        {
            if (d < 1.0f) wrote_depth = true;
        }
        if (!wrote_depth) return false;

        // Сүүдрийн cube-ийн ядаж нэг face-д гүн бичигдэнэ.
        bool wrote_shadow = false;
        for (const auto& layer : renderer.targets().shadow.layers)
        {
            for (float d : layer.data)
            {
                if (d < 1.0f) wrote_shadow = true;
            }
        }
        return wrote_shadow && renderer.frame_uniforms().globals.use_shadowmaps == 1u;
    }

    bool test_pass_toggles_change_output()
    {
        murk::FrameParams fp = small_frame(48, 32);
        murk::Scene scene = murk::make_demo_scene(fp.w, fp.h);
        murk::animate_point_light(scene.light, fp.time);

        murk::Context ctx{};
        murk::Renderer renderer{};
        if (!renderer.render_frame(ctx, scene, fp).ok) return false;
        const murk::RT_ColorLDR with_fog = renderer.output();

        murk::FrameParams no_fog = fp;
        no_fog.pass.fog.enable = false;
        if (!renderer.render_frame(ctx, scene, no_fog).ok) return false;
        const murk::RT_ColorLDR without_fog = renderer.output();
        if (same_image(with_fog, without_fog)) return false;
        if (ctx.debug.ms_fog != 0.0f) return false;

        murk::FrameParams no_shadow = no_fog;
        no_shadow.pass.shadow.enable = false;
        if (!renderer.render_frame(ctx, scene, no_shadow).ok) return false;
        if (renderer.frame_uniforms().globals.use_shadowmaps != 0u) return false;
        // Багануудын сүүдэр алга болж зураг өөрчлөгдөнө.
        if (same_image(without_fog, renderer.output())) return false;

        // Ижил оролт ижил зураг гаргана.
        if (!renderer.render_frame(ctx, scene, fp).ok) return false;
        return same_image(with_fog, renderer.output()) && ctx.frame_index == 4;
    }

    /*
        Face бүрийн тэнхлэг дээр гэрлээс 50 зайд нимгэн хавтан тавьж shadow pass-аар
        гүнийг бичээд, 100 зайд байгаа цэгүүдийн харагдах байдлыг уншина.
        Хавтан хажуугийн хоёр тэнхлэгийн зөвхөн эерэг талд байгаа тул u эсвэл v
        тэнхлэг урвуу болбол сүүдэр эсрэг талд буух ба шалгалт унана.
    */
    bool test_shadow_pass_occludes_each_face()
    {
        const glm::vec3 light_pos{5.0f, -7.0f, 3.0f};
        const glm::vec3 axes[murk::k_cube_face_count] = {
            {1.0f, 0.0f, 0.0f}, {-1.0f, 0.0f, 0.0f},
            {0.0f, 1.0f, 0.0f}, {0.0f, -1.0f, 0.0f},
            {0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, -1.0f},
        };

        for (int face = 0; face < murk::k_cube_face_count; ++face)
        {
            const glm::vec3 d = axes[face];
            const glm::vec3 a = (face < 2) ? glm::vec3(0.0f, 1.0f, 0.0f) : glm::vec3(1.0f, 0.0f, 0.0f);
            const glm::vec3 b = glm::cross(d, a);

            // Lateral [0, 20] x [0, 20], гэрлээс 49.5..50.5 зайд.
            murk::Transform xf{};
            xf.position = light_pos + d * 50.0f + a * 10.0f + b * 10.0f;
            const glm::vec3 size = glm::abs(a) * 20.0f + glm::abs(b) * 20.0f + glm::abs(d);

            murk::RenderObject blocker{};
            blocker.model = murk::make_single_mesh_model(
                "blocker",
                murk::make_box(murk::BoxDesc{size, 1}),
                murk::make_flat_material("blocker", murk::Color{255, 255, 255, 255}, 0.5f, 0.0f));
            blocker.instances.push_back(xf.to_instance());

            murk::Scene scene{};
            scene.light.position = light_pos;
            scene.geometry.push_back(std::move(blocker));

            murk::FrameParams fp = small_frame(8, 8);
            const murk::FrameUniforms frame = murk::build_frame_uniforms(scene, fp);
            murk::RT_ShadowCube cube{fp.pass.shadow.map_size};

            murk::Context ctx{};
            murk::PassShadowCube pass{};
            pass.execute(ctx, murk::PassShadowCube::Inputs{&scene, &fp, &frame, &cube});
            if (ctx.debug.tri_raster == 0) return false;

            const auto visibility = [&](const glm::vec3& lateral) {
                return murk::sample_direct_light(frame.globals, frame.light, &cube, light_pos + d * 100.0f + lateral);
            };

            // Хавтангийн ард, хажууд, ирмэг дээр.
            if (!approx_eq(visibility(a * 20.0f + b * 20.0f), 0.0f)) return false;
            if (!approx_eq(visibility(a * -20.0f + b * -20.0f), 1.0f)) return false;
            const float edge = visibility(b * 20.0f);
            if (!(edge > 0.0f && edge < 1.0f)) return false;
        }
        return true;
    }

    bool test_invalid_targets_are_reported()
    {
        murk::Renderer renderer{};
        murk::Context ctx{};
        murk::Scene scene = murk::make_demo_scene(8, 8);

        murk::FrameParams bad = small_frame(0, 8);
        const murk::Status st = renderer.render_frame(ctx, scene, bad);
        if (st.ok || st.error.empty()) return false;
        if (ctx.frame_index != 0) return false;

        return !renderer.ensure_targets(8, 8, 0).ok && renderer.ensure_targets(8, 8, 16).ok;
    }

    bool test_env_overrides()
    {
        ::setenv("MURK_SHADOWS", "off", 1);
        ::setenv("MURK_FOG_STEPS", "12", 1);
        ::setenv("MURK_FOG_SELF_SHADOW", "0", 1);
        ::setenv("MURK_SHADOW_MAP_SIZE", "4", 1);
        ::setenv("MURK_FOG", "maybe", 1);

        murk::FrameParams fp{};
        murk::apply_env_overrides(fp);

        ::unsetenv("MURK_SHADOWS");
        ::unsetenv("MURK_FOG_STEPS");
        ::unsetenv("MURK_FOG_SELF_SHADOW");
        ::unsetenv("MURK_SHADOW_MAP_SIZE");
        ::unsetenv("MURK_FOG");

        return !fp.pass.shadow.enable &&
               fp.pass.fog.fog.steps == 12 &&
               !fp.pass.fog.fog.self_shadowing &&
               fp.pass.shadow.map_size == 16 &&
               fp.pass.fog.enable;
    }

    bool test_ppm_capture()
    {
        murk::RT_ColorLDR ldr{3, 2, murk::Color{10, 20, 30, 255}};
        ldr.color.at(2, 1) = murk::Color{200, 100, 50, 255};

        const std::string path = "murk_test_capture.ppm";
        if (!murk::write_ldr_to_ppm(path, ldr).ok) return false;

        std::ifstream in(path, std::ios::binary);
        std::string magic;
        int w = 0, h = 0, maxv = 0;
        in >> magic >> w >> h >> maxv;
        in.get();
        std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        in.close();
        std::remove(path.c_str());

        if (magic != "P6" || w != 3 || h != 2 || maxv != 255) return false;
        if (body.size() != 18) return false;
        if ((unsigned char)body[0] != 10 || (unsigned char)body[2] != 30) return false;
        if ((unsigned char)body[15] != 200 || (unsigned char)body[17] != 50) return false;

        return !murk::write_ldr_to_ppm(path, murk::RT_ColorLDR{}).ok;
    }
}

int main()
{
    murk::set_log_level(murk::LogLevel::Silent);

    const bool ok_frame = test_demo_scene_frame();
    const bool ok_toggles = test_pass_toggles_change_output();
    const bool ok_shadow = test_shadow_pass_occludes_each_face();
    const bool ok_invalid = test_invalid_targets_are_reported();
    const bool ok_env = test_env_overrides();
    const bool ok_ppm = test_ppm_capture();

    if (!ok_frame) std::fprintf(stderr, "[murk-tests] demo scene frame failed\n");
    if (!ok_toggles) std::fprintf(stderr, "[murk-tests] pass toggles failed\n");
    if (!ok_shadow) std::fprintf(stderr, "[murk-tests] shadow cube occlusion failed\n");
    if (!ok_invalid) std::fprintf(stderr, "[murk-tests] invalid target reporting failed\n");
    if (!ok_env) std::fprintf(stderr, "[murk-tests] env overrides failed\n");
    if (!ok_ppm) std::fprintf(stderr, "[murk-tests] ppm capture failed\n");

    if (!(ok_frame && ok_toggles && ok_shadow && ok_invalid && ok_env && ok_ppm)) return 1;
    std::fprintf(stderr, "[murk-tests] renderer: all tests passed\n");
    return 0;
}
