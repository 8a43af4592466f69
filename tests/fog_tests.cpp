#include <cmath>
#include <cstdio>
#include <optional>

#include <glm/glm.hpp>

#include "murk/camera/camera.hpp"
#include "murk/camera/convention.hpp"
#include "murk/lighting/fog_march.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    // Эх цэг дээр +X рүү харсан камер.
    murk::CameraUniform origin_camera()
    {
        murk::Camera cam{};
        cam.position = glm::vec3(0.0f);
        cam.projection.resize(64, 64);
        return murk::make_camera_uniform(cam, 64, 64);
    }

    float depth01_at_view_distance(const murk::CameraUniform& cam, float x)
    {
        const glm::vec4 clip = cam.proj * cam.view * glm::vec4(x, 0.0f, 0.0f, 1.0f);
        return murk::ndc_z_to_depth01(clip.z / clip.w);
    }

    bool test_linearize_depth_inverts_projection()
    {
        const murk::CameraUniform cam = origin_camera();
        if (!approx_eq(glm::dot(cam.forward(), glm::vec3(1.0f, 0.0f, 0.0f)), 1.0f)) return false;

        for (float x : {5.0f, 120.0f, 800.0f})
        {
            const float d = depth01_at_view_distance(cam, x);
            if (!approx_eq(murk::linearize_depth01(d, cam.znear(), cam.zfar()), x, x * 1e-3f)) return false;
        }
        return approx_eq(murk::linearize_depth01(0.0f, 1.0f, 3000.0f), 1.0f, 1e-3f) &&
               approx_eq(murk::linearize_depth01(1.0f, 1.0f, 3000.0f), 3000.0f, 1.0f);
    }

    bool test_depth_ceiling()
    {
        const murk::CameraUniform cam = origin_camera();
        murk::FogParams fp{};
        const glm::vec3 frag{100.0f, 0.0f, 0.0f};

        // Geometry байхгүй эсвэл gating унтраалттай бол бүрэн зай.
        if (!approx_eq(murk::fog_depth_ceiling(cam, frag, std::nullopt, fp), fp.max_distance)) return false;

        const float d300 = depth01_at_view_distance(cam, 300.0f);
        const float ceiling = murk::fog_depth_ceiling(cam, frag, d300, fp);
        if (!approx_eq(ceiling, 200.0f, 0.5f)) return false;

        // Geometry фрагментээс өмнө байвал сөрөг.
        const float d50 = depth01_at_view_distance(cam, 50.0f);
        if (!(murk::fog_depth_ceiling(cam, frag, d50, fp) < 0.0f)) return false;

        fp.depth_gating = false;
        return approx_eq(murk::fog_depth_ceiling(cam, frag, d50, fp), fp.max_distance);
    }

    bool test_march_bounds()
    {
        murk::FogParams fp{};
        const glm::vec3 origin{-200.0f, 30.0f, 10.0f};
        const glm::vec3 dir{1.0f, 0.0f, 0.0f};

        const murk::FogMarchResult none = murk::march_fog_density(origin, dir, -1.0f, 0.0f, fp);
        if (none.steps_taken != 0 || none.density != 0.0f || none.end_point != origin) return false;

        const murk::FogMarchResult full = murk::march_fog_density(origin, dir, fp.max_distance, 2.0f, fp);
        if (full.density < 0.0f || full.density > 1.0f) return false;
        if (full.steps_taken < 1 || full.steps_taken > fp.steps) return false;

        // Ceiling-ийн дараах алхам тооцогдохгүй.
        const float step_len = fp.max_distance / (float)fp.steps;
        const murk::FogMarchResult short_run = murk::march_fog_density(origin, dir, step_len * 2.5f, 2.0f, fp);
        if (short_run.steps_taken > 3) return false;
        if (glm::length(short_run.end_point - origin) > step_len * 2.5f + 1e-3f) return false;

        // Нягт хэзээ ч 1-ээс хэтрэхгүй.
        murk::FogParams thick = fp;
        thick.total_density = 1e5f;
        thick.blend_in = false;
        const murk::FogMarchResult sat = murk::march_fog_density(origin, dir, thick.max_distance, 2.0f, thick);
        return sat.density >= 0.0f && sat.density <= 1.0f;
    }

    bool test_blend_in_ramps_first_sample()
    {
        murk::FogParams fp{};
        fp.blend_in = true;
        const glm::vec3 origin{10.0f, 20.0f, 30.0f};
        // Эхний алхамын жин 0 тул зөвхөн нэг алхам хийвэл нягт 0.
        const murk::FogMarchResult first = murk::march_fog_density(origin, glm::vec3(0.0f, 0.0f, 1.0f), 0.0f, 0.0f, fp);
        return first.steps_taken == 1 && first.density == 0.0f;
    }

    bool test_light_occlusion_range()
    {
        murk::FogParams fp{};
        const glm::vec3 p{0.0f, 30.0f, 0.0f};
        if (murk::march_light_occlusion(p, p, 0.0f, fp) != 0.0f) return false;

        for (int i = 0; i < 16; ++i)
        {
            const glm::vec3 light{(float)i * 40.0f - 300.0f, 250.0f, 20.0f};
            const float o = murk::march_light_occlusion(p, light, (float)i, fp);
            if (o < 0.0f || o > 1.0f) return false;
        }
        return true;
    }

    bool test_shade_fog_composition()
    {
        const murk::CameraUniform cam = origin_camera();
        murk::LightUniform light{};
        light.position = glm::vec3(400.0f, 250.0f, 0.0f);
        murk::GlobalUniforms globals{};
        globals.time = 1.5f;
        globals.use_shadowmaps = 0u;
        const murk::AttenuationCoeffs atten{};

        murk::FogParams fp{};
        fp.shadowed = false;
        const glm::vec3 frag{150.0f, 20.0f, 10.0f};

        // Фрагментийн ард шууд geometry
        const glm::vec3 dir = glm::normalize(frag);
        const float d_close = depth01_at_view_distance(cam, frag.x * 0.5f);
        if (murk::shade_fog(frag, cam, light, globals, d_close, nullptr, atten, fp) != glm::vec4(0.0f)) return false;

        const glm::vec4 c = murk::shade_fog(frag, cam, light, globals, std::nullopt, nullptr, atten, fp);
        const murk::FogMarchResult m = murk::march_fog_density(frag, dir, fp.max_distance, globals.time, fp);
        if (!approx_eq(c.a, m.density * fp.alpha_scale, 1e-4f)) return false;
        if (c.r < 0.0f || c.r >= 1.0f || c.g < 0.0f || c.g >= 1.0f || c.b < 0.0f || c.b >= 1.0f) return false;

        // Өөрийн сүүдэргүй хувилбар хэзээ ч бараан болохгүй.
        murk::FogParams lit = fp;
        lit.self_shadowing = false;
        const glm::vec4 c_lit = murk::shade_fog(frag, cam, light, globals, std::nullopt, nullptr, atten, lit);
        return c_lit.r + 1e-6f >= c.r && c_lit.g + 1e-6f >= c.g && c_lit.b + 1e-6f >= c.b &&
               approx_eq(c_lit.a, c.a, 1e-6f);
    }
}

int main()
{
    const bool ok_linearize = test_linearize_depth_inverts_projection();
    const bool ok_ceiling = test_depth_ceiling();
    const bool ok_bounds = test_march_bounds();
    const bool ok_ramp = test_blend_in_ramps_first_sample();
    const bool ok_occlusion = test_light_occlusion_range();
    const bool ok_shade = test_shade_fog_composition();

    if (!ok_linearize) std::fprintf(stderr, "[murk-tests] depth linearization failed\n");
    if (!ok_ceiling) std::fprintf(stderr, "[murk-tests] fog depth ceiling failed\n");
    if (!ok_bounds) std::fprintf(stderr, "[murk-tests] fog march bounds failed\n");
    if (!ok_ramp) std::fprintf(stderr, "[murk-tests] fog blend-in ramp failed\n");
    if (!ok_occlusion) std::fprintf(stderr, "[murk-tests] fog light occlusion failed\n");
    if (!ok_shade) std::fprintf(stderr, "[murk-tests] fog shading composition failed\n");

    if (!(ok_linearize && ok_ceiling && ok_bounds && ok_ramp && ok_occlusion && ok_shade)) return 1;
    std::fprintf(stderr, "[murk-tests] fog: all tests passed\n");
    return 0;
}
