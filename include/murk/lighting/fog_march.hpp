#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: fog_march.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Эзэлхүүнт манангийн ray march: харах цацрагийн дагуух нягт, гэрэл
            рүү чиглэсэн хоёр дахь march (өөрийн сүүдэр), geometry-ийн гүнээр
            хязгаарлах, эцсийн өнгө ба alpha.
*/


#include <algorithm>
#include <cmath>
#include <optional>

#include <glm/glm.hpp>

#include "murk/camera/convention.hpp"
#include "murk/lighting/point_light.hpp"
#include "murk/lighting/shadow_sample.hpp"
#include "murk/math/noise.hpp"
#include "murk/math/tonemap.hpp"
#include "murk/shader/uniforms.hpp"

namespace murk
{
    /*
        Fog pass-ийн тохиргоо. Хувилбарууд (гүнээр хязгаарлах, өөрийн сүүдэр,
        ойрын хэсэгт аажмаар нягтрах, cube shadow) нь тусдаа shader биш, энд
        flag-аар сонгогдоно.
    */
    struct FogParams
    {
        bool depth_gating = true;
        bool self_shadowing = true;
        bool blend_in = true;
        bool shadowed = true;

        // Үндсэн march
        float max_distance = 1200.0f;
        int steps = 48;
        int blend_steps = 8;
        float total_density = 2.5f;
        float noise_scale = 0.004f;
        glm::vec3 wind{12.0f, 0.0f, 4.0f}; // world нэгж / секунд

        // Гэрэл рүү чиглэсэн march
        int light_steps = 8;
        float light_density = 1.5f;
        float light_max_distance = 300.0f;

        glm::vec3 ambient_thin{0.010f, 0.010f, 0.012f};
        glm::vec3 ambient_dense{0.060f, 0.060f, 0.065f};
        float alpha_scale = 0.85f;
    };

    struct FogMarchResult
    {
        float density = 0.0f;
        glm::vec3 end_point{0.0f};
        int steps_taken = 0;
    };

    inline float fog_noise_density(const glm::vec3& p, float time, const FogParams& fp)
    {
        return fbm(p * fp.noise_scale + fp.wind * (time * fp.noise_scale));
    }

    /*
        Камер ба фрагментийн хоорондох зайг хассан, geometry хүртэлх зай.
        scene_depth01 байхгүй эсвэл depth_gating унтраалттай бол max_distance.
    */
    inline float fog_depth_ceiling(
        const CameraUniform& cam,
        const glm::vec3& frag_ws,
        std::optional<float> scene_depth01,
        const FogParams& fp
    )
    {
        if (!fp.depth_gating || !scene_depth01.has_value()) return fp.max_distance;

        const glm::vec3 to_frag = frag_ws - glm::vec3(cam.position);
        const float frag_dist = glm::length(to_frag);
        if (frag_dist <= 1e-6f) return fp.max_distance;

        const glm::vec3 dir = to_frag / frag_dist;
        const float view_z = linearize_depth01(*scene_depth01, cam.znear(), cam.zfar());
        const float cos_fwd = glm::dot(dir, cam.forward());
        if (cos_fwd <= 1e-4f) return fp.max_distance;

        const float geometry_dist = view_z / cos_fwd;
        return std::min(fp.max_distance, geometry_dist - frag_dist);
    }

    inline FogMarchResult march_fog_density(
        const glm::vec3& origin,
        const glm::vec3& dir,
        float max_fog_depth,
        float time,
        const FogParams& fp
    )
    {
        FogMarchResult r{};
        r.end_point = origin;
        const int steps = std::max(1, fp.steps);
        const float step_len = fp.max_distance / (float)steps;
        const float per_step = fp.total_density / (float)steps;

        for (int i = 0; i < steps; ++i)
        {
            const float t = step_len * (float)i;
            if (t > max_fog_depth) break;

            const glm::vec3 p = origin + dir * t;
            float ramp = 1.0f;
            if (fp.blend_in && fp.blend_steps > 0)
            {
                ramp = std::min((float)i / (float)fp.blend_steps, 1.0f);
            }

            r.density += fog_noise_density(p, time, fp) * per_step * ramp;
            r.end_point = p;
            r.steps_taken = i + 1;
            if (r.density >= 1.0f)
            {
                r.density = 1.0f;
                break;
            }
        }
        return r;
    }

    // Гэрэл хүртэлх манангийн хаалт [0, 1].
    inline float march_light_occlusion(
        const glm::vec3& from,
        const glm::vec3& light_pos,
        float time,
        const FogParams& fp
    )
    {
        const glm::vec3 to_light = light_pos - from;
        const float dist = glm::length(to_light);
        if (dist <= 1e-6f) return 0.0f;

        const glm::vec3 dir = to_light / dist;
        const int steps = std::max(1, fp.light_steps);
        const float step_len = fp.light_max_distance / (float)steps;
        const float per_step = fp.light_density / (float)steps;

        float occlusion = 0.0f;
        for (int j = 1; j <= steps; ++j)
        {
            const float t = step_len * (float)j;
            if (t > dist) break;
            occlusion += fog_noise_density(from + dir * t, time, fp) * per_step;
            if (occlusion >= 1.0f) return 1.0f;
        }
        return occlusion;
    }

    /*
        Манангийн фрагментийн (rgb, alpha). max_fog_depth <= 0 үед (0, 0, 0, 0):
        фрагментийн ард шууд geometry байна.
    */
    inline glm::vec4 shade_fog(
        const glm::vec3& frag_ws,
        const CameraUniform& cam,
        const LightUniform& light,
        const GlobalUniforms& globals,
        std::optional<float> scene_depth01,
        const RT_ShadowCube* shadow,
        const AttenuationCoeffs& atten,
        const FogParams& fp
    )
    {
        const float max_fog_depth = fog_depth_ceiling(cam, frag_ws, scene_depth01, fp);
        if (max_fog_depth <= 0.0f) return glm::vec4(0.0f);

        const glm::vec3 to_frag = frag_ws - glm::vec3(cam.position);
        const float frag_dist = glm::length(to_frag);
        if (frag_dist <= 1e-6f) return glm::vec4(0.0f);
        const glm::vec3 dir = to_frag / frag_dist;

        const FogMarchResult m = march_fog_density(frag_ws, dir, max_fog_depth, globals.time, fp);

        float transmittance = 1.0f;
        if (fp.self_shadowing)
        {
            transmittance = 1.0f - std::min(march_light_occlusion(m.end_point, light.position, globals.time, fp), 1.0f);
        }

        float visibility = 1.0f;
        if (fp.shadowed)
        {
            visibility = sample_direct_light(globals, light, shadow, m.end_point);
        }

        const float light_dist = glm::length(light.position - m.end_point);
        const glm::vec3 ambient = glm::mix(fp.ambient_thin, fp.ambient_dense, m.density);
        const glm::vec3 direct = light.rgb() * light.intensity()
            * light_attenuation(light_dist, atten) * transmittance * visibility;

        return glm::vec4(reinhard(ambient + direct), m.density * fp.alpha_scale);
    }
}
