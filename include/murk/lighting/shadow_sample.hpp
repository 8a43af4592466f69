#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: shadow_sample.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Цэгэн гэрлийн cube сүүдрийн зураглалаас PCF-ээр харагдах байдлыг
            (visibility) тооцох, face сонголтын хурдан шалгуур, ambient үнэлгээ.
*/

#include <algorithm>
#include <array>
#include <cmath>

#include <glm/glm.hpp>

#include "murk/gfx/rt_shadow.hpp"
#include "murk/shader/uniforms.hpp"

namespace murk {

inline constexpr int   k_shadow_samples = 2;  // PCF offset -2..+2 хоёр тэнхлэгт
inline constexpr float k_inv_shadow_samples = 1.0f / 25.0f;
inline constexpr float k_shadow_depth_bias = 1e-6f;
inline constexpr float k_face_select_bias = 0.01f;
inline constexpr float k_ambient_base = 0.003f;
inline constexpr float k_ambient_bounce_scale = 0.03f;

// Cube face-ийн харах тэнхлэг ба 90 градусын frustum-ийн хил.
struct CubeFaceInfo {
    int   axis = 0;        // 0 = x, 1 = y, 2 = z
    float sign = 1.0f;
    float min_forward = 0.0f; // 1/sqrt(3) - bias
    float max_lateral = 0.0f; // 1/sqrt(2) + bias
};

inline const std::array<CubeFaceInfo, k_cube_face_count>& cube_face_table() {
    static const float fwd = 1.0f / std::sqrt(3.0f) - k_face_select_bias;
    static const float lat = 1.0f / std::sqrt(2.0f) + k_face_select_bias;
    static const std::array<CubeFaceInfo, k_cube_face_count> table{{
        {0,  1.0f, fwd, lat},
        {0, -1.0f, fwd, lat},
        {1,  1.0f, fwd, lat},
        {1, -1.0f, fwd, lat},
        {2,  1.0f, fwd, lat},
        {2, -1.0f, fwd, lat},
    }};
    return table;
}

// dir нь гэрлээс цэг рүү чиглэсэн нэгж вектор.
inline bool face_may_contain(int face, const glm::vec3& dir) {
    if (face < 0 || face >= k_cube_face_count) return false;
    const CubeFaceInfo& f = cube_face_table()[(size_t)face];
    if (dir[f.axis] * f.sign < f.min_forward) return false;
    for (int a = 0; a < 3; ++a) {
        if (a == f.axis) continue;
        if (std::abs(dir[a]) > f.max_lateral) return false;
    }
    return true;
}

// 0 = бүрэн сүүдэрт, 1 = бүрэн гэрэлтэй. w <= 0 (гэрлийн ард) үед 0.
inline float sample_direct_light_index(
    const RT_ShadowCube& cube,
    int face,
    const glm::vec4& light_clip
){
    if (light_clip.w <= 0.0f) return 0.0f;
    if (face < 0 || face >= k_cube_face_count || !cube.valid()) return 0.0f;

    const glm::vec3 ndc = glm::vec3(light_clip) / light_clip.w;
    // Texture-ийн v тэнхлэг доош чиглэнэ.
    const float u = ndc.x * 0.5f + 0.5f;
    const float v = -ndc.y * 0.5f + 0.5f;
    const float depth_ref = (ndc.z * 0.5f + 0.5f) - k_shadow_depth_bias;

    const PixelBuffer2D<float>& layer = cube.layers[(size_t)face];
    float visibility = 0.0f;
    for (int oy = -k_shadow_samples; oy <= k_shadow_samples; ++oy) {
        for (int ox = -k_shadow_samples; ox <= k_shadow_samples; ++ox) {
            visibility += sample_compare_linear_clamped(layer, u, v, depth_ref, ox, oy);
        }
    }
    return visibility * k_inv_shadow_samples;
}

/*
    Face-уудыг 0..5 дарааллаар шалгаж, тэгээс ялгаатай анхны утгыг буцаана.
    use_shadowmaps == 0 эсвэл map байхгүй үед 1.
*/
inline float sample_direct_light(
    const GlobalUniforms& globals,
    const LightUniform& light,
    const RT_ShadowCube* cube,
    const glm::vec3& world_pos
){
    if (globals.use_shadowmaps == 0u || !cube || !cube->valid()) return 1.0f;

    const glm::vec3 rel = world_pos - light.position;
    const float len = glm::length(rel);
    if (len <= 1e-6f) return 1.0f;
    const glm::vec3 dir = rel / len;

    for (int face = 0; face < k_cube_face_count; ++face) {
        if (!face_may_contain(face, dir)) continue;
        const glm::vec4 clip = light.matrices[(size_t)face] * glm::vec4(rel, 1.0f);
        const float vis = sample_direct_light_index(*cube, face, clip);
        if (vis > 0.0f) return vis;
    }
    return 0.0f;
}

// radiance нь гэрлийн rgb * intensity.
inline glm::vec3 sample_ambient_light(
    const glm::vec3& radiance,
    float attenuation,
    float n_dot_l
){
    return glm::vec3(k_ambient_base)
        + radiance * attenuation * std::max(n_dot_l, 0.0f) * k_ambient_bounce_scale;
}

} // namespace murk
