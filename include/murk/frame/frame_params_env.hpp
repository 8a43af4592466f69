#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: frame_params_env.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: MURK_* орчны хувьсагчаар FrameParams-ийн утгыг дарж бичих.
            Буруу утга өгөгдвөл өмнөх утга хэвээр үлдэнэ.
*/


#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

#include "murk/frame/frame_params.hpp"

namespace murk
{
    inline bool parse_env_bool(const char* value, bool fallback)
    {
        if (!value || *value == '\0') return fallback;
        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
        if (v == "0" || v == "false" || v == "off" || v == "no") return false;
        return fallback;
    }

    inline uint32_t parse_env_u32(const char* value, uint32_t fallback, uint32_t min_value = 1u)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const unsigned long parsed = std::strtoul(value, &end, 10);
        if (end == value) return fallback;
        const uint32_t out = static_cast<uint32_t>(std::min<unsigned long>(
            parsed,
            static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())));
        return std::max(min_value, out);
    }

    inline double parse_env_f64(const char* value, double fallback, double min_value = 0.0)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const double parsed = std::strtod(value, &end);
        if (end == value || !std::isfinite(parsed)) return fallback;
        return std::max(min_value, parsed);
    }

    inline void apply_env_overrides(FrameParams& fp)
    {
        ShadowPassParams& sh = fp.pass.shadow;
        sh.enable = parse_env_bool(std::getenv("MURK_SHADOWS"), sh.enable);
        sh.map_size = (int)parse_env_u32(std::getenv("MURK_SHADOW_MAP_SIZE"), (uint32_t)sh.map_size, 16u);

        FogPassParams& fog = fp.pass.fog;
        fog.enable = parse_env_bool(std::getenv("MURK_FOG"), fog.enable);
        fog.fog.self_shadowing = parse_env_bool(std::getenv("MURK_FOG_SELF_SHADOW"), fog.fog.self_shadowing);
        fog.fog.depth_gating = parse_env_bool(std::getenv("MURK_FOG_DEPTH_GATING"), fog.fog.depth_gating);
        fog.fog.blend_in = parse_env_bool(std::getenv("MURK_FOG_BLEND_IN"), fog.fog.blend_in);
        fog.fog.steps = (int)parse_env_u32(std::getenv("MURK_FOG_STEPS"), (uint32_t)fog.fog.steps, 1u);
        fog.fog.total_density = (float)parse_env_f64(std::getenv("MURK_FOG_DENSITY"), fog.fog.total_density, 0.0);

        fp.pass.light_gizmo.enable = parse_env_bool(std::getenv("MURK_LIGHT_GIZMO"), fp.pass.light_gizmo.enable);
        fp.pass.resolve.gamma = (float)parse_env_f64(std::getenv("MURK_GAMMA"), fp.pass.resolve.gamma, 0.1);
    }
}
