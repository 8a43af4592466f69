#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: frame_params.hpp
    МОДУЛЬ: frame
    ЗОРИЛГО: Фрэйм бүрт renderer-т дамжих тохиргоо. Pass бүр өөрийн param
            block-оос уншина; global toggle-ууд (use_shadowmaps) эндээс
            GlobalUniforms руу хуулагдана.
*/


#include <glm/glm.hpp>

#include "murk/lighting/fog_march.hpp"
#include "murk/lighting/point_light.hpp"
#include "murk/render/rasterizer.hpp"

namespace murk
{
    struct ShadowPassParams
    {
        // false үед GlobalUniforms::use_shadowmaps = 0 ба depth pass алгасагдана.
        bool enable = true;
        int map_size = 1024;
        DepthBias depth_bias{2.0f, 2.0f};
    };

    struct PbrPassParams
    {
        AttenuationCoeffs attenuation{};
        CullMode cull_mode = CullMode::Back;
        ColorF clear_color{0.0f, 0.0f, 0.0f, 1.0f};
    };

    struct LightGizmoPassParams
    {
        bool enable = true;
        float scale = 10.0f;
    };

    struct FogPassParams
    {
        bool enable = true;
        CullMode cull_mode = CullMode::Back;
        FogParams fog{};
    };

    struct ResolvePassParams
    {
        float gamma = 2.2f;
    };

    struct PassParamBlocks
    {
        ShadowPassParams shadow{};
        PbrPassParams pbr{};
        LightGizmoPassParams light_gizmo{};
        FogPassParams fog{};
        ResolvePassParams resolve{};
    };

    struct FrameParams
    {
        int w = 0;
        int h = 0;

        float dt = 0.0f;
        float time = 0.0f;

        PassParamBlocks pass{};
    };
}
