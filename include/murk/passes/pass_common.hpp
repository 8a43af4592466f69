#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: pass_common.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Бүх pass-д нийтлэг фрэймийн uniform багц (bind group 0) ба
            draw-ийн binding бэлтгэх туслах.
*/


#include "murk/core/context.hpp"
#include "murk/render/rasterizer.hpp"
#include "murk/shader/types.hpp"

namespace murk
{
    // Фрэйм бүр нэг удаа бэлтгэгдэнэ. Pass-ууд зөвхөн уншина.
    struct FrameUniforms
    {
        CameraUniform camera{};
        LightUniform light{};
        GlobalUniforms globals{};
    };

    inline ShaderUniforms bind_frame_uniforms(const FrameUniforms& fu)
    {
        ShaderUniforms u{};
        u.camera = &fu.camera;
        u.light = &fu.light;
        u.globals = &fu.globals;
        return u;
    }

    inline void accumulate_raster_stats(Context& ctx, const RasterizerStats& s)
    {
        ctx.debug.tri_input += s.tri_input;
        ctx.debug.tri_after_clip += s.tri_after_clip;
        ctx.debug.tri_raster += s.tri_raster;
        ctx.debug.fragments_shaded += s.fragments;
    }
}
