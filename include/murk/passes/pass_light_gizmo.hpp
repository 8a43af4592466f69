#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: pass_light_gizmo.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Гэрлийн байрлалыг харуулах жижиг куб. Geometry pass-ийн дараа,
            манангаас өмнө ижил өнгө/гүний буферт зурна.
*/


#include "murk/frame/frame_params.hpp"
#include "murk/passes/pass_common.hpp"
#include "murk/scene/scene.hpp"
#include "murk/shader/builtin_shaders.hpp"

namespace murk
{
    class PassLightGizmo
    {
    public:
        struct Inputs
        {
            const Scene* scene = nullptr;
            const FrameParams* fp = nullptr;
            const FrameUniforms* frame = nullptr;
            RT_ColorHDR* color = nullptr;
            RT_DepthBuffer* depth = nullptr;
        };

        PassLightGizmo() : program_(make_light_gizmo_program()) {}

        void execute(Context& ctx, const Inputs& in)
        {
            if (!in.scene || !in.fp || !in.frame || !in.color || !in.depth) return;
            if (!in.fp->pass.light_gizmo.enable || in.scene->light_gizmo_mesh.empty()) return;
            ScopedPassTimer timer(ctx.debug.ms_light_gizmo);

            RasterizerConfig rc{};
            rc.job_system = ctx.job_system;
            rc.state.cull_mode = CullMode::Back;
            rc.state.depth_compare = DepthCompare::Less;
            rc.state.depth_write = true;

            RasterizerTarget target{};
            target.color = in.color;
            target.depth = &in.depth->depth;

            ShaderUniforms u = bind_frame_uniforms(*in.frame);
            u.gizmo_scale = in.fp->pass.light_gizmo.scale;
            accumulate_raster_stats(ctx, rasterize_mesh(in.scene->light_gizmo_mesh, program_, u, target, rc));
        }

    private:
        ShaderProgram program_{};
    };
}
