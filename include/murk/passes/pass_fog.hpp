#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: pass_fog.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Манангийн эзэлхүүнийг тунгалаг зургийн дээр alpha-blend хийх pass.
            Geometry-ийн гүний буфер бүрэн болсны дараа зөвхөн уншигдана.
*/


#include "murk/frame/frame_params.hpp"
#include "murk/passes/pass_common.hpp"
#include "murk/scene/scene.hpp"
#include "murk/shader/builtin_shaders.hpp"

namespace murk
{
    class PassFog
    {
    public:
        struct Inputs
        {
            const Scene* scene = nullptr;
            const FrameParams* fp = nullptr;
            const FrameUniforms* frame = nullptr;
            const RT_ShadowCube* shadow = nullptr;
            RT_ColorHDR* color = nullptr;
            // Гүний тест ба гүнээр хязгаарлахад хоёуланд нь ашиглана; бичихгүй.
            RT_DepthBuffer* depth = nullptr;
        };

        PassFog() : program_(make_fog_program()) {}

        void execute(Context& ctx, const Inputs& in)
        {
            if (!in.scene || !in.fp || !in.frame || !in.color || !in.depth) return;
            if (!in.fp->pass.fog.enable || !in.scene->fog_volume.drawable()) return;
            ScopedPassTimer timer(ctx.debug.ms_fog);

            RasterizerConfig rc{};
            rc.job_system = ctx.job_system;
            rc.state.cull_mode = in.fp->pass.fog.cull_mode;
            rc.state.depth_compare = DepthCompare::Less;
            rc.state.depth_write = false;
            rc.state.blend = BlendMode::AlphaBlend;

            RasterizerTarget target{};
            target.color = in.color;
            target.depth = &in.depth->depth;

            ShaderUniforms u = bind_frame_uniforms(*in.frame);
            u.shadow = in.shadow;
            u.scene_depth = in.depth;
            u.attenuation = in.fp->pass.pbr.attenuation;
            u.fog = &in.fp->pass.fog.fog;

            for (const MeshData& mesh : in.scene->fog_volume.model.meshes)
            {
                accumulate_raster_stats(ctx, rasterize_mesh_instanced(mesh, program_, u, in.scene->fog_volume.instances, target, rc));
            }
        }

    private:
        ShaderProgram program_{};
    };
}
