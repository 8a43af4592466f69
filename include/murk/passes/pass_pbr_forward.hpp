#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: pass_pbr_forward.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Тунгалаг геометрийг PBR program-аар өнгө ба гүний буферт зурах
            forward pass. Өнгө ба гүнийг эхлээд цэвэрлэнэ.
*/


#include "murk/core/log.hpp"
#include "murk/frame/frame_params.hpp"
#include "murk/passes/pass_common.hpp"
#include "murk/scene/scene.hpp"
#include "murk/shader/builtin_shaders.hpp"

namespace murk
{
    class PassPBRForward
    {
    public:
        struct Inputs
        {
            const Scene* scene = nullptr;
            const FrameParams* fp = nullptr;
            const FrameUniforms* frame = nullptr;
            // use_shadowmaps == 0 үед nullptr байж болно.
            const RT_ShadowCube* shadow = nullptr;
            RT_ColorHDR* color = nullptr;
            RT_DepthBuffer* depth = nullptr;
        };

        PassPBRForward() : program_(make_pbr_program()) {}

        void execute(Context& ctx, const Inputs& in)
        {
            if (!in.scene || !in.fp || !in.frame || !in.color || !in.depth) return;
            if (in.color->w != in.depth->w || in.color->h != in.depth->h)
            {
                log_warn("PassPBRForward: color/depth size mismatch, skipping");
                return;
            }
            ScopedPassTimer timer(ctx.debug.ms_pbr);

            in.color->clear(in.fp->pass.pbr.clear_color);
            in.depth->clear(1.0f);
            in.depth->zn = in.frame->camera.znear();
            in.depth->zf = in.frame->camera.zfar();

            RasterizerConfig rc{};
            rc.job_system = ctx.job_system;
            rc.state.cull_mode = in.fp->pass.pbr.cull_mode;
            rc.state.depth_compare = DepthCompare::Less;
            rc.state.depth_write = true;

            RasterizerTarget target{};
            target.color = in.color;
            target.depth = &in.depth->depth;

            ShaderUniforms u = bind_frame_uniforms(*in.frame);
            u.shadow = in.shadow;
            u.attenuation = in.fp->pass.pbr.attenuation;

            for (const RenderObject& obj : in.scene->geometry)
            {
                if (!obj.drawable()) continue;
                for (const MeshData& mesh : obj.model.meshes)
                {
                    u.material = obj.model.material_for(mesh);
                    accumulate_raster_stats(ctx, rasterize_mesh_instanced(mesh, program_, u, obj.instances, target, rc));
                }
            }
        }

    private:
        ShaderProgram program_{};
    };
}
