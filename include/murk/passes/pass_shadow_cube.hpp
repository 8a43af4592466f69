#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: pass_shadow_cube.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Цэгэн гэрлийн 6 face-ийн гүнийг shadow cube-ийн давхарга бүрт
            бичих depth-only pass.
*/


#include "murk/frame/frame_params.hpp"
#include "murk/passes/pass_common.hpp"
#include "murk/scene/scene.hpp"
#include "murk/shader/builtin_shaders.hpp"

namespace murk
{
    class PassShadowCube
    {
    public:
        struct Inputs
        {
            const Scene* scene = nullptr;
            const FrameParams* fp = nullptr;
            const FrameUniforms* frame = nullptr;
            RT_ShadowCube* shadow = nullptr;
        };

        PassShadowCube() : program_(make_shadow_depth_program()) {}

        void execute(Context& ctx, const Inputs& in)
        {
            if (!in.scene || !in.fp || !in.frame || !in.shadow) return;
            if (!in.fp->pass.shadow.enable || !in.shadow->valid()) return;
            ScopedPassTimer timer(ctx.debug.ms_shadow);

            RasterizerConfig rc{};
            rc.job_system = ctx.job_system;
            rc.state.cull_mode = CullMode::None;
            rc.state.depth_compare = DepthCompare::LessEqual;
            rc.state.depth_write = true;
            rc.state.depth_bias = in.fp->pass.shadow.depth_bias;

            // Face бүрт зөвхөн light_matrix_index ялгаатай global блок.
            GlobalUniforms face_globals = in.frame->globals;
            ShaderUniforms u = bind_frame_uniforms(*in.frame);
            u.globals = &face_globals;

            for (int face = 0; face < k_cube_face_count; ++face)
            {
                face_globals.light_matrix_index = (uint32_t)face;
                PixelBuffer2D<float>& layer = in.shadow->layers[(size_t)face];
                layer.clear(1.0f);

                RasterizerTarget target{};
                target.depth = &layer;
                for (const RenderObject& obj : in.scene->geometry)
                {
                    if (!obj.drawable()) continue;
                    for (const MeshData& mesh : obj.model.meshes)
                    {
                        accumulate_raster_stats(ctx, rasterize_mesh_instanced(mesh, program_, u, obj.instances, target, rc));
                    }
                }
            }
        }

    private:
        ShaderProgram program_{};
    };
}
