#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: renderer.hpp
    МОДУЛЬ: renderer
    ЗОРИЛГО: Фрэймийн render target-уудыг эзэмшиж, uniform блокуудыг фрэймд нэг
            удаа бэлтгээд pass-уудыг дарааллаар ажиллуулна:
            shadow cube -> PBR geometry -> гэрлийн gizmo -> манан -> resolve.
*/


#include <string>

#include "murk/camera/camera.hpp"
#include "murk/core/context.hpp"
#include "murk/core/log.hpp"
#include "murk/core/result.hpp"
#include "murk/frame/frame_params.hpp"
#include "murk/passes/pass_common.hpp"
#include "murk/passes/pass_fog.hpp"
#include "murk/passes/pass_light_gizmo.hpp"
#include "murk/passes/pass_pbr_forward.hpp"
#include "murk/passes/pass_resolve.hpp"
#include "murk/passes/pass_shadow_cube.hpp"
#include "murk/scene/scene.hpp"

namespace murk
{
    struct FrameTargets
    {
        RT_ColorHDR color{};
        RT_DepthBuffer depth{};
        RT_ShadowCube shadow{};
        RT_ColorLDR ldr{};
    };

    inline FrameUniforms build_frame_uniforms(const Scene& scene, const FrameParams& fp)
    {
        Camera cam = scene.camera;
        cam.projection.resize(fp.w, fp.h);

        FrameUniforms fu{};
        fu.camera = make_camera_uniform(cam, fp.w, fp.h);
        fu.light = make_light_uniform(scene.light);
        fu.globals.time = fp.time;
        fu.globals.light_matrix_index = 0;
        fu.globals.use_shadowmaps = fp.pass.shadow.enable ? 1u : 0u;
        return fu;
    }

    class Renderer
    {
    public:
        // Хэмжээ өөрчлөгдсөн үед л дахин хуваарилна.
        Status ensure_targets(int w, int h, int shadow_size)
        {
            if (w <= 0 || h <= 0) return Status::failure("invalid frame size " + std::to_string(w) + "x" + std::to_string(h));
            if (shadow_size <= 0) return Status::failure("invalid shadow map size " + std::to_string(shadow_size));

            if (targets_.color.w != w || targets_.color.h != h)
            {
                targets_.color = RT_ColorHDR(w, h);
                targets_.depth = RT_DepthBuffer(w, h, k_camera_near_plane, k_camera_far_plane);
                targets_.ldr = RT_ColorLDR(w, h);
                log_info("renderer: frame targets " + std::to_string(w) + "x" + std::to_string(h));
            }
            if (targets_.shadow.size != shadow_size)
            {
                targets_.shadow.resize(shadow_size);
                log_info("renderer: shadow cube 6x" + std::to_string(shadow_size) + "^2");
            }
            return ok_status();
        }

        Status render_frame(Context& ctx, const Scene& scene, const FrameParams& fp)
        {
            const Status st = ensure_targets(fp.w, fp.h, fp.pass.shadow.map_size);
            if (!st.ok) return st;

            ctx.debug.reset();
            frame_ = build_frame_uniforms(scene, fp);

            const RT_ShadowCube* shadow = fp.pass.shadow.enable ? &targets_.shadow : nullptr;

            shadow_pass_.execute(ctx, PassShadowCube::Inputs{&scene, &fp, &frame_, &targets_.shadow});
            pbr_pass_.execute(ctx, PassPBRForward::Inputs{&scene, &fp, &frame_, shadow, &targets_.color, &targets_.depth});
            gizmo_pass_.execute(ctx, PassLightGizmo::Inputs{&scene, &fp, &frame_, &targets_.color, &targets_.depth});
            fog_pass_.execute(ctx, PassFog::Inputs{&scene, &fp, &frame_, shadow, &targets_.color, &targets_.depth});
            resolve_pass_.execute(ctx, PassResolve::Inputs{&fp, &targets_.color, &targets_.ldr});

            ctx.frame_index++;
            return ok_status();
        }

        const FrameTargets& targets() const { return targets_; }
        const RT_ColorLDR& output() const { return targets_.ldr; }
        const FrameUniforms& frame_uniforms() const { return frame_; }

    private:
        FrameTargets targets_{};
        FrameUniforms frame_{};

        PassShadowCube shadow_pass_{};
        PassPBRForward pbr_pass_{};
        PassLightGizmo gizmo_pass_{};
        PassFog fog_pass_{};
        PassResolve resolve_pass_{};
    };
}
