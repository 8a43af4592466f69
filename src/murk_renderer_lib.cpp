/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: murk_renderer_lib.cpp
    МОДУЛЬ: lib
    ЗОРИЛГО: Compiled library target anchor translation unit.
*/

#include "murk/camera/camera.hpp"
#include "murk/camera/convention.hpp"
#include "murk/core/context.hpp"
#include "murk/core/log.hpp"
#include "murk/core/result.hpp"
#include "murk/frame/frame_params.hpp"
#include "murk/frame/frame_params_env.hpp"
#include "murk/gfx/image_io.hpp"
#include "murk/gfx/rt_shadow.hpp"
#include "murk/gfx/rt_types.hpp"
#include "murk/job/job_system.hpp"
#include "murk/job/thread_pool_job_system.hpp"
#include "murk/lighting/brdf.hpp"
#include "murk/lighting/fog_march.hpp"
#include "murk/lighting/point_light.hpp"
#include "murk/lighting/shadow_sample.hpp"
#include "murk/math/noise.hpp"
#include "murk/math/tonemap.hpp"
#include "murk/passes/pass_common.hpp"
#include "murk/passes/pass_fog.hpp"
#include "murk/passes/pass_light_gizmo.hpp"
#include "murk/passes/pass_pbr_forward.hpp"
#include "murk/passes/pass_resolve.hpp"
#include "murk/passes/pass_shadow_cube.hpp"
#include "murk/render/rasterizer.hpp"
#include "murk/renderer/renderer.hpp"
#include "murk/resources/material.hpp"
#include "murk/resources/mesh.hpp"
#include "murk/resources/model.hpp"
#include "murk/resources/primitives.hpp"
#include "murk/resources/texture.hpp"
#include "murk/scene/demo_scene.hpp"
#include "murk/scene/scene.hpp"
#include "murk/shader/builtin_shaders.hpp"
#include "murk/shader/program.hpp"
#include "murk/shader/types.hpp"
#include "murk/shader/uniforms.hpp"

namespace murk
{
    int murk_renderer_compiled_target_anchor()
    {
        return 0;
    }
}
