#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: builtin_shaders.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Рендерерийн суурилагдсан program-ууд: сүүдрийн гүн (shadow caster),
            tangent орон зайн PBR, эзэлхүүнт манан, гэрлийн gizmo.
*/


#include <algorithm>
#include <cmath>
#include <optional>

#include <glm/glm.hpp>

#include "murk/lighting/brdf.hpp"
#include "murk/lighting/fog_march.hpp"
#include "murk/lighting/point_light.hpp"
#include "murk/lighting/shadow_sample.hpp"
#include "murk/math/tonemap.hpp"
#include "murk/shader/program.hpp"

namespace murk
{
    inline constexpr float k_min_roughness = 0.04f;

    inline glm::vec4 instance_world_pos(const ShaderVertex& vin, const ShaderUniforms& u)
    {
        return u.instance.model * glm::vec4(vin.position, 1.0f);
    }

    /*
        Shadow caster: зөвхөн vertex stage. Гэрлийн cube матрицууд эх цэгт
        төвлөрсөн тул world байрлалаас гэрлийн байрлалыг хасна.
    */
    inline ShaderProgram make_shadow_depth_program()
    {
        ShaderProgram p{};
        p.vs = [](const ShaderVertex& vin, const ShaderUniforms& u) -> VertexOut {
            VertexOut o{};
            const glm::vec3 world = glm::vec3(instance_world_pos(vin, u));
            const uint32_t face = std::min<uint32_t>(u.globals->light_matrix_index, 5u);
            o.clip = u.light->matrices[face] * glm::vec4(world - u.light->position, 1.0f);
            return o;
        };
        return p;
    }

    inline ShaderProgram make_pbr_program()
    {
        ShaderProgram p{};
        p.vs = [](const ShaderVertex& vin, const ShaderUniforms& u) -> VertexOut {
            VertexOut o{};
            const glm::vec4 world = instance_world_pos(vin, u);
            o.clip = u.camera->proj * u.camera->view * world;

            const glm::vec3 T = glm::normalize(u.instance.normal * vin.tangent);
            const glm::vec3 B = glm::normalize(u.instance.normal * vin.bitangent);
            const glm::vec3 N = glm::normalize(u.instance.normal * vin.normal);
            // Ортонормаль TBN-ийн урвуу нь transpose.
            const glm::mat3 world_to_tangent = glm::transpose(glm::mat3(T, B, N));

            set_varying(o, VaryingSemantic::WorldPos, glm::vec3(world));
            set_varying(o, VaryingSemantic::UV0, glm::vec4(vin.uv, 0.0f, 0.0f));
            set_varying(o, VaryingSemantic::TangentLightPos, world_to_tangent * u.light->position);
            set_varying(o, VaryingSemantic::TangentViewPos, world_to_tangent * glm::vec3(u.camera->position));
            set_varying(o, VaryingSemantic::TangentFragPos, world_to_tangent * glm::vec3(world));
            return o;
        };
        p.fs = [](const FragmentIn& fin, const ShaderUniforms& u) -> FragmentOut {
            FragmentOut o{};
            const glm::vec2 uv = glm::vec2(get_varying(fin, VaryingSemantic::UV0));
            const glm::vec3 world = get_varying3(fin, VaryingSemantic::WorldPos);
            const glm::vec3 t_light = get_varying3(fin, VaryingSemantic::TangentLightPos);
            const glm::vec3 t_view = get_varying3(fin, VaryingSemantic::TangentViewPos);
            const glm::vec3 t_frag = get_varying3(fin, VaryingSemantic::TangentFragPos);

            const MaterialData* mat = u.material;
            const SamplerDesc sampler = mat ? mat->sampler : SamplerDesc{};
            const glm::vec4 diffuse = sample_texture(mat ? &mat->diffuse : nullptr, uv, sampler);
            const glm::vec4 normal_s = (mat && mat->normal.valid()) ? sample_texture(&mat->normal, uv, sampler) : glm::vec4(0.5f, 0.5f, 1.0f, 1.0f);
            const glm::vec4 rm = sample_texture(mat ? &mat->roughness_metalness : nullptr, uv, sampler);

            const glm::vec3 albedo = srgb_to_linear(glm::vec3(diffuse));
            const float roughness = std::clamp(rm.g * (mat ? mat->roughness_factor : 1.0f), k_min_roughness, 1.0f);
            const float metalness = std::clamp(rm.b * (mat ? mat->metallic_factor : 0.0f), 0.0f, 1.0f);

            glm::vec3 N = glm::vec3(normal_s) * 2.0f - glm::vec3(1.0f);
            N = (glm::dot(N, N) > 1e-12f) ? glm::normalize(N) : glm::vec3(0.0f, 0.0f, 1.0f);

            const glm::vec3 to_light = t_light - t_frag;
            const glm::vec3 to_view = t_view - t_frag;
            const glm::vec3 L = (glm::dot(to_light, to_light) > 1e-12f) ? glm::normalize(to_light) : N;
            const glm::vec3 V = (glm::dot(to_view, to_view) > 1e-12f) ? glm::normalize(to_view) : N;
            const glm::vec3 h = L + V;
            const glm::vec3 H = (glm::dot(h, h) > 1e-12f) ? glm::normalize(h) : N;

            const float distance = glm::length(u.light->position - world);
            const float attenuation = light_attenuation(distance, u.attenuation);
            const glm::vec3 light_radiance = u.light->rgb() * u.light->intensity();

            const float visibility = sample_direct_light(*u.globals, *u.light, u.shadow, world);
            glm::vec3 direct(0.0f);
            if (visibility > 0.0f)
            {
                direct = brdf(N, V, L, H, albedo, roughness, metalness) * light_radiance * attenuation * visibility;
            }
            const glm::vec3 ambient = sample_ambient_light(light_radiance, attenuation, glm::dot(N, L)) * albedo;

            const glm::vec3 c = reinhard(direct + ambient);
            o.color = ColorF{c.r, c.g, c.b, diffuse.a};
            return o;
        };
        return p;
    }

    // Fog volume-ийн нүүр бүрээс харах цацрагийн дагуу march хийнэ.
    inline ShaderProgram make_fog_program()
    {
        ShaderProgram p{};
        p.vs = [](const ShaderVertex& vin, const ShaderUniforms& u) -> VertexOut {
            VertexOut o{};
            const glm::vec4 world = instance_world_pos(vin, u);
            o.clip = u.camera->proj * u.camera->view * world;
            set_varying(o, VaryingSemantic::WorldPos, glm::vec3(world));
            return o;
        };
        p.fs = [](const FragmentIn& fin, const ShaderUniforms& u) -> FragmentOut {
            FragmentOut o{};
            const FogParams defaults{};
            const FogParams& fp = u.fog ? *u.fog : defaults;

            std::optional<float> scene_depth{};
            if (u.scene_depth &&
                fin.px >= 0 && fin.px < u.scene_depth->w &&
                fin.py >= 0 && fin.py < u.scene_depth->h)
            {
                scene_depth = u.scene_depth->depth.at(fin.px, fin.py);
            }

            const glm::vec4 c = shade_fog(
                get_varying3(fin, VaryingSemantic::WorldPos),
                *u.camera,
                *u.light,
                *u.globals,
                scene_depth,
                u.shadow,
                u.attenuation,
                fp
            );
            o.color = ColorF{c.r, c.g, c.b, c.a};
            return o;
        };
        return p;
    }

    // Гэрлийн байрлалд жижиг куб, гэрлийн өнгөөр.
    inline ShaderProgram make_light_gizmo_program()
    {
        ShaderProgram p{};
        p.vs = [](const ShaderVertex& vin, const ShaderUniforms& u) -> VertexOut {
            VertexOut o{};
            const glm::vec3 world = vin.position * u.gizmo_scale + u.light->position;
            o.clip = u.camera->proj * u.camera->view * glm::vec4(world, 1.0f);
            return o;
        };
        p.fs = [](const FragmentIn&, const ShaderUniforms& u) -> FragmentOut {
            FragmentOut o{};
            const glm::vec3 c = glm::clamp(u.light->rgb(), glm::vec3(0.0f), glm::vec3(1.0f));
            o.color = ColorF{c.r, c.g, c.b, 1.0f};
            return o;
        };
        return p;
    }
}
