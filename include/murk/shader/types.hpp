#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: types.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex/fragment stage-ийн оролт гаралт, varying слот ба нэг draw-д
            холбогдох (bind) бүх uniform, texture, render target-ийн заагч.
*/


#include <array>
#include <cstdint>

#include <glm/glm.hpp>

#include "murk/gfx/rt_shadow.hpp"
#include "murk/gfx/rt_types.hpp"
#include "murk/lighting/fog_march.hpp"
#include "murk/lighting/point_light.hpp"
#include "murk/resources/material.hpp"
#include "murk/resources/model.hpp"
#include "murk/shader/uniforms.hpp"

namespace murk
{
    constexpr uint32_t MURK_MAX_VARYINGS = 8;

    enum class VaryingSemantic : uint32_t
    {
        WorldPos = 0,
        UV0 = 1,
        TangentLightPos = 2,
        TangentViewPos = 3,
        TangentFragPos = 4,
        Color0 = 5,
        Custom0 = 6,
        Custom1 = 7
    };

    inline constexpr uint32_t varying_bit(uint32_t slot) { return (1u << slot); }

    struct ShaderVertex
    {
        glm::vec3 position{0.0f};
        glm::vec2 uv{0.0f};
        glm::vec3 normal{0.0f, 1.0f, 0.0f};
        glm::vec3 tangent{1.0f, 0.0f, 0.0f};
        glm::vec3 bitangent{0.0f, 0.0f, 1.0f};
    };

    struct VertexOut
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        std::array<glm::vec4, MURK_MAX_VARYINGS> varyings{};
        uint32_t varying_mask = 0u;
    };

    struct FragmentIn
    {
        std::array<glm::vec4, MURK_MAX_VARYINGS> varyings{};
        uint32_t varying_mask = 0u;
        float depth01 = 1.0f;
        int px = 0;
        int py = 0;
    };

    struct FragmentOut
    {
        ColorF color{0.0f, 0.0f, 0.0f, 1.0f};
        bool discard = false;
    };

    /*
        Нэг draw-ийн binding-ууд. Заагчууд нь renderer-ийн эзэмшдэг фрэймийн
        өгөгдөл рүү заана; draw дуусах хүртэл амьд байх ёстой.
    */
    struct ShaderUniforms
    {
        // group 0
        const CameraUniform* camera = nullptr;
        const LightUniform* light = nullptr;
        const GlobalUniforms* globals = nullptr;

        // instance ба материал
        InstanceData instance{};
        const MaterialData* material = nullptr;

        // shadow cube (харьцуулалтын sampler) ба geometry pass-ийн гүн (зөвхөн унших)
        const RT_ShadowCube* shadow = nullptr;
        const RT_DepthBuffer* scene_depth = nullptr;

        AttenuationCoeffs attenuation{};
        const FogParams* fog = nullptr;
        float gizmo_scale = 10.0f;
    };

    inline void set_varying(VertexOut& out, VaryingSemantic semantic, const glm::vec4& v)
    {
        const uint32_t i = (uint32_t)semantic;
        out.varyings[i] = v;
        out.varying_mask |= varying_bit(i);
    }

    inline void set_varying(VertexOut& out, VaryingSemantic semantic, const glm::vec3& v)
    {
        set_varying(out, semantic, glm::vec4(v, 1.0f));
    }

    inline glm::vec4 get_varying(const FragmentIn& in, VaryingSemantic semantic, const glm::vec4& fallback = glm::vec4(0.0f))
    {
        const uint32_t i = (uint32_t)semantic;
        if ((in.varying_mask & varying_bit(i)) == 0u) return fallback;
        return in.varyings[i];
    }

    inline glm::vec3 get_varying3(const FragmentIn& in, VaryingSemantic semantic)
    {
        return glm::vec3(get_varying(in, semantic));
    }

    inline ShaderVertex fetch_vertex(const MeshData& m, uint32_t i)
    {
        ShaderVertex v{};
        v.position = m.positions[i];
        if (i < m.uvs.size()) v.uv = m.uvs[i];
        if (i < m.normals.size()) v.normal = m.normals[i];
        if (i < m.tangents.size()) v.tangent = m.tangents[i];
        if (i < m.bitangents.size()) v.bitangent = m.bitangents[i];
        return v;
    }
}
