#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: uniforms.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Фрэйм бүр нэг удаа бэлтгэгдэж бүх shader stage-д уншигдах uniform
            блокууд: камер (slot 0), гэрэл (slot 1), global (slot 2), материал.
*/


#include <array>
#include <cstdint>

#include <glm/glm.hpp>

namespace murk
{
    struct CameraUniform
    {
        glm::mat4 view{1.0f};
        glm::mat4 proj{1.0f};
        glm::mat4 inv_view_proj{1.0f};
        glm::vec4 position{0.0f, 0.0f, 0.0f, 1.0f};
        // (near, far, viewport width, viewport height)
        glm::vec4 planes{1.0f, 3000.0f, 1.0f, 1.0f};

        float znear() const { return planes.x; }
        float zfar() const { return planes.y; }
        // Харах чиглэл (view матрицын 3-р мөр, LH).
        glm::vec3 forward() const { return glm::vec3(view[0][2], view[1][2], view[2][2]); }
    };

    struct LightUniform
    {
        glm::vec3 position{0.0f};
        uint32_t pad0 = 0;
        // rgb = өнгө, a = хүч (intensity).
        glm::vec4 color{1.0f, 1.0f, 1.0f, 250000.0f};
        // Cube face бүрийн view-proj: +X, -X, +Y, -Y, +Z, -Z. Гэрлийн байрлалд төвлөрсөн.
        std::array<glm::mat4, 6> matrices{};

        glm::vec3 rgb() const { return glm::vec3(color); }
        float intensity() const { return color.a; }
    };

    struct GlobalUniforms
    {
        float time = 0.0f;
        uint32_t light_matrix_index = 0;
        uint32_t use_shadowmaps = 1;
        uint32_t pad0 = 0;
    };
}
