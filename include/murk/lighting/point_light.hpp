#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: point_light.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Бүх чиглэлд гэрэлтэх цэгэн гэрэл: cube face-ийн 6 view-proj матриц,
            зайн сулрал (attenuation), demo-гийн гэрлийн хөдөлгөөн.
*/


#include <algorithm>
#include <array>
#include <cmath>

#include <glm/glm.hpp>

#include "murk/camera/convention.hpp"
#include "murk/shader/uniforms.hpp"

namespace murk
{
    inline constexpr float k_light_fov_degrees = 90.0f;
    inline constexpr float k_light_near_plane = 0.1f;
    inline constexpr float k_light_far_plane = 1000.0f;

    struct AttenuationCoeffs
    {
        float linear = 0.0f;
        float quadratic = 1.0f;
    };

    // 1 / (1 + linear*d + quadratic*d^2)
    inline float light_attenuation(float distance, const AttenuationCoeffs& k)
    {
        const float d = std::max(distance, 0.0f);
        return 1.0f / (1.0f + k.linear * d + k.quadratic * d * d);
    }

    struct PointLight
    {
        glm::vec3 position{0.0f};
        glm::vec3 color{1.0f};
        float intensity = 250000.0f;
    };

    /*
        Матрицууд эх цэг дээр төвлөрсөн тул хэрэглэгч талд world байрлалаас
        гэрлийн байрлалыг хасаж өгнө: matrices[i] * vec4(world - light.position, 1).
        Up векторууд нь cube map-ийн face-ийн дүрмийг дагана.
    */
    inline std::array<glm::mat4, 6> build_cube_face_matrices(
        float znear = k_light_near_plane,
        float zfar = k_light_far_plane
    )
    {
        const glm::mat4 proj = perspective_lh_no(glm::radians(k_light_fov_degrees), 1.0f, znear, zfar);
        const glm::vec3 o{0.0f};
        return {
            proj * look_to_lh(o, glm::vec3( 1.0f, 0.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)),
            proj * look_to_lh(o, glm::vec3(-1.0f, 0.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f)),
            proj * look_to_lh(o, glm::vec3( 0.0f, 1.0f, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f)),
            proj * look_to_lh(o, glm::vec3( 0.0f,-1.0f, 0.0f), glm::vec3(0.0f, 0.0f, -1.0f)),
            proj * look_to_lh(o, glm::vec3( 0.0f, 0.0f, 1.0f), glm::vec3(0.0f, -1.0f, 0.0f)),
            proj * look_to_lh(o, glm::vec3( 0.0f, 0.0f,-1.0f), glm::vec3(0.0f, -1.0f, 0.0f)),
        };
    }

    inline LightUniform make_light_uniform(const PointLight& light)
    {
        LightUniform u{};
        u.position = light.position;
        u.color = glm::vec4(light.color, light.intensity);
        u.matrices = build_cube_face_matrices();
        return u;
    }

    // Гэрлийн байрлал ба өнгийг хугацаанаас хамааруулан хөдөлгөнө.
    inline void animate_point_light(PointLight& light, float t)
    {
        light.position.x = std::sin(t * 0.5f) * 500.0f;
        light.position.y = 250.0f + std::sin(t * 0.3f) * 200.0f;
        light.position.z = std::sin(t * 0.8f) * 100.0f;

        light.color.r = std::abs(std::sin(t * 1.0f));
        light.color.g = std::abs(std::sin(t * 0.6f));
        light.color.b = std::abs(std::sin(t * 0.4f));
    }
}
