#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: brdf.hpp
    МОДУЛЬ: lighting
    ЗОРИЛГО: Cook-Torrance BRDF: GGX (Trowbridge-Reitz) тархалт, Smith-Schlick
            геометрийн гишүүн, Fresnel-Schlick. Бүх вектор нэг орон зайд (world
            эсвэл tangent) нэгж урттай өгөгдөнө.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

namespace murk
{
    inline constexpr float k_brdf_epsilon = 0.0001f;
    inline constexpr float k_dielectric_f0 = 0.04f;

    inline float distribution_ggx(const glm::vec3& N, const glm::vec3& H, float roughness)
    {
        const float a = roughness * roughness;
        const float a2 = a * a;
        const float n_dot_h = std::max(glm::dot(N, H), 0.0f);
        const float denom = n_dot_h * n_dot_h * (a2 - 1.0f) + 1.0f;
        return a2 / (glm::pi<float>() * denom * denom);
    }

    inline float geometry_schlick_ggx(float n_dot_x, float roughness)
    {
        const float r = roughness + 1.0f;
        const float k = (r * r) / 8.0f;
        return n_dot_x / (n_dot_x * (1.0f - k) + k);
    }

    inline float geometry_smith(const glm::vec3& N, const glm::vec3& V, const glm::vec3& L, float roughness)
    {
        const float n_dot_v = std::max(glm::dot(N, V), 0.0f);
        const float n_dot_l = std::max(glm::dot(N, L), 0.0f);
        return geometry_schlick_ggx(n_dot_v, roughness) * geometry_schlick_ggx(n_dot_l, roughness);
    }

    inline glm::vec3 fresnel_schlick(float cos_theta, const glm::vec3& F0)
    {
        const float m = std::clamp(1.0f - cos_theta, 0.0f, 1.0f);
        const float m5 = m * m * m * m * m;
        return F0 + (glm::vec3(1.0f) - F0) * m5;
    }

    inline glm::vec3 base_reflectivity(const glm::vec3& albedo, float metalness)
    {
        return glm::mix(glm::vec3(k_dielectric_f0), albedo, metalness);
    }

    /*
        (kd * albedo / pi + specular) * max(N.L, 0).
        N.L <= 0 (гэрэл гадаргуугийн ард) үед тэг вектор буцаана.
    */
    inline glm::vec3 brdf(
        const glm::vec3& N,
        const glm::vec3& V,
        const glm::vec3& L,
        const glm::vec3& H,
        const glm::vec3& albedo,
        float roughness,
        float metalness
    )
    {
        const float n_dot_l = glm::dot(N, L);
        if (n_dot_l <= 0.0f) return glm::vec3(0.0f);
        const float n_dot_v = std::max(glm::dot(N, V), 0.0f);

        const glm::vec3 F0 = base_reflectivity(albedo, metalness);
        const float ndf = distribution_ggx(N, H, roughness);
        const float g = geometry_smith(N, V, L, roughness);
        const glm::vec3 F = fresnel_schlick(std::max(glm::dot(H, V), 0.0f), F0);

        const glm::vec3 specular = (ndf * g * F) / (4.0f * n_dot_v * n_dot_l + k_brdf_epsilon);
        const glm::vec3 kd = (glm::vec3(1.0f) - F) * (1.0f - metalness);
        const glm::vec3 diffuse = kd * albedo / glm::pi<float>();
        return (diffuse + specular) * n_dot_l;
    }
}
