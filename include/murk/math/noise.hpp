#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: noise.hpp
    МОДУЛЬ: math
    ЗОРИЛГО: Hash дээр суурилсан 3D value noise ба fbm. Fog-ийн нягтын талбар.
            Бүх функц цэвэр (pure): үр дүн зөвхөн оролтын байрлалаас хамаарна.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

namespace murk
{
    inline constexpr int k_fbm_octaves = 8;

    // Lattice цэгийг [-1, 1] хооронд псевдо-санамсаргүй утга руу буулгана.
    inline float hash13(const glm::vec3& p)
    {
        const float h = std::sin(glm::dot(p, glm::vec3(127.1f, 311.7f, 74.7f))) * 43758.5453f;
        return glm::fract(h) * 2.0f - 1.0f;
    }

    // f*f*(3-2f): lattice хил дээр эхний уламжлал тасрахгүй.
    inline glm::vec3 smoothstep_weight(const glm::vec3& f)
    {
        return f * f * (glm::vec3(3.0f) - 2.0f * f);
    }

    inline float value_noise(const glm::vec3& p)
    {
        const glm::vec3 i = glm::floor(p);
        const glm::vec3 w = smoothstep_weight(p - i);

        const float c000 = hash13(i + glm::vec3(0.0f, 0.0f, 0.0f));
        const float c100 = hash13(i + glm::vec3(1.0f, 0.0f, 0.0f));
        const float c010 = hash13(i + glm::vec3(0.0f, 1.0f, 0.0f));
        const float c110 = hash13(i + glm::vec3(1.0f, 1.0f, 0.0f));
        const float c001 = hash13(i + glm::vec3(0.0f, 0.0f, 1.0f));
        const float c101 = hash13(i + glm::vec3(1.0f, 0.0f, 1.0f));
        const float c011 = hash13(i + glm::vec3(0.0f, 1.0f, 1.0f));
        const float c111 = hash13(i + glm::vec3(1.0f, 1.0f, 1.0f));

        const float x00 = glm::mix(c000, c100, w.x);
        const float x10 = glm::mix(c010, c110, w.x);
        const float x01 = glm::mix(c001, c101, w.x);
        const float x11 = glm::mix(c011, c111, w.x);
        const float y0 = glm::mix(x00, x10, w.y);
        const float y1 = glm::mix(x01, x11, w.y);
        return glm::mix(y0, y1, w.z);
    }

    inline float fbm(const glm::vec3& p)
    {
        float sum = 0.0f;
        float amp = 0.5f;
        glm::vec3 q = p;
        for (int o = 0; o < k_fbm_octaves; ++o)
        {
            sum += amp * value_noise(q);
            q *= 2.0f;
            amp *= 0.5f;
        }
        return std::clamp(sum, 0.0f, 1.0f);
    }
}
