#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: tonemap.hpp
    МОДУЛЬ: math
    ЗОРИЛГО: Reinhard tonemap (c / (c + 1)) ба дэлгэцийн gamma кодчилол.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

namespace murk
{
    // Сөрөг оролтыг 0 болгож хавчина; үр дүн [0, 1) хооронд.
    inline float reinhard(float x)
    {
        x = std::max(x, 0.0f);
        return x / (x + 1.0f);
    }

    inline glm::vec3 reinhard(const glm::vec3& c)
    {
        return glm::vec3(reinhard(c.x), reinhard(c.y), reinhard(c.z));
    }

    inline float gamma_encode(float linear, float gamma)
    {
        const float g = (gamma > 0.0f) ? gamma : 2.2f;
        return std::pow(std::clamp(linear, 0.0f, 1.0f), 1.0f / g);
    }

    inline float srgb_to_linear(float c)
    {
        if (c <= 0.04045f) return c / 12.92f;
        return std::pow((c + 0.055f) / 1.055f, 2.4f);
    }

    inline glm::vec3 srgb_to_linear(const glm::vec3& c)
    {
        return glm::vec3(srgb_to_linear(c.x), srgb_to_linear(c.y), srgb_to_linear(c.z));
    }
}
