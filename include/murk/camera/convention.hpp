#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: convention.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Координатын дүрэм: зүүн гарын (LH) харах матриц, NDC z нь [-1, 1]
            проекц, device depth ба шугаман гүний хөрвүүлэлт.
*/


#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace murk
{
    // Чиглэлээр өгөгдсөн харах матриц (eye + dir-г target болгоно).
    inline glm::mat4 look_to_lh(const glm::vec3& eye, const glm::vec3& dir, const glm::vec3& up)
    {
        return glm::lookAtLH(eye, eye + dir, up);
    }

    inline glm::mat4 perspective_lh_no(float fovy_radians, float aspect, float znear, float zfar)
    {
        return glm::perspectiveLH_NO(fovy_radians, aspect, znear, zfar);
    }

    // NDC z [-1, 1] -> device depth [0, 1].
    inline float ndc_z_to_depth01(float z_ndc)
    {
        return z_ndc * 0.5f + 0.5f;
    }

    /*
        Device depth-ийг харагдах орон зайн z (view-space distance along forward)
        болгоно: 2nf / (f + n - z_ndc (f - n)). depth01 = 0 -> n, 1 -> f.
    */
    inline float linearize_depth01(float depth01, float znear, float zfar)
    {
        const float z_ndc = depth01 * 2.0f - 1.0f;
        const float denom = (zfar + znear) - z_ndc * (zfar - znear);
        if (denom <= 1e-12f) return zfar;
        return (2.0f * znear * zfar) / denom;
    }
}
