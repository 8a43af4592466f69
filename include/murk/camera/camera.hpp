#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: camera.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Yaw/pitch (градус) чиглэлтэй хэтийн төлөвийн камер.
*/


#include <cmath>

#include <glm/glm.hpp>

#include "murk/camera/convention.hpp"
#include "murk/shader/uniforms.hpp"

namespace murk
{
    inline constexpr float k_camera_near_plane = 1.0f;
    inline constexpr float k_camera_far_plane = 3000.0f;

    struct PerspectiveProjection
    {
        float aspect = 16.0f / 9.0f;
        float fovy_degrees = 55.0f;
        float znear = k_camera_near_plane;
        float zfar = k_camera_far_plane;

        void resize(int width, int height)
        {
            if (width <= 0 || height <= 0) return;
            aspect = (float)width / (float)height;
        }

        glm::mat4 matrix() const
        {
            return perspective_lh_no(glm::radians(fovy_degrees), aspect, znear, zfar);
        }
    };

    struct CameraBasis
    {
        glm::vec3 right{0.0f, 0.0f, 1.0f};
        glm::vec3 up{0.0f, 1.0f, 0.0f};
        glm::vec3 forward{1.0f, 0.0f, 0.0f};
    };

    struct Camera
    {
        glm::vec3 position{-500.0f, 150.0f, 0.0f};
        float pitch_degrees = 0.0f;
        float yaw_degrees = 0.0f;
        PerspectiveProjection projection{};

        // yaw = pitch = 0 үед +X тэнхлэг рүү харна.
        CameraBasis basis() const
        {
            const float ys = std::sin(glm::radians(yaw_degrees));
            const float yc = std::cos(glm::radians(yaw_degrees));
            const float ps = std::sin(glm::radians(pitch_degrees));
            const float pc = std::cos(glm::radians(pitch_degrees));

            CameraBasis b{};
            b.forward = glm::normalize(glm::vec3(pc * yc, ps, pc * ys));
            b.right = glm::normalize(glm::vec3(-ys, 0.0f, yc));
            b.up = glm::cross(b.right, b.forward);
            return b;
        }

        glm::mat4 view_matrix() const
        {
            const CameraBasis b = basis();
            return look_to_lh(position, b.forward, b.up);
        }
    };

    inline CameraUniform make_camera_uniform(const Camera& camera, int viewport_w, int viewport_h)
    {
        CameraUniform u{};
        u.view = camera.view_matrix();
        u.proj = camera.projection.matrix();
        u.inv_view_proj = glm::inverse(u.proj * u.view);
        u.position = glm::vec4(camera.position, 1.0f);
        u.planes = glm::vec4(
            camera.projection.znear,
            camera.projection.zfar,
            (float)viewport_w,
            (float)viewport_h
        );
        return u;
    }
}
