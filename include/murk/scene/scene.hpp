#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: scene.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: Нэг фрэймд зурагдах өгөгдөл: камер, цэгэн гэрэл, тунгалаг
            геометр, манангийн эзэлхүүн, гэрлийн gizmo mesh.
*/


#include <vector>

#include "murk/camera/camera.hpp"
#include "murk/lighting/point_light.hpp"
#include "murk/resources/model.hpp"

namespace murk
{
    struct RenderObject
    {
        Model model{};
        std::vector<InstanceData> instances{};

        bool drawable() const
        {
            return !model.meshes.empty() && !instances.empty();
        }
    };

    struct Scene
    {
        Camera camera{};
        PointLight light{};
        std::vector<RenderObject> geometry{};
        RenderObject fog_volume{};
        // Нэгж хэмжээтэй (тал нь 1) куб, gizmo scale-аар томруулна.
        MeshData light_gizmo_mesh{};
    };
}
