#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: demo_scene.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: Asset ачаалалгүй процедурал demo тайз: шал, багана, бөмбөлөг,
            шалны дээгүүр тархсан манангийн хавтгай хайрцаг.
*/


#include <string>
#include <utility>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "murk/resources/primitives.hpp"
#include "murk/scene/scene.hpp"

namespace murk
{
    inline Model make_pillar_model()
    {
        MaterialData mat = make_flat_material("pillar", Color{200, 190, 170, 255}, 0.7f, 0.0f);
        return make_single_mesh_model("pillars", make_box(BoxDesc{glm::vec3(40.0f, 300.0f, 40.0f), 1}), std::move(mat));
    }

    inline Model make_floor_model()
    {
        MaterialData mat{};
        mat.name = "floor";
        mat.diffuse = make_checker_texture(64, 8, Color{150, 145, 135, 255}, Color{90, 85, 80, 255}, "floor.diffuse");
        mat.normal = make_solid_texture(Color{128, 128, 255, 255}, "floor.normal");
        mat.roughness_metalness = make_solid_texture(Color{0, 230, 0, 255}, "floor.rm");
        mat.roughness_factor = 1.0f;
        mat.metallic_factor = 1.0f;
        return make_single_mesh_model("floor", make_plane(PlaneDesc{2600.0f, 1100.0f, 13, 6, 16.0f}), std::move(mat));
    }

    inline Model make_sphere_model()
    {
        MaterialData mat = make_flat_material("sphere", Color{210, 170, 90, 255}, 0.35f, 1.0f);
        return make_single_mesh_model("spheres", make_sphere(SphereDesc{35.0f, 24, 16}), std::move(mat));
    }

    inline Scene make_demo_scene(int viewport_w, int viewport_h)
    {
        Scene s{};
        s.camera.position = glm::vec3(-500.0f, 150.0f, 0.0f);
        s.camera.pitch_degrees = -8.0f;
        s.camera.yaw_degrees = 0.0f;
        s.camera.projection.fovy_degrees = 55.0f;
        s.camera.projection.resize(viewport_w, viewport_h);

        s.light.position = glm::vec3(0.0f);
        s.light.color = glm::vec3(1.0f);
        s.light.intensity = 250000.0f;

        // Геометрийн бүлэг бүхэлдээ (60, 0, 35)-д шилжсэн.
        const glm::vec3 offset{60.0f, 0.0f, 35.0f};

        RenderObject floor{};
        floor.model = make_floor_model();
        floor.instances.push_back(Transform{offset}.to_instance());
        s.geometry.push_back(std::move(floor));

        RenderObject pillars{};
        pillars.model = make_pillar_model();
        for (int i = 0; i < 5; ++i)
        {
            const float x = -400.0f + 200.0f * (float)i;
            pillars.instances.push_back(Transform{offset + glm::vec3(x, 150.0f, -180.0f)}.to_instance());
            pillars.instances.push_back(Transform{offset + glm::vec3(x, 150.0f, 180.0f)}.to_instance());
        }
        s.geometry.push_back(std::move(pillars));

        RenderObject spheres{};
        spheres.model = make_sphere_model();
        for (int i = 0; i < 3; ++i)
        {
            spheres.instances.push_back(Transform{offset + glm::vec3(-200.0f + 250.0f * (float)i, 35.0f, 0.0f)}.to_instance());
        }
        s.geometry.push_back(std::move(spheres));

        // Манан: [-1, 1] куб, (0, 30, 0) төвтэй, (1360, 30, 600) масштабтай; шалыг бүхэлд нь бүрхэнэ.
        s.fog_volume.model = make_single_mesh_model(
            "fog_volume",
            make_box(BoxDesc{glm::vec3(2.0f), 1}),
            MaterialData{}
        );
        Transform fog_xf{};
        fog_xf.position = glm::vec3(0.0f, 30.0f, 0.0f);
        fog_xf.scale = glm::vec3(1360.0f, 30.0f, 600.0f);
        s.fog_volume.instances.push_back(fog_xf.to_instance());

        s.light_gizmo_mesh = make_box(BoxDesc{glm::vec3(1.0f), 1});
        return s;
    }
}
