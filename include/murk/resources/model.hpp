#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: model.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Mesh + материалын багц (Model) ба instance бүрийн model/normal матриц.
*/


#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include "murk/resources/material.hpp"
#include "murk/resources/mesh.hpp"

namespace murk
{
    // Instance buffer-ийн нэг мөр: model (4 багана) + normal (3 багана).
    struct InstanceData
    {
        glm::mat4 model{1.0f};
        glm::mat3 normal{1.0f};
    };

    struct Transform
    {
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 scale{1.0f};

        InstanceData to_instance() const
        {
            InstanceData d{};
            d.model = glm::translate(glm::mat4(1.0f), position)
                * glm::mat4_cast(rotation)
                * glm::scale(glm::mat4(1.0f), scale);
            // Жигд бус масштабтай үед normal зөв үлдэнэ.
            d.normal = glm::transpose(glm::inverse(glm::mat3(d.model)));
            return d;
        }
    };

    struct Model
    {
        std::string name{};
        std::vector<MeshData> meshes{};
        std::vector<MaterialData> materials{};

        const MaterialData* material_for(const MeshData& mesh) const
        {
            if (mesh.material_index >= materials.size()) return nullptr;
            return &materials[mesh.material_index];
        }
    };

    // Нэг mesh, нэг материалтай загвар.
    inline Model make_single_mesh_model(std::string name, MeshData mesh, MaterialData material)
    {
        Model m{};
        m.name = std::move(name);
        mesh.material_index = 0;
        m.meshes.push_back(std::move(mesh));
        m.materials.push_back(std::move(material));
        return m;
    }
}
