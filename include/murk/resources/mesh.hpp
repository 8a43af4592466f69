#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: mesh.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Indexed гурвалжин mesh (position/uv/normal/tangent/bitangent) ба
            UV-ээс tangent суурь тооцох.
*/


#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace murk
{
    struct MeshData
    {
        std::string name{};
        std::vector<glm::vec3> positions{};
        std::vector<glm::vec2> uvs{};
        std::vector<glm::vec3> normals{};
        std::vector<glm::vec3> tangents{};
        std::vector<glm::vec3> bitangents{};
        std::vector<uint32_t> indices{};
        uint32_t material_index = 0;

        bool empty() const
        {
            return positions.empty() || indices.empty();
        }

        size_t vertex_count() const { return positions.size(); }
        size_t triangle_count() const { return indices.size() / 3; }

        // Бүх attribute массив positions-той ижил урттай эсэх.
        bool attributes_complete() const
        {
            const size_t n = positions.size();
            return uvs.size() == n && normals.size() == n && tangents.size() == n && bitangents.size() == n;
        }
    };

    /*
        Гурвалжин бүрийн dP/du, dP/dv-г орой бүрт нэмж дунджилна. Дараа нь
        normal-д Gram-Schmidt-ээр ортогональ болгоно. UV талбай тэг гурвалжныг алгасна.
    */
    inline void compute_tangents(MeshData& m)
    {
        const size_t n = m.positions.size();
        m.tangents.assign(n, glm::vec3(0.0f));
        m.bitangents.assign(n, glm::vec3(0.0f));
        if (m.uvs.size() != n || m.normals.size() != n) return;

        for (size_t i = 0; i + 2 < m.indices.size(); i += 3)
        {
            const uint32_t i0 = m.indices[i + 0];
            const uint32_t i1 = m.indices[i + 1];
            const uint32_t i2 = m.indices[i + 2];
            if (i0 >= n || i1 >= n || i2 >= n) continue;

            const glm::vec3 dp1 = m.positions[i1] - m.positions[i0];
            const glm::vec3 dp2 = m.positions[i2] - m.positions[i0];
            const glm::vec2 duv1 = m.uvs[i1] - m.uvs[i0];
            const glm::vec2 duv2 = m.uvs[i2] - m.uvs[i0];

            const float det = duv1.x * duv2.y - duv1.y * duv2.x;
            if (std::abs(det) < 1e-12f) continue;
            const float r = 1.0f / det;
            const glm::vec3 t = (dp1 * duv2.y - dp2 * duv1.y) * r;
            const glm::vec3 b = (dp2 * duv1.x - dp1 * duv2.x) * r;

            for (uint32_t idx : {i0, i1, i2})
            {
                m.tangents[idx] += t;
                m.bitangents[idx] += b;
            }
        }

        for (size_t v = 0; v < n; ++v)
        {
            const glm::vec3 nn = glm::normalize(m.normals[v]);
            glm::vec3 t = m.tangents[v] - nn * glm::dot(nn, m.tangents[v]);
            if (glm::dot(t, t) < 1e-12f)
            {
                // Туйл мэт доройтсон орой: normal-д перпендикуляр дурын тэнхлэг.
                const glm::vec3 helper = std::abs(nn.y) < 0.99f ? glm::vec3(0.0f, 1.0f, 0.0f) : glm::vec3(1.0f, 0.0f, 0.0f);
                t = glm::cross(helper, nn);
            }
            t = glm::normalize(t);

            glm::vec3 b = glm::cross(nn, t);
            if (glm::dot(b, m.bitangents[v]) < 0.0f) b = -b;
            m.tangents[v] = t;
            m.bitangents[v] = b;
        }
    }
}
