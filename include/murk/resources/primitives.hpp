#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: primitives.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Demo болон тестийн процедурал mesh: хавтгай, хайрцаг, бөмбөрцөг.
            Гурвалжны эргэлт (cross(b-a, c-a)) нь гаднах normal-той ижил чиглэлтэй.
*/


#include <algorithm>
#include <cmath>
#include <utility>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include "murk/resources/mesh.hpp"

namespace murk
{
    struct PlaneDesc
    {
        float width = 1.0f;
        float depth = 1.0f;
        int seg_x = 1;
        int seg_z = 1;
        float uv_scale = 1.0f;
    };

    struct BoxDesc
    {
        glm::vec3 size{1.0f};
        int seg = 1;
    };

    struct SphereDesc
    {
        float radius = 0.5f;
        int seg_u = 24;
        int seg_v = 16;
    };

    namespace detail
    {
        inline uint32_t add_vertex(MeshData& m, const glm::vec3& p, const glm::vec3& n, const glm::vec2& uv)
        {
            m.positions.push_back(p);
            m.normals.push_back(n);
            m.uvs.push_back(uv);
            return (uint32_t)m.positions.size() - 1;
        }

        // Гурвалжны эргэлтийг оройн normal-уудтай тааруулна.
        inline void add_triangle_outward(MeshData& m, uint32_t a, uint32_t b, uint32_t c)
        {
            const glm::vec3 face_n = glm::cross(m.positions[b] - m.positions[a], m.positions[c] - m.positions[a]);
            const glm::vec3 avg_n = m.normals[a] + m.normals[b] + m.normals[c];
            if (glm::dot(face_n, avg_n) < 0.0f) std::swap(b, c);
            m.indices.push_back(a);
            m.indices.push_back(b);
            m.indices.push_back(c);
        }

        inline void add_grid_patch(
            MeshData& m,
            const glm::vec3& origin,
            const glm::vec3& axis_u,
            const glm::vec3& axis_v,
            const glm::vec3& normal,
            int seg_u,
            int seg_v,
            float uv_scale = 1.0f
        )
        {
            seg_u = std::max(1, seg_u);
            seg_v = std::max(1, seg_v);
            const uint32_t base = (uint32_t)m.positions.size();

            for (int y = 0; y <= seg_v; ++y)
            {
                const float fv = (float)y / (float)seg_v;
                for (int x = 0; x <= seg_u; ++x)
                {
                    const float fu = (float)x / (float)seg_u;
                    add_vertex(m, origin + axis_u * fu + axis_v * fv, normal, glm::vec2(fu, fv) * uv_scale);
                }
            }

            const uint32_t stride = (uint32_t)seg_u + 1u;
            for (int y = 0; y < seg_v; ++y)
            {
                for (int x = 0; x < seg_u; ++x)
                {
                    const uint32_t i00 = base + (uint32_t)y * stride + (uint32_t)x;
                    const uint32_t i10 = i00 + 1;
                    const uint32_t i01 = i00 + stride;
                    const uint32_t i11 = i01 + 1;
                    add_triangle_outward(m, i00, i01, i10);
                    add_triangle_outward(m, i10, i01, i11);
                }
            }
        }
    }

    inline MeshData make_plane(const PlaneDesc& d)
    {
        MeshData m{};
        m.name = "plane";
        const float hw = d.width * 0.5f;
        const float hz = d.depth * 0.5f;
        detail::add_grid_patch(
            m,
            glm::vec3(-hw, 0.0f, -hz),
            glm::vec3(d.width, 0.0f, 0.0f),
            glm::vec3(0.0f, 0.0f, d.depth),
            glm::vec3(0.0f, 1.0f, 0.0f),
            d.seg_x,
            d.seg_z,
            d.uv_scale
        );
        compute_tangents(m);
        return m;
    }

    inline MeshData make_box(const BoxDesc& d)
    {
        MeshData m{};
        m.name = "box";
        const glm::vec3 s = d.size;
        const glm::vec3 h = s * 0.5f;
        const int n = std::max(1, d.seg);

        detail::add_grid_patch(m, { h.x, -h.y, -h.z}, {0, 0,  s.z}, {0, s.y, 0}, { 1, 0, 0}, n, n);
        detail::add_grid_patch(m, {-h.x, -h.y,  h.z}, {0, 0, -s.z}, {0, s.y, 0}, {-1, 0, 0}, n, n);
        detail::add_grid_patch(m, {-h.x,  h.y, -h.z}, { s.x, 0, 0}, {0, 0,  s.z}, {0,  1, 0}, n, n);
        detail::add_grid_patch(m, {-h.x, -h.y,  h.z}, { s.x, 0, 0}, {0, 0, -s.z}, {0, -1, 0}, n, n);
        detail::add_grid_patch(m, {-h.x, -h.y,  h.z}, { s.x, 0, 0}, {0, s.y, 0}, {0, 0,  1}, n, n);
        detail::add_grid_patch(m, { h.x, -h.y, -h.z}, {-s.x, 0, 0}, {0, s.y, 0}, {0, 0, -1}, n, n);

        compute_tangents(m);
        return m;
    }

    inline MeshData make_sphere(const SphereDesc& d)
    {
        MeshData m{};
        m.name = "sphere";
        const int su = std::max(3, d.seg_u);
        const int sv = std::max(2, d.seg_v);

        for (int y = 0; y <= sv; ++y)
        {
            const float v = (float)y / (float)sv;
            const float phi = v * glm::pi<float>();
            for (int x = 0; x <= su; ++x)
            {
                const float u = (float)x / (float)su;
                const float theta = u * glm::two_pi<float>();
                const glm::vec3 n = glm::normalize(glm::vec3(
                    std::sin(phi) * std::cos(theta),
                    std::cos(phi),
                    std::sin(phi) * std::sin(theta)
                ));
                detail::add_vertex(m, n * d.radius, n, glm::vec2(u, v));
            }
        }

        const uint32_t stride = (uint32_t)su + 1u;
        for (int y = 0; y < sv; ++y)
        {
            for (int x = 0; x < su; ++x)
            {
                const uint32_t i00 = (uint32_t)y * stride + (uint32_t)x;
                const uint32_t i10 = i00 + 1;
                const uint32_t i01 = i00 + stride;
                const uint32_t i11 = i01 + 1;
                // Туйл дээрх доройтсон гурвалжныг алгасна.
                if (y != 0) detail::add_triangle_outward(m, i00, i01, i10);
                if (y != sv - 1) detail::add_triangle_outward(m, i10, i01, i11);
            }
        }

        compute_tangents(m);
        return m;
    }
}
