#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: rasterizer.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Shader program-ыг CPU дээр гүйцэтгэх гурвалжин rasterizer: clip,
            cull, 1/w-ээр зөв interpolation, гүний тест/бичилт, depth bias,
            alpha blend, instancing.
*/


#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "murk/gfx/rt_types.hpp"
#include "murk/job/job_system.hpp"
#include "murk/resources/mesh.hpp"
#include "murk/resources/model.hpp"
#include "murk/shader/program.hpp"

namespace murk
{
    enum class CullMode
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    enum class DepthCompare
    {
        Always = 0,
        Less = 1,
        LessEqual = 2
    };

    enum class BlendMode
    {
        Replace = 0,
        // src * src.a + dst * (1 - src.a), alpha сувагт мөн адил.
        AlphaBlend = 1
    };

    // constant нь depth-ийн нэгжээр (2^-23), slope нь гурвалжны max |dz/dpixel|-ийн үржвэр.
    struct DepthBias
    {
        float constant = 0.0f;
        float slope = 0.0f;
    };

    inline constexpr float k_depth_bias_unit = 1.0f / 8388608.0f;

    struct RasterState
    {
        CullMode cull_mode = CullMode::Back;
        // LH дүрэмд гаднаас харагдах нүүр NDC (y дээш) дотор цагийн зүүний дагуу эргэнэ.
        bool front_face_cw = true;
        DepthCompare depth_compare = DepthCompare::Less;
        bool depth_write = true;
        BlendMode blend = BlendMode::Replace;
        DepthBias depth_bias{};
    };

    struct RasterizerConfig
    {
        RasterState state{};
        IJobSystem* job_system = nullptr;
        int parallel_min_rows = 8;
        int parallel_min_pixels = 64 * 64;
    };

    // color байхгүй эсвэл program depth-only бол зөвхөн гүн бичнэ.
    struct RasterizerTarget
    {
        RT_ColorHDR* color = nullptr;
        PixelBuffer2D<float>* depth = nullptr;

        int width() const
        {
            if (color) return color->w;
            return depth ? depth->w : 0;
        }

        int height() const
        {
            if (color) return color->h;
            return depth ? depth->h : 0;
        }
    };

    struct RasterizerStats
    {
        uint64_t tri_input = 0;
        uint64_t tri_after_clip = 0;
        uint64_t tri_raster = 0;
        uint64_t fragments = 0;

        RasterizerStats& operator+=(const RasterizerStats& o)
        {
            tri_input += o.tri_input;
            tri_after_clip += o.tri_after_clip;
            tri_raster += o.tri_raster;
            fragments += o.fragments;
            return *this;
        }
    };

    namespace detail
    {
        struct RasterVertex
        {
            glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
            std::array<glm::vec4, MURK_MAX_VARYINGS> varyings{};
            uint32_t varying_mask = 0u;
        };

        inline RasterVertex lerp_rv(const RasterVertex& a, const RasterVertex& b, float t)
        {
            RasterVertex o{};
            o.clip = glm::mix(a.clip, b.clip, t);
            o.varying_mask = a.varying_mask | b.varying_mask;
            for (uint32_t i = 0; i < MURK_MAX_VARYINGS; ++i) o.varyings[i] = glm::mix(a.varyings[i], b.varyings[i], t);
            return o;
        }

        // Clip орон зайн 6 хавтгай: (axis, sign) -> w + sign * clip[axis] >= 0.
        inline float clip_plane_dist(const RasterVertex& v, int plane)
        {
            const int axis = plane >> 1;
            const float sign = (plane & 1) ? -1.0f : 1.0f;
            return v.clip.w + sign * v.clip[axis];
        }

        inline void clip_polygon_plane(const std::vector<RasterVertex>& in, std::vector<RasterVertex>& out, int plane)
        {
            out.clear();
            if (in.empty()) return;
            for (size_t i = 0; i < in.size(); ++i)
            {
                const RasterVertex& cur = in[i];
                const RasterVertex& nxt = in[(i + 1) % in.size()];
                const float da = clip_plane_dist(cur, plane);
                const float db = clip_plane_dist(nxt, plane);
                const bool cur_in = da >= 0.0f;
                const bool nxt_in = db >= 0.0f;

                if (cur_in != nxt_in)
                {
                    const float denom = da - db;
                    if (std::abs(denom) > 1e-8f) out.push_back(lerp_rv(cur, nxt, da / denom));
                }
                if (nxt_in) out.push_back(nxt);
            }
        }

        inline void clip_polygon_frustum(std::vector<RasterVertex>& poly)
        {
            std::vector<RasterVertex> tmp{};
            for (int plane = 0; plane < 6 && poly.size() >= 3; ++plane)
            {
                clip_polygon_plane(poly, tmp, plane);
                poly.swap(tmp);
            }
        }

        inline bool inside_clip_volume(const glm::vec4& c)
        {
            if (!(c.w > 0.0f)) return false;
            return (c.x >= -c.w && c.x <= c.w) &&
                   (c.y >= -c.w && c.y <= c.w) &&
                   (c.z >= -c.w && c.z <= c.w);
        }

        inline bool depth_passes(DepthCompare cmp, float z, float stored)
        {
            switch (cmp)
            {
                case DepthCompare::Always: return true;
                case DepthCompare::Less: return z < stored;
                case DepthCompare::LessEqual: return z <= stored;
            }
            return false;
        }

        inline ColorF blend_color(BlendMode mode, const ColorF& src, const ColorF& dst)
        {
            if (mode == BlendMode::Replace) return src;
            const float a = std::clamp(src.a, 0.0f, 1.0f);
            const float ia = 1.0f - a;
            return ColorF{
                src.r * a + dst.r * ia,
                src.g * a + dst.g * ia,
                src.b * a + dst.b * ia,
                src.a * a + dst.a * ia
            };
        }
    }

    inline glm::vec3 barycentric_2d(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b, const glm::vec2& c)
    {
        const glm::vec2 v0 = b - a;
        const glm::vec2 v1 = c - a;
        const glm::vec2 v2 = p - a;
        const float den = v0.x * v1.y - v1.x * v0.y;
        if (std::abs(den) < 1e-12f) return glm::vec3(-1.0f);
        const float inv_den = 1.0f / den;
        const float v = (v2.x * v1.y - v1.x * v2.y) * inv_den;
        const float w = (v0.x * v2.y - v2.x * v0.y) * inv_den;
        return glm::vec3(1.0f - v - w, v, w);
    }

    // NDC -> pixel. Зургийн эх нь зүүн дээд булан (y доош).
    inline glm::vec2 ndc_to_screen(const glm::vec3& ndc, int w, int h)
    {
        return glm::vec2((ndc.x * 0.5f + 0.5f) * (float)w, (0.5f - ndc.y * 0.5f) * (float)h);
    }

    namespace detail
    {
        inline void raster_triangle(
            const RasterVertex& rv0,
            const RasterVertex& rv1,
            const RasterVertex& rv2,
            const ShaderProgram& program,
            const ShaderUniforms& uniforms,
            const RasterizerTarget& target,
            const RasterizerConfig& config,
            RasterizerStats& stats
        )
        {
            const int W = target.width();
            const int H = target.height();
            const RasterState& rs = config.state;

            const glm::vec3 n0 = glm::vec3(rv0.clip) / rv0.clip.w;
            const glm::vec3 n1 = glm::vec3(rv1.clip) / rv1.clip.w;
            const glm::vec3 n2 = glm::vec3(rv2.clip) / rv2.clip.w;
            for (const glm::vec3& n : {n0, n1, n2})
            {
                if (!std::isfinite(n.x) || !std::isfinite(n.y) || !std::isfinite(n.z)) return;
            }

            const float area_ndc = (n1.x - n0.x) * (n2.y - n0.y) - (n1.y - n0.y) * (n2.x - n0.x);
            if (std::abs(area_ndc) < 1e-14f) return;
            const bool is_cw = area_ndc < 0.0f;
            const bool is_front = (is_cw == rs.front_face_cw);
            if (rs.cull_mode == CullMode::Back && !is_front) return;
            if (rs.cull_mode == CullMode::Front && is_front) return;

            const glm::vec2 s0 = ndc_to_screen(n0, W, H);
            const glm::vec2 s1 = ndc_to_screen(n1, W, H);
            const glm::vec2 s2 = ndc_to_screen(n2, W, H);

            const int minx = std::max(0, (int)std::floor(std::min({s0.x, s1.x, s2.x})));
            const int maxx = std::min(W - 1, (int)std::ceil(std::max({s0.x, s1.x, s2.x})));
            const int miny = std::max(0, (int)std::floor(std::min({s0.y, s1.y, s2.y})));
            const int maxy = std::min(H - 1, (int)std::ceil(std::max({s0.y, s1.y, s2.y})));
            if (minx > maxx || miny > maxy) return;
            stats.tri_raster++;

            const float d0 = n0.z * 0.5f + 0.5f;
            const float d1 = n1.z * 0.5f + 0.5f;
            const float d2 = n2.z * 0.5f + 0.5f;

            float bias = 0.0f;
            if (rs.depth_bias.constant != 0.0f || rs.depth_bias.slope != 0.0f)
            {
                // Screen орон зай дахь гүний хавтгайн налуу.
                const glm::vec2 e1 = s1 - s0;
                const glm::vec2 e2 = s2 - s0;
                const float den = e1.x * e2.y - e1.y * e2.x;
                float max_slope = 0.0f;
                if (std::abs(den) > 1e-12f)
                {
                    const float dzdx = ((d1 - d0) * e2.y - (d2 - d0) * e1.y) / den;
                    const float dzdy = ((d2 - d0) * e1.x - (d1 - d0) * e2.x) / den;
                    max_slope = std::max(std::abs(dzdx), std::abs(dzdy));
                }
                bias = rs.depth_bias.constant * k_depth_bias_unit + rs.depth_bias.slope * max_slope;
            }

            const float invw0 = 1.0f / rv0.clip.w;
            const float invw1 = 1.0f / rv1.clip.w;
            const float invw2 = 1.0f / rv2.clip.w;
            const uint32_t varying_mask = rv0.varying_mask | rv1.varying_mask | rv2.varying_mask;
            std::array<glm::vec4, MURK_MAX_VARYINGS> varw0{};
            std::array<glm::vec4, MURK_MAX_VARYINGS> varw1{};
            std::array<glm::vec4, MURK_MAX_VARYINGS> varw2{};
            for (uint32_t i = 0; i < MURK_MAX_VARYINGS; ++i)
            {
                if ((varying_mask & varying_bit(i)) == 0u) continue;
                varw0[i] = rv0.varyings[i] * invw0;
                varw1[i] = rv1.varyings[i] * invw1;
                varw2[i] = rv2.varyings[i] * invw2;
            }

            const bool shade = target.color && !program.depth_only();
            std::atomic<uint64_t> fragments{0};

            auto raster_rows = [&](int yb, int ye)
            {
                uint64_t local_fragments = 0;
                for (int y = yb; y < ye; ++y)
                {
                    for (int x = minx; x <= maxx; ++x)
                    {
                        const glm::vec2 p{(float)x + 0.5f, (float)y + 0.5f};
                        const glm::vec3 bc = barycentric_2d(p, s0, s1, s2);
                        if (bc.x < 0.0f || bc.y < 0.0f || bc.z < 0.0f) continue;

                        // NDC z нь screen орон зайд шугаман.
                        const float z01 = std::clamp(bc.x * d0 + bc.y * d1 + bc.z * d2 + bias, 0.0f, 1.0f);
                        if (target.depth)
                        {
                            if (!depth_passes(rs.depth_compare, z01, target.depth->at(x, y))) continue;
                        }

                        if (shade)
                        {
                            const float denom = bc.x * invw0 + bc.y * invw1 + bc.z * invw2;
                            if (denom <= 1e-20f) continue;
                            const float inv_denom = 1.0f / denom;

                            FragmentIn fin{};
                            fin.varying_mask = varying_mask;
                            for (uint32_t i = 0; i < MURK_MAX_VARYINGS; ++i)
                            {
                                if ((varying_mask & varying_bit(i)) == 0u) continue;
                                fin.varyings[i] = (bc.x * varw0[i] + bc.y * varw1[i] + bc.z * varw2[i]) * inv_denom;
                            }
                            fin.depth01 = z01;
                            fin.px = x;
                            fin.py = y;

                            const FragmentOut fout = program.fs(fin, uniforms);
                            if (fout.discard) continue;

                            ColorF& dst = target.color->color.at(x, y);
                            dst = blend_color(rs.blend, fout.color, dst);
                        }

                        if (target.depth && rs.depth_write) target.depth->at(x, y) = z01;
                        ++local_fragments;
                    }
                }
                fragments.fetch_add(local_fragments, std::memory_order_relaxed);
            };

            const int bbox_rows = maxy - miny + 1;
            const int bbox_pixels = (maxx - minx + 1) * bbox_rows;
            const bool use_parallel =
                config.job_system &&
                bbox_rows >= std::max(1, config.parallel_min_rows) &&
                bbox_pixels >= std::max(1, config.parallel_min_pixels);
            if (use_parallel)
            {
                parallel_for_1d(config.job_system, miny, maxy + 1, std::max(1, config.parallel_min_rows), raster_rows);
            }
            else
            {
                raster_rows(miny, maxy + 1);
            }
            stats.fragments += fragments.load(std::memory_order_relaxed);
        }
    }

    /*
        Гурвалжнуудыг илгээсэн дарааллаар нь боловсруулна. Нэг гурвалжны дотор
        пиксел бүрийг яг нэг invocation бичих тул мөрүүдийг зэрэгцүүлэхэд blend
        тодорхой (deterministic) хэвээр үлдэнэ.
    */
    inline RasterizerStats rasterize_mesh(
        const MeshData& mesh,
        const ShaderProgram& program,
        const ShaderUniforms& uniforms,
        const RasterizerTarget& target,
        const RasterizerConfig& config = {}
    )
    {
        RasterizerStats stats{};
        if (!program.valid() || mesh.empty()) return stats;
        if (!target.color && !target.depth) return stats;
        if (target.width() <= 0 || target.height() <= 0) return stats;
        if (target.color && target.depth && (target.color->w != target.depth->w || target.color->h != target.depth->h)) return stats;

        const size_t vcount = mesh.positions.size();
        std::vector<detail::RasterVertex> transformed(vcount);
        for (size_t i = 0; i < vcount; ++i)
        {
            const VertexOut vo = program.vs(fetch_vertex(mesh, (uint32_t)i), uniforms);
            transformed[i] = detail::RasterVertex{vo.clip, vo.varyings, vo.varying_mask};
        }

        std::vector<detail::RasterVertex> poly{};
        poly.reserve(9);
        for (size_t ti = 0; ti + 2 < mesh.indices.size(); ti += 3)
        {
            stats.tri_input++;
            const uint32_t i0 = mesh.indices[ti + 0];
            const uint32_t i1 = mesh.indices[ti + 1];
            const uint32_t i2 = mesh.indices[ti + 2];
            if (i0 >= vcount || i1 >= vcount || i2 >= vcount) continue;

            poly.assign({transformed[i0], transformed[i1], transformed[i2]});
            const bool inside =
                detail::inside_clip_volume(poly[0].clip) &&
                detail::inside_clip_volume(poly[1].clip) &&
                detail::inside_clip_volume(poly[2].clip);
            if (!inside) detail::clip_polygon_frustum(poly);
            if (poly.size() < 3) continue;

            for (size_t k = 1; k + 1 < poly.size(); ++k)
            {
                stats.tri_after_clip++;
                detail::raster_triangle(poly[0], poly[k], poly[k + 1], program, uniforms, target, config, stats);
            }
        }
        return stats;
    }

    inline RasterizerStats rasterize_mesh_instanced(
        const MeshData& mesh,
        const ShaderProgram& program,
        const ShaderUniforms& uniforms,
        const std::vector<InstanceData>& instances,
        const RasterizerTarget& target,
        const RasterizerConfig& config = {}
    )
    {
        RasterizerStats stats{};
        ShaderUniforms u = uniforms;
        for (const InstanceData& inst : instances)
        {
            u.instance = inst;
            stats += rasterize_mesh(mesh, program, u, target, config);
        }
        return stats;
    }
}
