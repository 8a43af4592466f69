#include <cmath>
#include <cstdio>
#include <vector>

#include <glm/glm.hpp>

#include "murk/job/thread_pool_job_system.hpp"
#include "murk/render/rasterizer.hpp"
#include "murk/resources/primitives.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    // NDC дахь бүтэн дэлгэцийн quad. Индексийн дараалал NDC-д цагийн зүүний дагуу (урд тал).
    murk::MeshData make_ndc_quad(float z, bool clockwise = true)
    {
        murk::MeshData m{};
        m.name = "ndc_quad";
        m.positions = {
            {-1.0f, -1.0f, z},
            {-1.0f,  1.0f, z},
            { 1.0f,  1.0f, z},
            { 1.0f, -1.0f, z},
        };
        if (clockwise) m.indices = {0, 1, 2, 0, 2, 3};
        else m.indices = {0, 2, 1, 0, 3, 2};
        return m;
    }

    murk::ShaderProgram make_flat_program(murk::ColorF color)
    {
        murk::ShaderProgram p{};
        p.vs = [](const murk::ShaderVertex& vin, const murk::ShaderUniforms&) -> murk::VertexOut {
            murk::VertexOut o{};
            o.clip = glm::vec4(vin.position, 1.0f);
            return o;
        };
        p.fs = [color](const murk::FragmentIn&, const murk::ShaderUniforms&) -> murk::FragmentOut {
            murk::FragmentOut o{};
            o.color = color;
            return o;
        };
        return p;
    }

    bool test_depth_test_keeps_nearest()
    {
        murk::RT_ColorHDR color{8, 8};
        murk::PixelBuffer2D<float> depth{8, 8, 1.0f};
        const murk::RasterizerTarget target{&color, &depth};
        const murk::RasterizerConfig cfg{};
        const murk::ShaderUniforms u{};

        murk::rasterize_mesh(make_ndc_quad(0.5f), make_flat_program({1.0f, 0.0f, 0.0f, 1.0f}), u, target, cfg);
        murk::rasterize_mesh(make_ndc_quad(0.0f), make_flat_program({0.0f, 1.0f, 0.0f, 1.0f}), u, target, cfg);
        murk::rasterize_mesh(make_ndc_quad(0.8f), make_flat_program({0.0f, 0.0f, 1.0f, 1.0f}), u, target, cfg);

        for (int y = 0; y < 8; ++y)
        {
            for (int x = 0; x < 8; ++x)
            {
                const murk::ColorF c = color.color.at(x, y);
                if (!approx_eq(c.g, 1.0f) || !approx_eq(c.r, 0.0f) || !approx_eq(c.b, 0.0f)) return false;
                if (!approx_eq(depth.at(x, y), 0.5f)) return false;
            }
        }
        return true;
    }

    bool test_alpha_blend_over_background()
    {
        murk::RT_ColorHDR color{4, 4, murk::ColorF{0.0f, 0.0f, 0.0f, 1.0f}};
        const murk::RasterizerTarget target{&color, nullptr};
        murk::RasterizerConfig cfg{};
        cfg.state.blend = murk::BlendMode::AlphaBlend;
        cfg.state.depth_write = false;

        const murk::RasterizerStats st = murk::rasterize_mesh(
            make_ndc_quad(0.0f), make_flat_program({1.0f, 1.0f, 1.0f, 0.25f}), murk::ShaderUniforms{}, target, cfg);
        if (st.fragments == 0) return false;

        // (0, 0) пиксел диагональ дээр биш тул нэг л удаа blend хийгдэнэ.
        const murk::ColorF c = color.color.at(0, 0);
        return approx_eq(c.r, 0.25f) && approx_eq(c.g, 0.25f) && approx_eq(c.b, 0.25f);
    }

    bool test_back_face_culling()
    {
        murk::RT_ColorHDR color{8, 8};
        murk::PixelBuffer2D<float> depth{8, 8, 1.0f};
        const murk::RasterizerTarget target{&color, &depth};
        const murk::ShaderProgram prog = make_flat_program({1.0f, 1.0f, 1.0f, 1.0f});

        murk::RasterizerConfig back{};
        const murk::RasterizerStats culled = murk::rasterize_mesh(make_ndc_quad(0.0f, false), prog, murk::ShaderUniforms{}, target, back);
        if (culled.tri_input != 2 || culled.tri_raster != 0 || culled.fragments != 0) return false;

        murk::RasterizerConfig front = back;
        front.state.cull_mode = murk::CullMode::Front;
        const murk::RasterizerStats drawn = murk::rasterize_mesh(make_ndc_quad(0.0f, false), prog, murk::ShaderUniforms{}, target, front);
        if (drawn.tri_raster != 2 || drawn.fragments == 0) return false;

        murk::RasterizerConfig none = back;
        none.state.cull_mode = murk::CullMode::None;
        depth.clear(1.0f);
        const murk::RasterizerStats both = murk::rasterize_mesh(make_ndc_quad(0.0f, true), prog, murk::ShaderUniforms{}, target, none);
        return both.tri_raster == 2;
    }

    bool test_depth_only_and_bias()
    {
        murk::PixelBuffer2D<float> depth{16, 16, 1.0f};
        const murk::RasterizerTarget target{nullptr, &depth};
        murk::ShaderProgram prog = make_flat_program({1.0f, 1.0f, 1.0f, 1.0f});
        prog.fs = {};
        if (!prog.depth_only()) return false;

        murk::RasterizerConfig cfg{};
        cfg.state.cull_mode = murk::CullMode::None;
        cfg.state.depth_compare = murk::DepthCompare::LessEqual;
        murk::rasterize_mesh(make_ndc_quad(0.0f), prog, murk::ShaderUniforms{}, target, cfg);
        const float plain = depth.at(7, 7);
        if (!approx_eq(plain, 0.5f)) return false;

        // Хавтгай гурвалжинд зөвхөн тогтмол bias нөлөөлнө.
        depth.clear(1.0f);
        cfg.state.depth_bias = murk::DepthBias{2048.0f, 2.0f};
        murk::rasterize_mesh(make_ndc_quad(0.0f), prog, murk::ShaderUniforms{}, target, cfg);
        return approx_eq(depth.at(7, 7), 0.5f + 2048.0f * murk::k_depth_bias_unit, 1e-6f);
    }

    bool test_clipping_near_plane()
    {
        murk::RT_ColorHDR color{8, 8};
        murk::PixelBuffer2D<float> depth{8, 8, 1.0f};
        const murk::RasterizerTarget target{&color, &depth};

        // Нэг орой w < 0 (камерын ард) байрлана.
        murk::MeshData m{};
        m.positions = {{-1.0f, -1.0f, 0.0f}, {-1.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 0.0f}};
        m.indices = {0, 1, 2};
        murk::ShaderProgram prog = make_flat_program({1.0f, 1.0f, 1.0f, 1.0f});
        prog.vs = [](const murk::ShaderVertex& vin, const murk::ShaderUniforms&) -> murk::VertexOut {
            murk::VertexOut o{};
            const float w = (vin.position.x > 0.0f) ? -1.0f : 1.0f;
            o.clip = glm::vec4(vin.position.x, vin.position.y, 0.0f, w);
            return o;
        };
        murk::RasterizerConfig cfg{};
        cfg.state.cull_mode = murk::CullMode::None;
        const murk::RasterizerStats st = murk::rasterize_mesh(m, prog, murk::ShaderUniforms{}, target, cfg);
        if (st.tri_input != 1) return false;
        for (float d : depth.data)
        {
            if (!std::isfinite(d) || d < 0.0f || d > 1.0f) return false;
        }
        return true;
    }

    bool test_perspective_correct_varyings()
    {
        murk::RT_ColorHDR color{32, 32};
        const murk::RasterizerTarget target{&color, nullptr};

        murk::MeshData m = make_ndc_quad(0.0f);
        m.uvs = {{0.0f, 0.0f}, {0.0f, 1.0f}, {1.0f, 1.0f}, {1.0f, 0.0f}};

        murk::ShaderProgram prog{};
        prog.vs = [](const murk::ShaderVertex& vin, const murk::ShaderUniforms&) -> murk::VertexOut {
            murk::VertexOut o{};
            // Баруун тал нь 4 дахин хол.
            const float w = (vin.position.x > 0.0f) ? 4.0f : 1.0f;
            o.clip = glm::vec4(vin.position.x * w, vin.position.y * w, 0.0f, w);
            murk::set_varying(o, murk::VaryingSemantic::UV0, glm::vec4(vin.uv, 0.0f, 0.0f));
            return o;
        };
        prog.fs = [](const murk::FragmentIn& fin, const murk::ShaderUniforms&) -> murk::FragmentOut {
            murk::FragmentOut o{};
            const glm::vec4 uv = murk::get_varying(fin, murk::VaryingSemantic::UV0);
            o.color = murk::ColorF{uv.x, uv.y, 0.0f, 1.0f};
            return o;
        };

        murk::RasterizerConfig cfg{};
        cfg.state.cull_mode = murk::CullMode::None;
        murk::rasterize_mesh(m, prog, murk::ShaderUniforms{}, target, cfg);

        // Дэлгэцийн төвд u нь шугаман 0.5 биш, ойрын тал руу шилжинэ (1 / (1 + 4) = 0.2).
        const float u_center = color.color.at(16, 16).r;
        return u_center > 0.15f && u_center < 0.3f;
    }

    bool test_parallel_rows_match_serial()
    {
        murk::MeshData sphere = murk::make_sphere(murk::SphereDesc{0.8f, 24, 16});
        murk::ShaderProgram prog{};
        prog.vs = [](const murk::ShaderVertex& vin, const murk::ShaderUniforms&) -> murk::VertexOut {
            murk::VertexOut o{};
            o.clip = glm::vec4(vin.position.x, vin.position.y, vin.position.z * 0.5f, 1.0f);
            murk::set_varying(o, murk::VaryingSemantic::Color0, glm::vec4(vin.normal * 0.5f + 0.5f, 1.0f));
            return o;
        };
        prog.fs = [](const murk::FragmentIn& fin, const murk::ShaderUniforms&) -> murk::FragmentOut {
            murk::FragmentOut o{};
            const glm::vec4 c = murk::get_varying(fin, murk::VaryingSemantic::Color0);
            o.color = murk::ColorF{c.r, c.g, c.b, 1.0f};
            return o;
        };

        murk::RT_ColorHDR serial_color{96, 96};
        murk::PixelBuffer2D<float> serial_depth{96, 96, 1.0f};
        murk::RasterizerConfig serial_cfg{};
        serial_cfg.state.cull_mode = murk::CullMode::None;
        murk::rasterize_mesh(sphere, prog, murk::ShaderUniforms{}, {&serial_color, &serial_depth}, serial_cfg);

        murk::ThreadPoolJobSystem jobs{4};
        murk::RT_ColorHDR par_color{96, 96};
        murk::PixelBuffer2D<float> par_depth{96, 96, 1.0f};
        murk::RasterizerConfig par_cfg = serial_cfg;
        par_cfg.job_system = &jobs;
        par_cfg.parallel_min_rows = 2;
        par_cfg.parallel_min_pixels = 1;
        murk::rasterize_mesh(sphere, prog, murk::ShaderUniforms{}, {&par_color, &par_depth}, par_cfg);

        for (size_t i = 0; i < serial_depth.data.size(); ++i)
        {
            if (serial_depth.data[i] != par_depth.data[i]) return false;
            const murk::ColorF& a = serial_color.color.data[i];
            const murk::ColorF& b = par_color.color.data[i];
            if (a.r != b.r || a.g != b.g || a.b != b.b) return false;
        }
        return true;
    }

    bool test_instanced_draw_counts()
    {
        murk::PixelBuffer2D<float> depth{8, 8, 1.0f};
        murk::ShaderProgram prog{};
        prog.vs = [](const murk::ShaderVertex& vin, const murk::ShaderUniforms& u) -> murk::VertexOut {
            murk::VertexOut o{};
            o.clip = u.instance.model * glm::vec4(vin.position, 1.0f);
            return o;
        };
        std::vector<murk::InstanceData> instances(3);
        murk::RasterizerConfig cfg{};
        cfg.state.cull_mode = murk::CullMode::None;
        cfg.state.depth_compare = murk::DepthCompare::Always;
        const murk::RasterizerStats st = murk::rasterize_mesh_instanced(
            make_ndc_quad(0.0f), prog, murk::ShaderUniforms{}, instances, {nullptr, &depth}, cfg);
        return st.tri_input == 6 && st.tri_raster == 6;
    }
}

int main()
{
    const bool ok_depth = test_depth_test_keeps_nearest();
    const bool ok_blend = test_alpha_blend_over_background();
    const bool ok_cull = test_back_face_culling();
    const bool ok_bias = test_depth_only_and_bias();
    const bool ok_clip = test_clipping_near_plane();
    const bool ok_persp = test_perspective_correct_varyings();
    const bool ok_parallel = test_parallel_rows_match_serial();
    const bool ok_instanced = test_instanced_draw_counts();

    if (!ok_depth) std::fprintf(stderr, "[murk-tests] depth test ordering failed\n");
    if (!ok_blend) std::fprintf(stderr, "[murk-tests] alpha blend failed\n");
    if (!ok_cull) std::fprintf(stderr, "[murk-tests] face culling failed\n");
    if (!ok_bias) std::fprintf(stderr, "[murk-tests] depth-only / depth bias failed\n");
    if (!ok_clip) std::fprintf(stderr, "[murk-tests] near plane clipping failed\n");
    if (!ok_persp) std::fprintf(stderr, "[murk-tests] perspective-correct varyings failed\n");
    if (!ok_parallel) std::fprintf(stderr, "[murk-tests] parallel raster mismatch\n");
    if (!ok_instanced) std::fprintf(stderr, "[murk-tests] instanced draw failed\n");

    if (!(ok_depth && ok_blend && ok_cull && ok_bias && ok_clip && ok_persp && ok_parallel && ok_instanced)) return 1;
    std::fprintf(stderr, "[murk-tests] raster: all tests passed\n");
    return 0;
}
