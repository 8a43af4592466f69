#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: rt_shadow.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Цэгэн гэрлийн 6 давхаргатай сүүдрийн гүний массив ба харьцуулалтын
            (comparison) sampler-ийн CPU дүрслэл.
*/


#include <array>
#include <cmath>

#include "murk/gfx/rt_types.hpp"

namespace murk
{
    inline constexpr int k_cube_face_count = 6;

    struct RT_ShadowCube
    {
        int size = 0;
        std::array<PixelBuffer2D<float>, k_cube_face_count> layers{};

        RT_ShadowCube() = default;
        explicit RT_ShadowCube(int S) { resize(S); }

        void resize(int S)
        {
            size = S;
            for (auto& l : layers) l.resize(S, S, 1.0f);
        }

        void clear(float v = 1.0f)
        {
            for (auto& l : layers) l.clear(v);
        }

        bool valid() const { return size > 0; }
    };

    /*
        LessEqual харьцуулалттай, шугаман шүүлтүүртэй, clamp-to-edge sampler.
        4 хөрш texel тус бүрийн 0/1 харьцуулалтыг bilinear жингээр холино.
        (texel_dx, texel_dy) нь бүхэл texel-ийн шилжилт.
    */
    inline float sample_compare_linear_clamped(
        const PixelBuffer2D<float>& layer,
        float u,
        float v,
        float depth_ref,
        int texel_dx = 0,
        int texel_dy = 0
    )
    {
        if (layer.empty()) return 1.0f;

        const float tx = u * (float)layer.w - 0.5f + (float)texel_dx;
        const float ty = v * (float)layer.h - 0.5f + (float)texel_dy;
        const float fx0 = std::floor(tx);
        const float fy0 = std::floor(ty);
        const float ax = tx - fx0;
        const float ay = ty - fy0;
        const int x0 = (int)fx0;
        const int y0 = (int)fy0;

        const auto cmp = [&](int x, int y) -> float {
            return depth_ref <= layer.at_clamped(x, y) ? 1.0f : 0.0f;
        };

        const float top = cmp(x0, y0) * (1.0f - ax) + cmp(x0 + 1, y0) * ax;
        const float bot = cmp(x0, y0 + 1) * (1.0f - ax) + cmp(x0 + 1, y0 + 1) * ax;
        return top * (1.0f - ay) + bot * ay;
    }
}
