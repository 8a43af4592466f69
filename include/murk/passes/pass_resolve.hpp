#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: pass_resolve.hpp
    МОДУЛЬ: passes
    ЗОРИЛГО: Tonemap хийгдсэн шугаман float өнгийг gamma кодчилж 8 битийн
            дэлгэцийн буфер руу хөрвүүлнэ.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include "murk/core/context.hpp"
#include "murk/frame/frame_params.hpp"
#include "murk/gfx/rt_types.hpp"
#include "murk/job/job_system.hpp"
#include "murk/math/tonemap.hpp"

namespace murk
{
    inline uint8_t unorm8(float v)
    {
        return (uint8_t)std::clamp((int)std::lround(v * 255.0f), 0, 255);
    }

    class PassResolve
    {
    public:
        struct Inputs
        {
            const FrameParams* fp = nullptr;
            const RT_ColorHDR* hdr = nullptr;
            RT_ColorLDR* ldr = nullptr;
        };

        void execute(Context& ctx, const Inputs& in)
        {
            if (!in.fp || !in.hdr || !in.ldr) return;
            if (in.hdr->w <= 0 || in.hdr->h <= 0 || in.ldr->w <= 0 || in.ldr->h <= 0) return;
            ScopedPassTimer timer(ctx.debug.ms_resolve);

            const int w = std::min(in.hdr->w, in.ldr->w);
            const int h = std::min(in.hdr->h, in.ldr->h);
            const float gamma = in.fp->pass.resolve.gamma;

            parallel_for_1d(ctx.job_system, 0, h, 8, [&](int yb, int ye)
            {
                for (int y = yb; y < ye; ++y)
                {
                    for (int x = 0; x < w; ++x)
                    {
                        const ColorF s = in.hdr->color.at(x, y);
                        in.ldr->color.at(x, y) = Color{
                            unorm8(gamma_encode(s.r, gamma)),
                            unorm8(gamma_encode(s.g, gamma)),
                            unorm8(gamma_encode(s.b, gamma)),
                            255
                        };
                    }
                }
            });
        }
    };
}
