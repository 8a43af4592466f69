#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: rt_types.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Render target-уудын пикселийн төрөл ба 2D буфер: float өнгө (HDR),
            8 битийн дэлгэцийн өнгө (LDR), гүний буфер.
*/


#include <algorithm>
#include <cstdint>
#include <vector>

namespace murk
{
    struct Color
    {
        uint8_t r, g, b, a;
    };

    struct ColorF
    {
        float r, g, b, a;
    };

    template<typename TPixel>
    struct PixelBuffer2D
    {
        int w = 0;
        int h = 0;
        std::vector<TPixel> data;

        PixelBuffer2D() = default;
        PixelBuffer2D(int W, int H, const TPixel& clear) { resize(W, H, clear); }

        void resize(int W, int H, const TPixel& clear)
        {
            w = std::max(0, W);
            h = std::max(0, H);
            data.assign((size_t)w * (size_t)h, clear);
        }

        void clear(const TPixel& clear_value)
        {
            std::fill(data.begin(), data.end(), clear_value);
        }

        bool empty() const { return w <= 0 || h <= 0; }

        TPixel& at(int x, int y) { return data[(size_t)y * (size_t)w + (size_t)x]; }
        const TPixel& at(int x, int y) const { return data[(size_t)y * (size_t)w + (size_t)x]; }

        // Хүрээнээс гарсан координатыг ирмэг рүү хавчина (clamp-to-edge).
        const TPixel& at_clamped(int x, int y) const
        {
            x = std::clamp(x, 0, w - 1);
            y = std::clamp(y, 0, h - 1);
            return at(x, y);
        }
    };

    // Tonemap хийгдсэн шугаман float өнгө. Fog pass энд alpha-blend хийнэ.
    struct RT_ColorHDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<ColorF> color;

        RT_ColorHDR() = default;
        RT_ColorHDR(int W, int H, ColorF clear = {0.0f, 0.0f, 0.0f, 1.0f}) : w(W), h(H), color(W, H, clear) {}

        void clear(ColorF c = {0.0f, 0.0f, 0.0f, 1.0f}) { color.clear(c); }
    };

    struct RT_ColorLDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<Color> color;

        RT_ColorLDR() = default;
        RT_ColorLDR(int W, int H, Color clear = {0, 0, 0, 255}) : w(W), h(H), color(W, H, clear) {}

        void clear(Color c = {0, 0, 0, 255}) { color.clear(c); }
    };

    /*
        Гүний утга нь NDC z-г [0, 1] рүү буулгасан device depth (z*0.5+0.5).
        zn/zf нь fog pass шугаман гүн сэргээхэд хэрэглэгдэнэ.
    */
    struct RT_DepthBuffer
    {
        int w = 0;
        int h = 0;
        float zn = 1.0f;
        float zf = 3000.0f;
        PixelBuffer2D<float> depth;

        RT_DepthBuffer() = default;
        RT_DepthBuffer(int W, int H, float ZN = 1.0f, float ZF = 3000.0f)
            : w(W), h(H), zn(ZN), zf(ZF), depth(W, H, 1.0f)
        {}

        void clear(float d = 1.0f) { depth.clear(d); }
    };
}
