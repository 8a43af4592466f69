#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: texture.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: 8 битийн RGBA texture, sampler-ийн тохиргоо (repeat/clamp,
            linear/nearest) ба bilinear дээж авалт.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "murk/core/result.hpp"
#include "murk/gfx/rt_types.hpp"

namespace murk
{
    struct Texture2DData
    {
        std::string name{};
        int w = 0;
        int h = 0;
        std::vector<Color> texels{};

        Texture2DData() = default;
        Texture2DData(int W, int H, Color clear = {0, 0, 0, 255})
            : w(W), h(H), texels((size_t)W * (size_t)H, clear)
        {}

        bool valid() const
        {
            return w > 0 && h > 0 && texels.size() == (size_t)w * (size_t)h;
        }

        Color& at(int x, int y)
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }

        const Color& at(int x, int y) const
        {
            return texels[(size_t)y * (size_t)w + (size_t)x];
        }
    };

    enum class AddressMode
    {
        Repeat,
        ClampToEdge
    };

    enum class FilterMode
    {
        Nearest,
        Linear
    };

    struct SamplerDesc
    {
        AddressMode address = AddressMode::Repeat;
        FilterMode filter = FilterMode::Linear;
    };

    // Эгнээ тус бүр 4 байт (RGBA8), дээрээс доош.
    inline Result<Texture2DData> make_texture_rgba8(int w, int h, const std::vector<uint8_t>& rgba, std::string name = {})
    {
        if (w <= 0 || h <= 0)
        {
            return Result<Texture2DData>::failure("texture '" + name + "': invalid size");
        }
        const size_t expected = (size_t)w * (size_t)h * 4u;
        if (rgba.size() != expected)
        {
            return Result<Texture2DData>::failure(
                "texture '" + name + "': expected " + std::to_string(expected) +
                " bytes, got " + std::to_string(rgba.size()));
        }
        Texture2DData t(w, h);
        t.name = std::move(name);
        for (size_t i = 0; i < t.texels.size(); ++i)
        {
            t.texels[i] = Color{rgba[i * 4 + 0], rgba[i * 4 + 1], rgba[i * 4 + 2], rgba[i * 4 + 3]};
        }
        return Result<Texture2DData>::success(std::move(t));
    }

    inline Texture2DData make_solid_texture(Color c, std::string name = {})
    {
        Texture2DData t(1, 1, c);
        t.name = std::move(name);
        return t;
    }

    inline Texture2DData make_checker_texture(int size, int cells, Color a, Color b, std::string name = {})
    {
        Texture2DData t(size, size, a);
        t.name = std::move(name);
        const int cell = std::max(1, size / std::max(1, cells));
        for (int y = 0; y < size; ++y)
        {
            for (int x = 0; x < size; ++x)
            {
                if (((x / cell) + (y / cell)) & 1) t.at(x, y) = b;
            }
        }
        return t;
    }

    namespace detail
    {
        inline int wrap_texel(int i, int n, AddressMode mode)
        {
            if (mode == AddressMode::ClampToEdge) return std::clamp(i, 0, n - 1);
            const int m = i % n;
            return m < 0 ? m + n : m;
        }

        inline glm::vec4 texel_unorm(const Color& c)
        {
            return glm::vec4((float)c.r, (float)c.g, (float)c.b, (float)c.a) * (1.0f / 255.0f);
        }
    }

    // Түүхий [0, 1] утга буцаана. sRGB задлалыг дуудагч хийнэ.
    inline glm::vec4 sample_texture(const Texture2DData* tex, const glm::vec2& uv, const SamplerDesc& s = {})
    {
        if (!tex || !tex->valid()) return glm::vec4(1.0f);

        const float fx = uv.x * (float)tex->w;
        const float fy = uv.y * (float)tex->h;
        if (s.filter == FilterMode::Nearest)
        {
            const int x = detail::wrap_texel((int)std::floor(fx), tex->w, s.address);
            const int y = detail::wrap_texel((int)std::floor(fy), tex->h, s.address);
            return detail::texel_unorm(tex->at(x, y));
        }

        const float tx = fx - 0.5f;
        const float ty = fy - 0.5f;
        const float x0f = std::floor(tx);
        const float y0f = std::floor(ty);
        const float ax = tx - x0f;
        const float ay = ty - y0f;
        const int x0 = detail::wrap_texel((int)x0f, tex->w, s.address);
        const int x1 = detail::wrap_texel((int)x0f + 1, tex->w, s.address);
        const int y0 = detail::wrap_texel((int)y0f, tex->h, s.address);
        const int y1 = detail::wrap_texel((int)y0f + 1, tex->h, s.address);

        const glm::vec4 c00 = detail::texel_unorm(tex->at(x0, y0));
        const glm::vec4 c10 = detail::texel_unorm(tex->at(x1, y0));
        const glm::vec4 c01 = detail::texel_unorm(tex->at(x0, y1));
        const glm::vec4 c11 = detail::texel_unorm(tex->at(x1, y1));
        return glm::mix(glm::mix(c00, c10, ax), glm::mix(c01, c11, ax), ay);
    }
}
