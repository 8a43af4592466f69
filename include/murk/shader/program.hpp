#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: program.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex ба fragment stage-ийг хослуулсан shader program.
*/


#include <functional>

#include "murk/shader/types.hpp"

namespace murk
{
    using VertexShaderFn = std::function<VertexOut(const ShaderVertex&, const ShaderUniforms&)>;
    using FragmentShaderFn = std::function<FragmentOut(const FragmentIn&, const ShaderUniforms&)>;

    // fs хоосон бол зөвхөн гүн бичих (depth-only) program.
    struct ShaderProgram
    {
        VertexShaderFn vs{};
        FragmentShaderFn fs{};

        bool valid() const
        {
            return (bool)vs;
        }

        bool depth_only() const
        {
            return !fs;
        }
    };
}
