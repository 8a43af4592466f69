#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: material.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: PBR материал: diffuse (sRGB), normal map, roughness/metalness
            texture (glTF: G = roughness, B = metalness) ба үржүүлэгч коэффициент.
*/


#include <string>
#include <utility>

#include "murk/resources/texture.hpp"

namespace murk
{
    struct MaterialData
    {
        std::string name{};

        Texture2DData diffuse{};
        Texture2DData normal{};
        Texture2DData roughness_metalness{};
        SamplerDesc sampler{};

        float metallic_factor = 1.0f;
        float roughness_factor = 1.0f;
    };

    /*
        Texture-гүй материал: 1x1 diffuse, хавтгай normal (0.5, 0.5, 1),
        rm = (_, 1, 1) тул factor-ууд шууд roughness/metalness болно.
    */
    inline MaterialData make_flat_material(std::string name, Color diffuse, float roughness, float metallic)
    {
        MaterialData m{};
        m.name = std::move(name);
        m.diffuse = make_solid_texture(diffuse, m.name + ".diffuse");
        m.normal = make_solid_texture(Color{128, 128, 255, 255}, m.name + ".normal");
        m.roughness_metalness = make_solid_texture(Color{255, 255, 255, 255}, m.name + ".rm");
        m.roughness_factor = roughness;
        m.metallic_factor = metallic;
        return m;
    }
}
