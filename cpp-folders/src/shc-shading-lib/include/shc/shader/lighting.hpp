#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: lighting.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Tangent-space Blinn-Phong-ийн ambient/diffuse/specular гишүүд болон
            normal map texel decode.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

namespace shc
{
    // Pipeline үүсгэх үед тогтоогддог гэрэлтүүлгийн тогтмолууд.
    struct LightingConfig
    {
        float ambient_strength = 0.1f;
        float shininess = 32.0f;
    };

    // [0,1]-д хадгалсан normal texel-ийг [-1,1] чиглэл болгоно. Дахин normalize хийхгүй:
    // map-ийг asset pipeline normalize хийсэн гэж үзнэ.
    inline glm::vec3 decode_normal_sample(const glm::vec4& texel)
    {
        return glm::vec3(texel) * 2.0f - glm::vec3(1.0f);
    }

    struct BlinnPhongTerms
    {
        glm::vec3 ambient{0.0f};
        glm::vec3 diffuse{0.0f};
        glm::vec3 specular{0.0f};

        glm::vec3 sum() const { return ambient + diffuse + specular; }
    };

    // light_dir, view_dir нь unit урттай, гадаргуугаас гэрэл/камер руу чиглэнэ.
    inline BlinnPhongTerms evaluate_blinn_phong(
        const glm::vec3& normal,
        const glm::vec3& light_dir,
        const glm::vec3& view_dir,
        const glm::vec3& light_color,
        const LightingConfig& cfg
    )
    {
        BlinnPhongTerms t{};
        t.ambient = light_color * cfg.ambient_strength;

        const float n_dot_l = std::max(glm::dot(normal, light_dir), 0.0f);
        t.diffuse = light_color * n_dot_l;

        const glm::vec3 half_dir = glm::normalize(view_dir + light_dir);
        const float n_dot_h = std::max(glm::dot(normal, half_dir), 0.0f);
        t.specular = light_color * std::pow(n_dot_h, cfg.shininess);
        return t;
    }

    // Alpha нь albedo-гийнхоо хэвээр. Гаралтыг [0,1]-д clamp хийхгүй.
    inline glm::vec4 combine_blinn_phong(const BlinnPhongTerms& terms, const glm::vec4& albedo)
    {
        return glm::vec4(terms.sum() * glm::vec3(albedo), albedo.a);
    }
}
