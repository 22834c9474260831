#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: uniforms.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Camera болон light uniform buffer-ийн std140-тэй нийцэх byte layout.
*/


#include <cstddef>

#include <glm/glm.hpp>

namespace shc
{
    // view_position нь w = 1 бүхий world-space нүдний байрлал (16 byte alignment-д зориулж vec4).
    struct CameraUniform
    {
        glm::vec4 view_position{0.0f, 0.0f, 0.0f, 1.0f};
        glm::mat4 view_proj{1.0f};
    };

    struct LightUniform
    {
        glm::vec3 position{0.0f};
        float pad0 = 0.0f;
        glm::vec3 color{1.0f};
        float pad1 = 0.0f;
    };

    static_assert(sizeof(CameraUniform) == 80, "CameraUniform must match the 80-byte uniform layout");
    static_assert(offsetof(CameraUniform, view_proj) == 16, "CameraUniform::view_proj must start at byte 16");
    static_assert(sizeof(LightUniform) == 32, "LightUniform must match the 32-byte uniform layout");
    static_assert(offsetof(LightUniform, color) == 16, "LightUniform::color must start at byte 16");

    inline LightUniform make_light_uniform(const glm::vec3& position, const glm::vec3& color)
    {
        LightUniform u{};
        u.position = position;
        u.color = color;
        return u;
    }
}
