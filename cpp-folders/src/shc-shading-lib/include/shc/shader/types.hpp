#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: types.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex stage-ийн гаралт (clip + varying), fragment stage-ийн оролт/гаралт,
            bind group-уудаас задарсан shader resource-ууд.
*/


#include <array>
#include <cstdint>

#include <glm/glm.hpp>

#include "shc/gfx/rt_types.hpp"
#include "shc/resources/texture.hpp"
#include "shc/rhi/resource_desc.hpp"
#include "shc/shader/lighting.hpp"
#include "shc/shader/uniforms.hpp"

namespace shc
{
    constexpr uint32_t SHC_MAX_VARYINGS = 8;

    enum class VaryingSemantic : uint32_t
    {
        TexCoord = 0,
        TangentPosition = 1,
        TangentLightPosition = 2,
        TangentViewPosition = 3
    };

    inline constexpr uint32_t varying_bit(uint32_t slot) { return (1u << slot); }

    struct VertexOut
    {
        glm::vec4 clip{0.0f, 0.0f, 0.0f, 1.0f};
        std::array<glm::vec4, SHC_MAX_VARYINGS> varyings{};
        uint32_t varying_mask = 0u;
    };

    struct FragmentIn
    {
        std::array<glm::vec4, SHC_MAX_VARYINGS> varyings{};
        uint32_t varying_mask = 0u;
        float depth01 = 1.0f;
        int px = 0;
        int py = 0;
    };

    struct FragmentOut
    {
        ColorF color{0.0f, 0.0f, 0.0f, 1.0f};
        bool discard = false;
    };

    // Draw-ийн турш өөрчлөгдөхгүй, зөвхөн уншигдах resource-ууд.
    struct ShaderResources
    {
        CameraUniform camera{};
        LightUniform light{};
        const Texture2DData* diffuse_tex = nullptr;
        RHISamplerDesc diffuse_sampler{};
        const Texture2DData* normal_tex = nullptr;
        RHISamplerDesc normal_sampler{};
        LightingConfig lighting{};
    };

    inline void set_varying(VertexOut& out, VaryingSemantic semantic, const glm::vec4& v)
    {
        const uint32_t i = (uint32_t)semantic;
        out.varyings[i] = v;
        out.varying_mask |= varying_bit(i);
    }

    inline glm::vec4 get_varying(const FragmentIn& in, VaryingSemantic semantic, const glm::vec4& fallback = glm::vec4(0.0f))
    {
        const uint32_t i = (uint32_t)semantic;
        if ((in.varying_mask & varying_bit(i)) == 0u) return fallback;
        return in.varyings[i];
    }

    inline glm::vec4 get_varying(const VertexOut& out, VaryingSemantic semantic, const glm::vec4& fallback = glm::vec4(0.0f))
    {
        const uint32_t i = (uint32_t)semantic;
        if ((out.varying_mask & varying_bit(i)) == 0u) return fallback;
        return out.varyings[i];
    }

    // Rasterizer-ийн interpolate хийлгүйгээр vertex гаралтыг fragment оролт болгоно.
    inline FragmentIn fragment_input_from(const VertexOut& v)
    {
        FragmentIn f{};
        f.varyings = v.varyings;
        f.varying_mask = v.varying_mask;
        return f;
    }

    inline ColorF to_color(const glm::vec4& c)
    {
        return ColorF{c.r, c.g, c.b, c.a};
    }
}
