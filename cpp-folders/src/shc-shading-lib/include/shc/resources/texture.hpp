#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: texture.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: RGBA8 texel бүхий 2D texture. Diffuse нь sRGB, normal map нь linear format-тай.
*/


#include <cstdint>
#include <string>
#include <vector>

#include "shc/gfx/rt_types.hpp"
#include "shc/rhi/resource_desc.hpp"

namespace shc
{
    struct Texture2DData
    {
        std::string label{};
        int w = 0;
        int h = 0;
        RHIFormat format = RHIFormat::RGBA8_UNorm_sRGB;
        // Мөр 0 нь uv.y = 0 талд байрлана.
        std::vector<Color> texels{};

        Texture2DData() = default;
        Texture2DData(int W, int H, RHIFormat fmt, Color clear = {0, 0, 0, 255})
            : w(W), h(H), format(fmt), texels((size_t)W * (size_t)H, clear)
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
}
