#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: sampler.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: RHISamplerDesc-ийн filter/address mode-оор Texture2DData-г sample хийнэ.
            Mip level байхгүй тул magnification filter-ийг ашиглана.
*/


#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

#include "shc/resources/texture.hpp"

namespace shc
{
    inline float srgb_to_linear(float c)
    {
        if (c <= 0.04045f) return c / 12.92f;
        return std::pow((c + 0.055f) / 1.055f, 2.4f);
    }

    inline glm::vec4 texel_to_float(const Texture2DData& tex, const Color& c)
    {
        glm::vec4 v{
            (float)c.r / 255.0f,
            (float)c.g / 255.0f,
            (float)c.b / 255.0f,
            (float)c.a / 255.0f
        };
        if (format_is_srgb(tex.format))
        {
            v.r = srgb_to_linear(v.r);
            v.g = srgb_to_linear(v.g);
            v.b = srgb_to_linear(v.b);
        }
        return v;
    }

    inline int apply_address_mode(int i, int n, RHIAddressMode mode)
    {
        switch (mode)
        {
            case RHIAddressMode::Repeat:
            {
                const int m = i % n;
                return m < 0 ? m + n : m;
            }
            case RHIAddressMode::MirrorRepeat:
            {
                const int period = 2 * n;
                int m = i % period;
                if (m < 0) m += period;
                return m < n ? m : (period - 1 - m);
            }
            case RHIAddressMode::ClampToEdge:
            default:
                return std::clamp(i, 0, n - 1);
        }
    }

    // Float texel координатыг int-д багтах мужид оруулна. Repeat/MirrorRepeat-д 2n үеэр
    // шилжүүлэх нь address mode-ийн үр дүнг өөрчлөхгүй.
    inline float reduce_texel_coord(float f, int n, RHIAddressMode mode)
    {
        if (mode == RHIAddressMode::Repeat || mode == RHIAddressMode::MirrorRepeat)
        {
            return std::fmod(f, 2.0f * (float)n);
        }
        return std::clamp(f, -1.0f, (float)n + 1.0f);
    }

    inline glm::vec4 fetch_texel(const Texture2DData& tex, int x, int y, const RHISamplerDesc& s)
    {
        const int xi = apply_address_mode(x, tex.w, s.address_u);
        const int yi = apply_address_mode(y, tex.h, s.address_v);
        return texel_to_float(tex, tex.at(xi, yi));
    }

    // Texel төв нь (i + 0.5) / size дээр байрлана.
    inline glm::vec4 sample_texture2d(const Texture2DData* tex, const RHISamplerDesc& s, const glm::vec2& uv)
    {
        if (!tex || !tex->valid()) return glm::vec4(1.0f);

        float fx = uv.x * (float)tex->w;
        float fy = uv.y * (float)tex->h;
        if (!std::isfinite(fx) || !std::isfinite(fy)) return glm::vec4(0.0f);
        fx = reduce_texel_coord(fx, tex->w, s.address_u);
        fy = reduce_texel_coord(fy, tex->h, s.address_v);

        if (s.mag_filter == RHIFilter::Nearest)
        {
            return fetch_texel(*tex, (int)std::floor(fx), (int)std::floor(fy), s);
        }

        const float px = fx - 0.5f;
        const float py = fy - 0.5f;
        const int x0 = (int)std::floor(px);
        const int y0 = (int)std::floor(py);
        const float tx = px - (float)x0;
        const float ty = py - (float)y0;

        const glm::vec4 c00 = fetch_texel(*tex, x0, y0, s);
        const glm::vec4 c10 = fetch_texel(*tex, x0 + 1, y0, s);
        const glm::vec4 c01 = fetch_texel(*tex, x0, y0 + 1, s);
        const glm::vec4 c11 = fetch_texel(*tex, x0 + 1, y0 + 1, s);
        const glm::vec4 cx0 = glm::mix(c00, c10, tx);
        const glm::vec4 cx1 = glm::mix(c01, c11, tx);
        return glm::mix(cx0, cx1, ty);
    }
}
