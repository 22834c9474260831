#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: procedural_textures.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Asset import-гүйгээр demo/тестэд хэрэглэх diffuse болон normal map texture үүсгэнэ.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>

#include <glm/glm.hpp>

#include "shc/resources/texture.hpp"

namespace shc
{
    inline uint8_t unorm8(float v)
    {
        return (uint8_t)std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f);
    }

    // [-1,1] чиглэлийг [0,1] муж руу (n + 1) / 2 хэлбэрээр кодлоно.
    inline Color encode_normal_texel(const glm::vec3& n)
    {
        const glm::vec3 e = (n + glm::vec3(1.0f)) * 0.5f;
        return Color{unorm8(e.x), unorm8(e.y), unorm8(e.z), 255};
    }

    inline Texture2DData make_solid_texture(int w, int h, Color c, RHIFormat fmt)
    {
        Texture2DData t{std::max(1, w), std::max(1, h), fmt, c};
        t.label = "solid";
        return t;
    }

    inline Texture2DData make_checker_texture(int w, int h, int cells, Color a, Color b)
    {
        Texture2DData t{std::max(1, w), std::max(1, h), RHIFormat::RGBA8_UNorm_sRGB, a};
        t.label = "checker";
        const int n = std::max(1, cells);
        for (int y = 0; y < t.h; ++y)
        {
            const int cy = (y * n) / t.h;
            for (int x = 0; x < t.w; ++x)
            {
                const int cx = (x * n) / t.w;
                t.at(x, y) = ((cx + cy) & 1) == 0 ? a : b;
            }
        }
        return t;
    }

    // Tangent-space бүх texel нь (0,0,1) чиглэлтэй.
    inline Texture2DData make_flat_normal_map(int w, int h)
    {
        Texture2DData t = make_solid_texture(w, h, encode_normal_texel(glm::vec3(0.0f, 0.0f, 1.0f)), RHIFormat::RGBA8_UNorm);
        t.label = "flat_normal";
        return t;
    }

    // Cell бүрт хагас бөмбөрцөг товгор. strength нь налуугийн хэмжээ.
    inline Texture2DData make_bump_normal_map(int w, int h, int cells, float strength)
    {
        Texture2DData t{std::max(1, w), std::max(1, h), RHIFormat::RGBA8_UNorm, Color{128, 128, 255, 255}};
        t.label = "bump_normal";
        const int n = std::max(1, cells);
        const float cw = (float)t.w / (float)n;
        const float ch = (float)t.h / (float)n;
        for (int y = 0; y < t.h; ++y)
        {
            for (int x = 0; x < t.w; ++x)
            {
                const float lx = std::fmod(((float)x + 0.5f) / cw, 1.0f) * 2.0f - 1.0f;
                const float ly = std::fmod(((float)y + 0.5f) / ch, 1.0f) * 2.0f - 1.0f;
                const float r2 = lx * lx + ly * ly;
                glm::vec3 nrm{0.0f, 0.0f, 1.0f};
                if (r2 < 1.0f)
                {
                    nrm = glm::normalize(glm::vec3(lx * strength, ly * strength, std::sqrt(1.0f - r2)));
                }
                t.at(x, y) = encode_normal_texel(nrm);
            }
        }
        return t;
    }
}
