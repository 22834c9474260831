#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: rt_types.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Texel/pixel төрлүүд, fragment stage бичих color/depth target-ууд,
            float color target-ийг дэлгэцлэх RGBA8 болгож resolve хийх.
*/


#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace shc
{
    // 8-bit texel. Texture болон resolve хийсэн кадрт хэрэглэнэ.
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
        PixelBuffer2D(int W, int H, const TPixel& fill_value)
            : w(std::max(0, W))
            , h(std::max(0, H))
            , data((size_t)std::max(0, W) * (size_t)std::max(0, H), fill_value)
        {}

        bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < w && y < h; }

        void fill(const TPixel& v) { std::fill(data.begin(), data.end(), v); }

        TPixel& at(int x, int y) { return data[(size_t)y * (size_t)w + (size_t)x]; }
        const TPixel& at(int x, int y) const { return data[(size_t)y * (size_t)w + (size_t)x]; }
    };

    // Location 0 дахь RGBA32F color target. Fragment гаралтыг clamp хийлгүй хадгална.
    // Мөр 0 нь доод мөр (y дээш).
    struct RT_ColorHDR
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<ColorF> color;

        RT_ColorHDR() = default;
        RT_ColorHDR(int W, int H, ColorF clear = {0.0f, 0.0f, 0.0f, 1.0f}) : w(W), h(H), color(W, H, clear) {}

        void clear(ColorF c = {0.0f, 0.0f, 0.0f, 1.0f}) { color.fill(c); }
    };

    // [0,1] normalized depth, 1.0 = хамгийн хол. Less compare.
    struct RT_DepthBuffer
    {
        int w = 0;
        int h = 0;
        PixelBuffer2D<float> depth;

        RT_DepthBuffer() = default;
        RT_DepthBuffer(int W, int H) : w(W), h(H), depth(W, H, 1.0f) {}

        void clear(float d = 1.0f) { depth.fill(d); }

        bool passes(int x, int y, float z01) const { return z01 < depth.at(x, y); }
        void write(int x, int y, float z01) { depth.at(x, y) = z01; }
    };

    inline uint8_t resolve_channel_u8(float v)
    {
        if (!(v > 0.0f)) return 0u;
        if (v >= 1.0f) return 255u;
        return (uint8_t)std::lround(v * 255.0f);
    }

    // Float target-ийг [0,1]-д clamp хийж RGBA8 болгоно. flip_y үед дээд мөрөөс эхэлсэн
    // (SDL texture) дараалалтай гарна. Alpha-г 255 болгоно.
    inline void resolve_to_rgba8(const RT_ColorHDR& src, std::vector<uint8_t>& out, bool flip_y = true)
    {
        out.resize((size_t)src.w * (size_t)src.h * 4u);
        for (int row = 0; row < src.h; ++row)
        {
            const int y = flip_y ? src.h - 1 - row : row;
            uint8_t* dst = out.data() + (size_t)row * (size_t)src.w * 4u;
            for (int x = 0; x < src.w; ++x)
            {
                const ColorF& c = src.color.at(x, y);
                dst[x * 4 + 0] = resolve_channel_u8(c.r);
                dst[x * 4 + 1] = resolve_channel_u8(c.g);
                dst[x * 4 + 2] = resolve_channel_u8(c.b);
                dst[x * 4 + 3] = 255u;
            }
        }
    }
}
