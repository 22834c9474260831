#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: resource_desc.hpp
    МОДУЛЬ: rhi/resource
    ЗОРИЛГО: Texture format болон sampler-ийн backend-neutral descriptor-ууд.
            Material bind group-ийн texture/sampler slot-ууд эдгээрийг заана.
*/


#include <cstdint>

namespace shc
{
    enum class RHIFormat : uint16_t
    {
        Unknown = 0,
        RGBA8_UNorm = 1,
        RGBA8_UNorm_sRGB = 2,
        RGBA32F = 4,
        D32F = 11
    };

    inline const char* format_name(RHIFormat f)
    {
        switch (f)
        {
            case RHIFormat::RGBA8_UNorm: return "RGBA8_UNorm";
            case RHIFormat::RGBA8_UNorm_sRGB: return "RGBA8_UNorm_sRGB";
            case RHIFormat::RGBA32F: return "RGBA32F";
            case RHIFormat::D32F: return "D32F";
            default: return "Unknown";
        }
    }

    // sRGB format-ийг sample хийхэд linear руу decode хийгдэнэ.
    inline bool format_is_srgb(RHIFormat f)
    {
        return f == RHIFormat::RGBA8_UNorm_sRGB;
    }

    enum class RHIFilter : uint8_t
    {
        Nearest = 0,
        Linear = 1
    };

    enum class RHIAddressMode : uint8_t
    {
        ClampToEdge = 0,
        Repeat = 1,
        MirrorRepeat = 2
    };

    struct RHISamplerDesc
    {
        RHIFilter min_filter = RHIFilter::Nearest;
        RHIFilter mag_filter = RHIFilter::Linear;
        RHIAddressMode address_u = RHIAddressMode::ClampToEdge;
        RHIAddressMode address_v = RHIAddressMode::ClampToEdge;
    };
}
