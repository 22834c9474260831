#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: pipeline_desc.hpp
    МОДУЛЬ: rhi/pipeline
    ЗОРИЛГО: Shading pipeline-ийн fixed-function төлөв (raster, depth, clip depth).
*/


#include <cstdint>

namespace shc
{
    enum class RHICullMode : uint8_t
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    enum class RHIFrontFace : uint8_t
    {
        CCW = 0,
        CW = 1
    };

    // Clip-space z-ийн муж. ZeroToOne нь 0 <= z <= w (WebGPU/Vulkan/D3D),
    // NegOneToOne нь -w <= z <= w (OpenGL).
    enum class RHIClipDepth : uint8_t
    {
        ZeroToOne = 0,
        NegOneToOne = 1
    };

    struct RHIRasterStateDesc
    {
        RHICullMode cull = RHICullMode::Back;
        RHIFrontFace front_face = RHIFrontFace::CCW;
        RHIClipDepth clip_depth = RHIClipDepth::ZeroToOne;
    };

    struct RHIDepthStateDesc
    {
        bool enable_test = true;
        bool enable_write = true;
    };
}
