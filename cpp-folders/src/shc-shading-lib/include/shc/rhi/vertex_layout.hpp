#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: vertex_layout.hpp
    МОДУЛЬ: rhi/pipeline
    ЗОРИЛГО: Vertex/instance buffer-ийн attribute layout descriptor-ууд.
            Shader location бүр ямар buffer-ийн ямар offset-оос уншигдахыг тодорхойлно.
*/


#include <cstdint>
#include <vector>

namespace shc
{
    constexpr uint32_t SHC_MAX_VERTEX_BUFFERS = 2;
    constexpr uint32_t SHC_MAX_ATTRIBUTE_LOCATIONS = 16;

    enum class RHIVertexFormat : uint8_t
    {
        Float32x2 = 0,
        Float32x3 = 1,
        Float32x4 = 2
    };

    inline constexpr uint32_t vertex_format_components(RHIVertexFormat f)
    {
        switch (f)
        {
            case RHIVertexFormat::Float32x2: return 2u;
            case RHIVertexFormat::Float32x3: return 3u;
            case RHIVertexFormat::Float32x4: return 4u;
        }
        return 0u;
    }

    inline constexpr uint32_t vertex_format_size(RHIVertexFormat f)
    {
        return vertex_format_components(f) * (uint32_t)sizeof(float);
    }

    inline const char* vertex_format_name(RHIVertexFormat f)
    {
        switch (f)
        {
            case RHIVertexFormat::Float32x2: return "Float32x2";
            case RHIVertexFormat::Float32x3: return "Float32x3";
            case RHIVertexFormat::Float32x4: return "Float32x4";
        }
        return "Unknown";
    }

    enum class RHIVertexStepMode : uint8_t
    {
        Vertex = 0,
        Instance = 1
    };

    inline const char* step_mode_name(RHIVertexStepMode m)
    {
        return m == RHIVertexStepMode::Instance ? "Instance" : "Vertex";
    }

    struct RHIVertexAttributeDesc
    {
        uint32_t location = 0;
        RHIVertexFormat format = RHIVertexFormat::Float32x4;
        uint32_t offset = 0;
    };

    struct RHIVertexBufferLayoutDesc
    {
        uint32_t stride = 0;
        RHIVertexStepMode step_mode = RHIVertexStepMode::Vertex;
        std::vector<RHIVertexAttributeDesc> attributes{};

        // Нэг элементийн эзлэх хамгийн их byte (offset + format size).
        uint32_t attribute_extent() const
        {
            uint32_t e = 0;
            for (const RHIVertexAttributeDesc& a : attributes)
            {
                const uint32_t end = a.offset + vertex_format_size(a.format);
                if (end > e) e = end;
            }
            return e;
        }
    };
}
