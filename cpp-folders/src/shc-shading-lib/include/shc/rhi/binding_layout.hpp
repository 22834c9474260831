#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: binding_layout.hpp
    МОДУЛЬ: rhi/binding
    ЗОРИЛГО: Bind group layout болон pipeline layout descriptor-ууд.
            Group/slot дугаарлалт нь CPU тал болон shader хоорондын wire contract.
*/


#include <cstdint>
#include <string>
#include <vector>

namespace shc
{
    constexpr uint32_t SHC_MAX_BIND_GROUPS = 4;

    enum class RHIBindingType : uint8_t
    {
        SampledTexture2D = 0,
        Sampler = 1,
        UniformBuffer = 2
    };

    inline const char* binding_type_name(RHIBindingType t)
    {
        switch (t)
        {
            case RHIBindingType::SampledTexture2D: return "SampledTexture2D";
            case RHIBindingType::Sampler: return "Sampler";
            case RHIBindingType::UniformBuffer: return "UniformBuffer";
        }
        return "Unknown";
    }

    enum RHIShaderStageBits : uint32_t
    {
        RHIShaderStage_None = 0,
        RHIShaderStage_Vertex = 1u << 0u,
        RHIShaderStage_Fragment = 1u << 1u
    };

    struct RHIBindingLayoutEntry
    {
        uint32_t binding = 0;
        RHIBindingType type = RHIBindingType::UniformBuffer;
        uint32_t visibility = RHIShaderStage_None;
        // UniformBuffer-т л хэрэглэгдэнэ. Bind хийсэн buffer үүнээс багагүй байх ёстой.
        uint64_t min_binding_size = 0;
    };

    struct RHIBindGroupLayoutDesc
    {
        uint32_t group = 0;
        std::string label{};
        std::vector<RHIBindingLayoutEntry> entries{};

        const RHIBindingLayoutEntry* find(uint32_t binding) const
        {
            for (const RHIBindingLayoutEntry& e : entries)
            {
                if (e.binding == binding) return &e;
            }
            return nullptr;
        }
    };

    struct RHIPipelineLayoutDesc
    {
        std::vector<RHIBindGroupLayoutDesc> groups{};

        const RHIBindGroupLayoutDesc* find_group(uint32_t group) const
        {
            for (const RHIBindGroupLayoutDesc& g : groups)
            {
                if (g.group == group) return &g;
            }
            return nullptr;
        }
    };
}
