#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: binding_contract.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Shader-ийн зарласан group/slot дугаарлалт. Шинэчлэгдэх давтамжаар нь
            material (0), camera (1), light (2) гэж бүлэглэнэ.
*/


#include <cstddef>
#include <cstdint>
#include <string>

#include "shc/core/result.hpp"
#include "shc/rhi/binding_layout.hpp"
#include "shc/shader/pipeline_kind.hpp"
#include "shc/shader/uniforms.hpp"

namespace shc
{
    constexpr uint32_t SHC_GROUP_MATERIAL = 0;
    constexpr uint32_t SHC_GROUP_CAMERA = 1;
    constexpr uint32_t SHC_GROUP_LIGHT = 2;

    constexpr uint32_t SHC_SLOT_DIFFUSE_TEXTURE = 0;
    constexpr uint32_t SHC_SLOT_DIFFUSE_SAMPLER = 1;
    constexpr uint32_t SHC_SLOT_NORMAL_TEXTURE = 2;
    constexpr uint32_t SHC_SLOT_NORMAL_SAMPLER = 3;
    constexpr uint32_t SHC_SLOT_CAMERA_UNIFORM = 0;
    constexpr uint32_t SHC_SLOT_LIGHT_UNIFORM = 0;

    inline RHIBindGroupLayoutDesc material_group_layout(PipelineKind kind)
    {
        RHIBindGroupLayoutDesc g{};
        g.group = SHC_GROUP_MATERIAL;
        g.label = "material";
        g.entries = {
            {SHC_SLOT_DIFFUSE_TEXTURE, RHIBindingType::SampledTexture2D, RHIShaderStage_Fragment, 0},
            {SHC_SLOT_DIFFUSE_SAMPLER, RHIBindingType::Sampler, RHIShaderStage_Fragment, 0}
        };
        if (kind == PipelineKind::Lit)
        {
            g.entries.push_back({SHC_SLOT_NORMAL_TEXTURE, RHIBindingType::SampledTexture2D, RHIShaderStage_Fragment, 0});
            g.entries.push_back({SHC_SLOT_NORMAL_SAMPLER, RHIBindingType::Sampler, RHIShaderStage_Fragment, 0});
        }
        return g;
    }

    inline RHIBindGroupLayoutDesc camera_group_layout()
    {
        RHIBindGroupLayoutDesc g{};
        g.group = SHC_GROUP_CAMERA;
        g.label = "camera";
        g.entries = {
            {
                SHC_SLOT_CAMERA_UNIFORM,
                RHIBindingType::UniformBuffer,
                RHIShaderStage_Vertex | RHIShaderStage_Fragment,
                sizeof(CameraUniform)
            }
        };
        return g;
    }

    inline RHIBindGroupLayoutDesc light_group_layout()
    {
        RHIBindGroupLayoutDesc g{};
        g.group = SHC_GROUP_LIGHT;
        g.label = "light";
        g.entries = {
            {
                SHC_SLOT_LIGHT_UNIFORM,
                RHIBindingType::UniformBuffer,
                RHIShaderStage_Vertex | RHIShaderStage_Fragment,
                sizeof(LightUniform)
            }
        };
        return g;
    }

    inline RHIPipelineLayoutDesc expected_pipeline_layout(PipelineKind kind)
    {
        RHIPipelineLayoutDesc l{};
        l.groups.push_back(material_group_layout(kind));
        l.groups.push_back(camera_group_layout());
        if (kind == PipelineKind::Lit) l.groups.push_back(light_group_layout());
        return l;
    }

    // Caller-ийн pipeline layout shader-ийн зарласантай яг тэнцүү байх ёстой:
    // илүү group, дутуу slot, өөр төрөл бүгд pipeline үүсгэх алдаа.
    inline Status validate_pipeline_layout(PipelineKind kind, const RHIPipelineLayoutDesc& layout)
    {
        const RHIPipelineLayoutDesc expected = expected_pipeline_layout(kind);
        const std::string where = std::string("pipeline layout (") + pipeline_kind_name(kind) + ")";

        for (size_t i = 0; i < layout.groups.size(); ++i)
        {
            const RHIBindGroupLayoutDesc& g = layout.groups[i];
            if (!expected.find_group(g.group))
            {
                return Status::failure(where + ": unexpected bind group " + std::to_string(g.group) + " '" + g.label + "'");
            }
            for (size_t j = 0; j < i; ++j)
            {
                if (layout.groups[j].group == g.group)
                {
                    return Status::failure(
                        where + ": bind group " + std::to_string(g.group) + " '" + g.label + "' declared more than once"
                    );
                }
            }
        }

        for (const RHIBindGroupLayoutDesc& eg : expected.groups)
        {
            const RHIBindGroupLayoutDesc* g = layout.find_group(eg.group);
            const std::string gname = "group " + std::to_string(eg.group) + " '" + eg.label + "'";
            if (!g) return Status::failure(where + ": missing " + gname);
            if (g->entries.size() != eg.entries.size())
            {
                return Status::failure(
                    where + ": " + gname + " declares " + std::to_string(g->entries.size()) +
                    " bindings, shader expects " + std::to_string(eg.entries.size())
                );
            }
            for (const RHIBindingLayoutEntry& ee : eg.entries)
            {
                const std::string sname = gname + " slot " + std::to_string(ee.binding);
                const RHIBindingLayoutEntry* e = g->find(ee.binding);
                if (!e) return Status::failure(where + ": missing " + sname);
                if (e->type != ee.type)
                {
                    return Status::failure(
                        where + ": " + sname + " is " + binding_type_name(e->type) +
                        ", shader expects " + binding_type_name(ee.type)
                    );
                }
                if ((e->visibility & ee.visibility) != ee.visibility)
                {
                    return Status::failure(where + ": " + sname + " is not visible to every stage that reads it");
                }
                if (ee.type == RHIBindingType::UniformBuffer && e->min_binding_size < ee.min_binding_size)
                {
                    return Status::failure(
                        where + ": " + sname + " min size " + std::to_string(e->min_binding_size) +
                        " < " + std::to_string(ee.min_binding_size)
                    );
                }
            }
        }
        return Status::success();
    }
}
