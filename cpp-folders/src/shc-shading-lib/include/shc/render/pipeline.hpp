#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: pipeline.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Shading pipeline-ийн descriptor, үүсгэх үеийн contract шалгалт.
            Vertex layout эсвэл bind group layout зөрвөл pipeline үүсэхгүй.
*/


#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "shc/core/log.hpp"
#include "shc/core/result.hpp"
#include "shc/rhi/binding_layout.hpp"
#include "shc/rhi/pipeline_desc.hpp"
#include "shc/rhi/resource_desc.hpp"
#include "shc/rhi/vertex_layout.hpp"
#include "shc/shader/binding_contract.hpp"
#include "shc/shader/builtin_shaders.hpp"
#include "shc/shader/lighting.hpp"
#include "shc/shader/vertex_formats.hpp"

namespace shc
{
    struct ShadingPipelineDesc
    {
        std::string label{};
        PipelineKind kind = PipelineKind::Basic;
        std::vector<RHIVertexBufferLayoutDesc> vertex_buffers{};
        RHIPipelineLayoutDesc layout{};
        RHIRasterStateDesc raster{};
        RHIDepthStateDesc depth{};
        RHIFormat color_format = RHIFormat::RGBA32F;
        LightingConfig lighting{};
    };

    inline ShadingPipelineDesc make_default_pipeline_desc(PipelineKind kind, const LightingConfig& lighting = {})
    {
        ShadingPipelineDesc d{};
        d.label = std::string(pipeline_kind_name(kind)) + "_shading";
        d.kind = kind;
        d.vertex_buffers = expected_vertex_buffer_layouts(kind);
        d.layout = expected_pipeline_layout(kind);
        d.lighting = lighting;
        return d;
    }

    // Амжилттай үүссэн pipeline. Бүх талбар нь contract-тай нийцсэн гэдгийг баталгаажуулсан.
    struct ShadingPipeline
    {
        std::string label{};
        PipelineKind kind = PipelineKind::Basic;
        std::vector<RHIVertexBufferLayoutDesc> vertex_buffers{};
        RHIPipelineLayoutDesc layout{};
        RHIRasterStateDesc raster{};
        RHIDepthStateDesc depth{};
        RHIFormat color_format = RHIFormat::RGBA32F;
        LightingConfig lighting{};
        ShaderProgram program{};
    };

    inline Status validate_vertex_buffer_layouts(PipelineKind kind, const std::vector<RHIVertexBufferLayoutDesc>& layouts)
    {
        const std::vector<RHIVertexBufferLayoutDesc> expected = expected_vertex_buffer_layouts(kind);
        const std::string where = std::string("vertex layout (") + pipeline_kind_name(kind) + ")";
        if (layouts.size() != expected.size())
        {
            return Status::failure(
                where + ": " + std::to_string(layouts.size()) + " buffers declared, shader expects " +
                std::to_string(expected.size())
            );
        }

        for (size_t slot = 0; slot < expected.size(); ++slot)
        {
            const RHIVertexBufferLayoutDesc& e = expected[slot];
            const RHIVertexBufferLayoutDesc& l = layouts[slot];
            const std::string bname = "buffer " + std::to_string(slot);
            if (l.step_mode != e.step_mode)
            {
                return Status::failure(
                    where + ": " + bname + " steps per " + step_mode_name(l.step_mode) +
                    ", shader expects " + step_mode_name(e.step_mode)
                );
            }
            if (l.stride < l.attribute_extent())
            {
                return Status::failure(where + ": " + bname + " stride " + std::to_string(l.stride) + " is smaller than its attributes");
            }
            if (l.attributes.size() != e.attributes.size())
            {
                return Status::failure(
                    where + ": " + bname + " declares " + std::to_string(l.attributes.size()) +
                    " attributes, shader expects " + std::to_string(e.attributes.size())
                );
            }
            for (const RHIVertexAttributeDesc& ea : e.attributes)
            {
                const std::string lname = "location " + std::to_string(ea.location);
                const RHIVertexAttributeDesc* found = nullptr;
                for (const RHIVertexAttributeDesc& a : l.attributes)
                {
                    if (a.location == ea.location) found = &a;
                }
                if (!found) return Status::failure(where + ": " + bname + " is missing " + lname);
                if (found->format != ea.format)
                {
                    return Status::failure(
                        where + ": " + lname + " is " + vertex_format_name(found->format) +
                        ", shader expects " + vertex_format_name(ea.format)
                    );
                }
            }
        }
        return Status::success();
    }

    inline Result<ShadingPipeline> create_shading_pipeline(const ShadingPipelineDesc& desc)
    {
        const std::string name = desc.label.empty() ? std::string(pipeline_kind_name(desc.kind)) : desc.label;
        auto fail = [&](const std::string& msg) -> Result<ShadingPipeline>
        {
            const std::string full = "create_shading_pipeline('" + name + "'): " + msg;
            log_error(full);
            return Result<ShadingPipeline>::failure(full);
        };

        const Status vl = validate_vertex_buffer_layouts(desc.kind, desc.vertex_buffers);
        if (!vl) return fail(vl.error);

        const Status pl = validate_pipeline_layout(desc.kind, desc.layout);
        if (!pl) return fail(pl.error);

        if (desc.color_format != RHIFormat::RGBA32F)
        {
            return fail(std::string("color target format ") + format_name(desc.color_format) + " is not supported, use RGBA32F");
        }
        if (!std::isfinite(desc.lighting.ambient_strength) || !std::isfinite(desc.lighting.shininess))
        {
            return fail("lighting constants must be finite");
        }

        ShadingPipeline p{};
        p.label = name;
        p.kind = desc.kind;
        p.vertex_buffers = desc.vertex_buffers;
        p.layout = desc.layout;
        p.raster = desc.raster;
        p.depth = desc.depth;
        p.color_format = desc.color_format;
        p.lighting = desc.lighting;
        p.program = make_program(desc.kind);

        log_debug(
            "shading pipeline '" + name + "' created: kind=" + pipeline_kind_name(desc.kind) +
            " ambient=" + std::to_string(desc.lighting.ambient_strength) +
            " shininess=" + std::to_string(desc.lighting.shininess)
        );
        return Result<ShadingPipeline>::success(std::move(p));
    }
}
