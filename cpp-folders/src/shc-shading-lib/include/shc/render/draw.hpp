#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: draw.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Instanced draw: buffer, bind group-уудыг урьдчилан шалгаж, instance бүрийн
            vertex-үүдийг shade хийгээд triangle-уудыг rasterizer руу дамжуулна.
*/


#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "shc/core/log.hpp"
#include "shc/core/result.hpp"
#include "shc/job/parallel_for.hpp"
#include "shc/render/bind_groups.hpp"
#include "shc/render/pipeline.hpp"
#include "shc/render/rasterizer.hpp"
#include "shc/shader/attribute_fetch.hpp"

namespace shc
{
    struct IndexBufferView
    {
        const uint32_t* data = nullptr;
        size_t count = 0;

        bool valid() const { return data != nullptr && count > 0; }
    };

    inline IndexBufferView make_index_view(const std::vector<uint32_t>& v)
    {
        return IndexBufferView{v.data(), v.size()};
    }

    struct DrawCall
    {
        std::array<VertexBufferView, SHC_MAX_VERTEX_BUFFERS> vertex_buffers{};
        // Хоосон бол non-indexed draw, vertex_count ашиглана.
        IndexBufferView indices{};
        uint32_t vertex_count = 0;
        uint32_t first_instance = 0;
        uint32_t instance_count = 1;
    };

    struct DrawOptions
    {
        IJobSystem* job_system = nullptr;
        int parallel_min_vertices = 256;
        int parallel_min_rows = 8;
        int parallel_min_pixels = 128 * 128;
    };

    struct DrawStats
    {
        uint64_t instances = 0;
        uint64_t vertices_shaded = 0;
        RasterizerStats raster{};
    };

    namespace detail
    {
        // Сүүлийн элементийн attribute-ууд buffer-т багтах ёстой, stride-ийн сүүл заавал биш.
        inline size_t required_buffer_bytes(const RHIVertexBufferLayoutDesc& layout, uint64_t element_count)
        {
            if (element_count == 0) return 0;
            return (size_t)((element_count - 1) * (uint64_t)layout.stride + (uint64_t)layout.attribute_extent());
        }

        inline RasterizerConfig raster_config_for(const ShadingPipeline& p, const DrawOptions& o)
        {
            RasterizerConfig rc{};
            rc.cull_mode = p.raster.cull;
            rc.front_face = p.raster.front_face;
            rc.clip_depth = p.raster.clip_depth;
            rc.depth_test = p.depth.enable_test;
            rc.depth_write = p.depth.enable_write;
            rc.job_system = o.job_system;
            rc.parallel_min_rows = o.parallel_min_rows;
            rc.parallel_min_pixels = o.parallel_min_pixels;
            return rc;
        }
    }

    // Бүх шалгалт ямар ч invocation эхлэхээс өмнө хийгдэнэ. Алдаатай бол target өөрчлөгдөхгүй.
    inline Status validate_draw(
        const ShadingPipeline& pipeline,
        const DrawCall& call,
        const BindGroupSet& bind_groups,
        const RasterizerTarget& target
    )
    {
        if (!pipeline.program.valid()) return Status::failure("pipeline '" + pipeline.label + "' has no shader program");
        if (!target.color) return Status::failure("no color target bound");
        if (target.depth && (target.depth->w != target.color->w || target.depth->h != target.color->h))
        {
            return Status::failure("depth target size does not match color target");
        }

        const Status bg = validate_bind_groups(pipeline.layout, bind_groups);
        if (!bg) return bg;

        uint64_t vertex_elements = call.vertex_count;
        if (call.indices.valid())
        {
            const uint32_t max_index = *std::max_element(call.indices.data, call.indices.data + call.indices.count);
            vertex_elements = (uint64_t)max_index + 1;
        }
        const uint64_t instance_elements = (uint64_t)call.first_instance + (uint64_t)call.instance_count;

        for (size_t slot = 0; slot < pipeline.vertex_buffers.size(); ++slot)
        {
            const RHIVertexBufferLayoutDesc& l = pipeline.vertex_buffers[slot];
            const VertexBufferView& b = call.vertex_buffers[slot];
            const uint64_t elements = l.step_mode == RHIVertexStepMode::Instance ? instance_elements : vertex_elements;
            const size_t need = detail::required_buffer_bytes(l, elements);
            if (need == 0) continue;
            if (!b.data)
            {
                return Status::failure("vertex buffer slot " + std::to_string(slot) + " is not bound");
            }
            if (b.size_bytes < need)
            {
                return Status::failure(
                    "vertex buffer slot " + std::to_string(slot) + " holds " + std::to_string(b.size_bytes) +
                    " bytes, draw reads " + std::to_string(need)
                );
            }
        }
        return Status::success();
    }

    inline Result<DrawStats> draw_instanced(
        const ShadingPipeline& pipeline,
        const DrawCall& call,
        const BindGroupSet& bind_groups,
        RasterizerTarget target,
        const DrawOptions& options = {}
    )
    {
        const Status st = validate_draw(pipeline, call, bind_groups, target);
        if (!st)
        {
            const std::string msg = "draw_instanced('" + pipeline.label + "'): " + st.error;
            log_error(msg);
            return Result<DrawStats>::failure(msg);
        }

        DrawStats stats{};
        const bool indexed = call.indices.valid();
        const size_t corner_count = indexed ? call.indices.count : (size_t)call.vertex_count;
        if (corner_count % 3 != 0)
        {
            log_warn("draw_instanced('" + pipeline.label + "'): trailing " + std::to_string(corner_count % 3) + " vertices ignored");
        }
        const size_t tri_count = corner_count / 3;
        if (tri_count == 0 || call.instance_count == 0) return Result<DrawStats>::success(stats);

        uint32_t vertex_elements = call.vertex_count;
        if (indexed)
        {
            vertex_elements = *std::max_element(call.indices.data, call.indices.data + call.indices.count) + 1u;
        }

        const ShaderResources resources = resolve_shader_resources(pipeline.kind, bind_groups, pipeline.lighting);
        const RasterizerConfig rc = detail::raster_config_for(pipeline, options);
        const ShaderProgram& program = pipeline.program;
        auto fs = [&](const FragmentIn& fin) -> FragmentOut { return program.fs(fin, resources); };

        std::vector<VertexOut> shaded((size_t)vertex_elements);
        for (uint32_t ii = 0; ii < call.instance_count; ++ii)
        {
            const uint32_t instance_index = call.first_instance + ii;

            // Vertex invocation бүр бие даасан тул vertex-үүдийг chunk-аар зэрэг shade хийнэ.
            parallel_for_1d(
                options.job_system,
                0,
                (int)vertex_elements,
                std::max(1, options.parallel_min_vertices),
                [&](int b, int e)
                {
                    for (int vi = b; vi < e; ++vi)
                    {
                        AttributeLanes lanes{};
                        for (size_t slot = 0; slot < pipeline.vertex_buffers.size(); ++slot)
                        {
                            fetch_attribute_lanes(pipeline.vertex_buffers[slot], call.vertex_buffers[slot], (uint32_t)vi, instance_index, lanes);
                        }
                        shaded[(size_t)vi] = program.vs(read_vertex_input(lanes), read_instance_input(lanes), resources);
                    }
                }
            );
            stats.vertices_shaded += vertex_elements;
            stats.instances++;

            for (size_t t = 0; t < tri_count; ++t)
            {
                const uint32_t i0 = indexed ? call.indices.data[t * 3 + 0] : (uint32_t)(t * 3 + 0);
                const uint32_t i1 = indexed ? call.indices.data[t * 3 + 1] : (uint32_t)(t * 3 + 1);
                const uint32_t i2 = indexed ? call.indices.data[t * 3 + 2] : (uint32_t)(t * 3 + 2);
                stats.raster.accumulate(rasterize_triangle(shaded[i0], shaded[i1], shaded[i2], fs, target, rc));
            }
        }
        return Result<DrawStats>::success(stats);
    }
}
