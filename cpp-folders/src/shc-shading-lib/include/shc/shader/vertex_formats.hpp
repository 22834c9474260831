#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: vertex_formats.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Basic/Lit pipeline-ийн vertex болон instance buffer-ийн packed бүтэц,
            shader location-ууд, тэдгээрийн каноник layout descriptor.
*/


#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "shc/resources/mesh.hpp"
#include "shc/rhi/vertex_layout.hpp"
#include "shc/shader/instance_attributes.hpp"
#include "shc/shader/pipeline_kind.hpp"

namespace shc
{
    // Vertex buffer (slot 0) location-ууд.
    constexpr uint32_t SHC_LOC_POSITION = 0;
    constexpr uint32_t SHC_LOC_TEXCOORD = 1;
    constexpr uint32_t SHC_LOC_NORMAL = 2;
    constexpr uint32_t SHC_LOC_TANGENT = 3;
    constexpr uint32_t SHC_LOC_BITANGENT = 4;
    // Instance buffer (slot 1) location-ууд.
    constexpr uint32_t SHC_LOC_MODEL_COL0 = 5;
    constexpr uint32_t SHC_LOC_NORMAL_COL0 = 9;

    constexpr uint32_t SHC_VERTEX_BUFFER_SLOT = 0;
    constexpr uint32_t SHC_INSTANCE_BUFFER_SLOT = 1;

    struct VertexBasic
    {
        float position[3];
        float uv[2];
    };

    struct VertexLit
    {
        float position[3];
        float uv[2];
        float normal[3];
        float tangent[3];
        float bitangent[3];
    };

    static_assert(sizeof(VertexBasic) == 20, "VertexBasic must be tightly packed");
    static_assert(sizeof(VertexLit) == 56, "VertexLit must be tightly packed");

    inline RHIVertexBufferLayoutDesc vertex_basic_layout()
    {
        RHIVertexBufferLayoutDesc l{};
        l.stride = (uint32_t)sizeof(VertexBasic);
        l.step_mode = RHIVertexStepMode::Vertex;
        l.attributes = {
            {SHC_LOC_POSITION, RHIVertexFormat::Float32x3, (uint32_t)offsetof(VertexBasic, position)},
            {SHC_LOC_TEXCOORD, RHIVertexFormat::Float32x2, (uint32_t)offsetof(VertexBasic, uv)}
        };
        return l;
    }

    inline RHIVertexBufferLayoutDesc vertex_lit_layout()
    {
        RHIVertexBufferLayoutDesc l{};
        l.stride = (uint32_t)sizeof(VertexLit);
        l.step_mode = RHIVertexStepMode::Vertex;
        l.attributes = {
            {SHC_LOC_POSITION, RHIVertexFormat::Float32x3, (uint32_t)offsetof(VertexLit, position)},
            {SHC_LOC_TEXCOORD, RHIVertexFormat::Float32x2, (uint32_t)offsetof(VertexLit, uv)},
            {SHC_LOC_NORMAL, RHIVertexFormat::Float32x3, (uint32_t)offsetof(VertexLit, normal)},
            {SHC_LOC_TANGENT, RHIVertexFormat::Float32x3, (uint32_t)offsetof(VertexLit, tangent)},
            {SHC_LOC_BITANGENT, RHIVertexFormat::Float32x3, (uint32_t)offsetof(VertexLit, bitangent)}
        };
        return l;
    }

    // Basic pipeline нь ижил InstanceRaw buffer-ийг ашиглаж, normal багануудыг (9-11) уншихгүй.
    inline RHIVertexBufferLayoutDesc instance_layout(PipelineKind kind)
    {
        RHIVertexBufferLayoutDesc l{};
        l.stride = (uint32_t)sizeof(InstanceRaw);
        l.step_mode = RHIVertexStepMode::Instance;
        for (uint32_t c = 0; c < 4; ++c)
        {
            l.attributes.push_back({SHC_LOC_MODEL_COL0 + c, RHIVertexFormat::Float32x4, c * 16u});
        }
        if (kind == PipelineKind::Lit)
        {
            for (uint32_t c = 0; c < 3; ++c)
            {
                l.attributes.push_back({SHC_LOC_NORMAL_COL0 + c, RHIVertexFormat::Float32x3, 64u + c * 12u});
            }
        }
        return l;
    }

    inline std::vector<RHIVertexBufferLayoutDesc> expected_vertex_buffer_layouts(PipelineKind kind)
    {
        if (kind == PipelineKind::Lit) return {vertex_lit_layout(), instance_layout(kind)};
        return {vertex_basic_layout(), instance_layout(kind)};
    }

    inline std::vector<VertexBasic> pack_vertices_basic(const MeshData& m)
    {
        std::vector<VertexBasic> out(m.positions.size());
        for (size_t i = 0; i < out.size(); ++i)
        {
            const glm::vec3 p = m.positions[i];
            const glm::vec2 uv = i < m.uvs.size() ? m.uvs[i] : glm::vec2(0.0f);
            out[i] = VertexBasic{{p.x, p.y, p.z}, {uv.x, uv.y}};
        }
        return out;
    }

    inline std::vector<VertexLit> pack_vertices_lit(const MeshData& m)
    {
        std::vector<VertexLit> out(m.positions.size());
        for (size_t i = 0; i < out.size(); ++i)
        {
            const glm::vec3 p = m.positions[i];
            const glm::vec2 uv = i < m.uvs.size() ? m.uvs[i] : glm::vec2(0.0f);
            const glm::vec3 n = i < m.normals.size() ? m.normals[i] : glm::vec3(0.0f, 0.0f, 1.0f);
            const glm::vec3 t = i < m.tangents.size() ? m.tangents[i] : glm::vec3(1.0f, 0.0f, 0.0f);
            const glm::vec3 b = i < m.bitangents.size() ? m.bitangents[i] : glm::vec3(0.0f, 1.0f, 0.0f);
            out[i] = VertexLit{
                {p.x, p.y, p.z},
                {uv.x, uv.y},
                {n.x, n.y, n.z},
                {t.x, t.y, t.z},
                {b.x, b.y, b.z}
            };
        }
        return out;
    }
}
