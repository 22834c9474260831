#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: vertex_stage.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex-ийг world, clip space руу хувиргаж, Lit хувилбарт fragment stage-д
            хэрэгтэй байрлалуудыг tangent space руу шилжүүлнэ.
*/


#include <glm/glm.hpp>

#include "shc/shader/attribute_fetch.hpp"
#include "shc/shader/instance_attributes.hpp"
#include "shc/shader/pipeline_kind.hpp"
#include "shc/shader/types.hpp"

namespace shc
{
    // Хоёр хувилбар хоёулаа энэ хоёр функцээр дамжина.
    inline glm::vec4 transform_to_world(const glm::mat4& model, const glm::vec3& position)
    {
        return model * glm::vec4(position, 1.0f);
    }

    inline glm::vec4 transform_to_clip(const glm::mat4& view_proj, const glm::vec4& world)
    {
        return view_proj * world;
    }

    // Мөрүүд нь T, B, N байх world->tangent matrix.
    // Orthonormal basis-ийн transpose нь inverse-тэй тэнцүү.
    inline glm::mat3 make_tangent_basis(
        const glm::mat3& normal_matrix,
        const glm::vec3& normal,
        const glm::vec3& tangent,
        const glm::vec3& bitangent
    )
    {
        const glm::vec3 T = glm::normalize(normal_matrix * tangent);
        const glm::vec3 B = glm::normalize(normal_matrix * bitangent);
        const glm::vec3 N = glm::normalize(normal_matrix * normal);
        return glm::transpose(glm::mat3(T, B, N));
    }

    inline VertexOut vertex_stage_basic(const VertexInput& v, const InstanceInput& inst, const ShaderResources& res)
    {
        const glm::mat4 model = assemble_model_matrix(inst);
        const glm::vec4 world = transform_to_world(model, v.position);

        VertexOut out{};
        out.clip = transform_to_clip(res.camera.view_proj, world);
        set_varying(out, VaryingSemantic::TexCoord, glm::vec4(v.uv, 0.0f, 0.0f));
        return out;
    }

    inline VertexOut vertex_stage_lit(const VertexInput& v, const InstanceInput& inst, const ShaderResources& res)
    {
        const glm::mat4 model = assemble_model_matrix(inst);
        const glm::mat3 normal_matrix = assemble_normal_matrix(inst);
        const glm::vec4 world = transform_to_world(model, v.position);
        const glm::mat3 tbn = make_tangent_basis(normal_matrix, v.normal, v.tangent, v.bitangent);

        VertexOut out{};
        out.clip = transform_to_clip(res.camera.view_proj, world);
        set_varying(out, VaryingSemantic::TexCoord, glm::vec4(v.uv, 0.0f, 0.0f));
        set_varying(out, VaryingSemantic::TangentPosition, glm::vec4(tbn * glm::vec3(world), 0.0f));
        set_varying(out, VaryingSemantic::TangentViewPosition, glm::vec4(tbn * glm::vec3(res.camera.view_position), 0.0f));
        set_varying(out, VaryingSemantic::TangentLightPosition, glm::vec4(tbn * res.light.position, 0.0f));
        return out;
    }

    inline VertexOut run_vertex_stage(PipelineKind kind, const VertexInput& v, const InstanceInput& inst, const ShaderResources& res)
    {
        if (kind == PipelineKind::Lit) return vertex_stage_lit(v, inst, res);
        return vertex_stage_basic(v, inst, res);
    }
}
