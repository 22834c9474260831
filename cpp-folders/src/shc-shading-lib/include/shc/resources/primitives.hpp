#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: primitives.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Demo болон тестэд хэрэглэх cube/quad mesh-ийг tangent frame-тай нь үүсгэнэ.
*/


#include <algorithm>
#include <cstdint>
#include <utility>

#include <glm/glm.hpp>

#include "shc/resources/mesh.hpp"

namespace shc
{
    struct CubeDesc
    {
        float size = 1.0f;
    };

    struct QuadDesc
    {
        float width = 2.0f;
        float height = 2.0f;
        float z = 0.0f;
    };

    namespace detail
    {
        inline uint32_t add_vertex(MeshData& m, const glm::vec3& p, const glm::vec3& n, const glm::vec2& uv)
        {
            m.positions.push_back(p);
            m.normals.push_back(n);
            m.uvs.push_back(uv);
            return (uint32_t)m.positions.size() - 1;
        }

        // Гурвалжны эргэлтийг normal-той тааруулж CCW-outward болгоно.
        inline void add_triangle_facing(MeshData& m, uint32_t a, uint32_t b, uint32_t c, const glm::vec3& n)
        {
            const glm::vec3 face_n = glm::cross(m.positions[b] - m.positions[a], m.positions[c] - m.positions[a]);
            if (glm::dot(face_n, n) < 0.0f) std::swap(b, c);
            m.indices.push_back(a);
            m.indices.push_back(b);
            m.indices.push_back(c);
        }

        inline void add_face(
            MeshData& m,
            const glm::vec3& origin,
            const glm::vec3& axis_u,
            const glm::vec3& axis_v,
            const glm::vec3& normal
        )
        {
            const uint32_t i00 = add_vertex(m, origin, normal, glm::vec2(0.0f, 0.0f));
            const uint32_t i10 = add_vertex(m, origin + axis_u, normal, glm::vec2(1.0f, 0.0f));
            const uint32_t i01 = add_vertex(m, origin + axis_v, normal, glm::vec2(0.0f, 1.0f));
            const uint32_t i11 = add_vertex(m, origin + axis_u + axis_v, normal, glm::vec2(1.0f, 1.0f));
            add_triangle_facing(m, i00, i10, i11, normal);
            add_triangle_facing(m, i00, i11, i01, normal);
        }
    }

    inline MeshData make_cube(const CubeDesc& d = {})
    {
        MeshData m{};
        m.label = "cube";
        const float h = std::max(d.size, 0.0f) * 0.5f;
        const float s = h * 2.0f;

        detail::add_face(m, {-h, -h, h}, {s, 0, 0}, {0, s, 0}, {0, 0, 1});
        detail::add_face(m, {h, -h, -h}, {-s, 0, 0}, {0, s, 0}, {0, 0, -1});
        detail::add_face(m, {h, -h, h}, {0, 0, -s}, {0, s, 0}, {1, 0, 0});
        detail::add_face(m, {-h, -h, -h}, {0, 0, s}, {0, s, 0}, {-1, 0, 0});
        detail::add_face(m, {-h, h, h}, {s, 0, 0}, {0, 0, -s}, {0, 1, 0});
        detail::add_face(m, {-h, -h, -h}, {s, 0, 0}, {0, 0, s}, {0, -1, 0});

        compute_tangents(m);
        return m;
    }

    // +Z чиглэлтэй XY хавтгай дээрх тэгш өнцөгт. Тестэд full-screen quad болгон хэрэглэнэ.
    inline MeshData make_quad(const QuadDesc& d = {})
    {
        MeshData m{};
        m.label = "quad";
        const float hw = d.width * 0.5f;
        const float hh = d.height * 0.5f;
        detail::add_face(
            m,
            glm::vec3(-hw, -hh, d.z),
            glm::vec3(d.width, 0.0f, 0.0f),
            glm::vec3(0.0f, d.height, 0.0f),
            glm::vec3(0.0f, 0.0f, 1.0f)
        );
        compute_tangents(m);
        return m;
    }
}
