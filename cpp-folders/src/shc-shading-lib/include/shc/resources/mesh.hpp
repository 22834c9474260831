#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: mesh.hpp
    МОДУЛЬ: resources
    ЗОРИЛГО: Object-space vertex attribute-уудыг (position, uv, normal, tangent, bitangent)
            тусдаа массивт хадгалах mesh өгөгдөл, tangent frame тооцоолол.
*/


#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

namespace shc
{
    struct MeshData
    {
        std::string label{};
        std::vector<glm::vec3> positions{};
        std::vector<glm::vec2> uvs{};
        std::vector<glm::vec3> normals{};
        std::vector<glm::vec3> tangents{};
        std::vector<glm::vec3> bitangents{};
        std::vector<uint32_t> indices{};

        size_t vertex_count() const { return positions.size(); }

        bool empty() const
        {
            return positions.empty() || indices.empty();
        }

        bool has_tangent_frame() const
        {
            const size_t n = positions.size();
            return normals.size() == n && tangents.size() == n && bitangents.size() == n;
        }

        void clear()
        {
            positions.clear();
            uvs.clear();
            normals.clear();
            tangents.clear();
            bitangents.clear();
            indices.clear();
        }
    };

    // Гурвалжин бүрийн uv delta-аас tangent/bitangent гаргаж, vertex дээр дундажилна.
    // UV нь degenerate (det ~ 0) гурвалжныг алгасна.
    inline void compute_tangents(MeshData& m)
    {
        const size_t n = m.positions.size();
        m.tangents.assign(n, glm::vec3(0.0f));
        m.bitangents.assign(n, glm::vec3(0.0f));
        if (m.uvs.size() != n) return;

        std::vector<uint32_t> touched(n, 0u);
        for (size_t i = 0; i + 2 < m.indices.size(); i += 3)
        {
            const uint32_t i0 = m.indices[i + 0];
            const uint32_t i1 = m.indices[i + 1];
            const uint32_t i2 = m.indices[i + 2];
            if (i0 >= n || i1 >= n || i2 >= n) continue;

            const glm::vec3 dp1 = m.positions[i1] - m.positions[i0];
            const glm::vec3 dp2 = m.positions[i2] - m.positions[i0];
            const glm::vec2 duv1 = m.uvs[i1] - m.uvs[i0];
            const glm::vec2 duv2 = m.uvs[i2] - m.uvs[i0];

            const float det = duv1.x * duv2.y - duv1.y * duv2.x;
            if (std::abs(det) < 1e-12f) continue;
            const float r = 1.0f / det;
            const glm::vec3 t = (dp1 * duv2.y - dp2 * duv1.y) * r;
            const glm::vec3 b = (dp2 * duv1.x - dp1 * duv2.x) * r;

            for (uint32_t vi : {i0, i1, i2})
            {
                m.tangents[vi] += t;
                m.bitangents[vi] += b;
                touched[vi] += 1u;
            }
        }

        for (size_t i = 0; i < n; ++i)
        {
            if (touched[i] == 0u) continue;
            m.tangents[i] /= (float)touched[i];
            m.bitangents[i] /= (float)touched[i];
        }
    }
}
