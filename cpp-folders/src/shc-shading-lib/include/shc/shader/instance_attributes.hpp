#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: instance_attributes.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Instance бүрийн model/normal matrix-ийг vector lane болгон задлах (write тал)
            болон lane-уудаас matrix-ийг буцааж угсрах (read тал).
*/


#include <array>
#include <cmath>
#include <cstddef>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace shc
{
    // Instance buffer-ийн нэг элемент: 4 x vec4 model багана, 3 x vec3 normal багана.
    struct InstanceRaw
    {
        float model[4][4];
        float normal[3][3];
    };

    static_assert(sizeof(InstanceRaw) == 100, "InstanceRaw must be 25 tightly packed floats");
    static_assert(offsetof(InstanceRaw, normal) == 64, "normal columns must follow the 64-byte model block");

    // Vertex stage-д ирэх instance attribute-ууд. Lane бүр matrix-ийн нэг багана.
    struct InstanceInput
    {
        std::array<glm::vec4, 4> model_cols{
            glm::vec4(1.0f, 0.0f, 0.0f, 0.0f),
            glm::vec4(0.0f, 1.0f, 0.0f, 0.0f),
            glm::vec4(0.0f, 0.0f, 1.0f, 0.0f),
            glm::vec4(0.0f, 0.0f, 0.0f, 1.0f)
        };
        std::array<glm::vec3, 3> normal_cols{
            glm::vec3(1.0f, 0.0f, 0.0f),
            glm::vec3(0.0f, 1.0f, 0.0f),
            glm::vec3(0.0f, 0.0f, 1.0f)
        };
    };

    inline glm::mat4 assemble_model_matrix(const glm::vec4& c0, const glm::vec4& c1, const glm::vec4& c2, const glm::vec4& c3)
    {
        return glm::mat4(c0, c1, c2, c3);
    }

    inline glm::mat3 assemble_normal_matrix(const glm::vec3& c0, const glm::vec3& c1, const glm::vec3& c2)
    {
        return glm::mat3(c0, c1, c2);
    }

    inline glm::mat4 assemble_model_matrix(const InstanceInput& in)
    {
        return assemble_model_matrix(in.model_cols[0], in.model_cols[1], in.model_cols[2], in.model_cols[3]);
    }

    inline glm::mat3 assemble_normal_matrix(const InstanceInput& in)
    {
        return assemble_normal_matrix(in.normal_cols[0], in.normal_cols[1], in.normal_cols[2]);
    }

    // Model matrix-ийн дээд 3x3-ийн inverse-transpose. Singular үед 3x3-ийг шууд буцаана.
    inline glm::mat3 normal_matrix_from_model(const glm::mat4& model)
    {
        const glm::mat3 m3 = glm::mat3(model);
        const float det = glm::determinant(m3);
        if (std::abs(det) <= 1e-8f) return m3;
        return glm::transpose(glm::inverse(m3));
    }

    inline InstanceRaw pack_instance(const glm::mat4& model, const glm::mat3& normal)
    {
        InstanceRaw raw{};
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r) raw.model[c][r] = model[c][r];
        }
        for (int c = 0; c < 3; ++c)
        {
            for (int r = 0; r < 3; ++r) raw.normal[c][r] = normal[c][r];
        }
        return raw;
    }

    inline InstanceRaw pack_instance(const glm::mat4& model)
    {
        return pack_instance(model, normal_matrix_from_model(model));
    }

    inline InstanceInput unpack_instance(const InstanceRaw& raw)
    {
        InstanceInput in{};
        for (int c = 0; c < 4; ++c)
        {
            in.model_cols[c] = glm::vec4(raw.model[c][0], raw.model[c][1], raw.model[c][2], raw.model[c][3]);
        }
        for (int c = 0; c < 3; ++c)
        {
            in.normal_cols[c] = glm::vec3(raw.normal[c][0], raw.normal[c][1], raw.normal[c][2]);
        }
        return in;
    }

    // Scene талаас ирэх instance-ийн TRS хувиргалт.
    struct InstanceTransform
    {
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 scale{1.0f};
    };

    inline glm::mat4 model_matrix(const InstanceTransform& t)
    {
        glm::mat4 m = glm::translate(glm::mat4(1.0f), t.position);
        m = m * glm::mat4_cast(t.rotation);
        m = glm::scale(m, t.scale);
        return m;
    }

    inline InstanceRaw pack_instance(const InstanceTransform& t)
    {
        return pack_instance(model_matrix(t));
    }
}
