#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: instance_grid.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: XZ хавтгай дээрх N x N instance-ийн тор, instance buffer болгон pack хийх.
*/


#include <cstdint>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "shc/shader/instance_attributes.hpp"

namespace shc
{
    struct InstanceGridConfig
    {
        uint32_t per_row = 10;
        float spacing = 3.0f;
        float tilt_deg = 45.0f;
    };

    // Мөр z, багана x. Байрлал нь spacing * (i - N/2).
    inline std::vector<InstanceTransform> make_instance_grid(const InstanceGridConfig& cfg = {})
    {
        std::vector<InstanceTransform> out{};
        out.reserve((size_t)cfg.per_row * (size_t)cfg.per_row);
        const float half = (float)cfg.per_row / 2.0f;
        for (uint32_t z = 0; z < cfg.per_row; ++z)
        {
            for (uint32_t x = 0; x < cfg.per_row; ++x)
            {
                InstanceTransform t{};
                t.position = glm::vec3(
                    cfg.spacing * ((float)x - half),
                    0.0f,
                    cfg.spacing * ((float)z - half)
                );
                // Төвийн instance-д тэнхлэг тодорхойгүй тул эргүүлэхгүй.
                if (glm::length(t.position) > 0.0f)
                {
                    t.rotation = glm::angleAxis(glm::radians(cfg.tilt_deg), glm::normalize(t.position));
                }
                out.push_back(t);
            }
        }
        return out;
    }

    inline std::vector<InstanceRaw> pack_instances(const std::vector<InstanceTransform>& transforms)
    {
        std::vector<InstanceRaw> out{};
        out.reserve(transforms.size());
        for (const InstanceTransform& t : transforms) out.push_back(pack_instance(t));
        return out;
    }
}
