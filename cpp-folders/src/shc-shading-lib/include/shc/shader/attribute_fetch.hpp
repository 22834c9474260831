#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: attribute_fetch.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Raw buffer-ээс layout-ын дагуу attribute-уудыг shader location бүрийн vec4 lane руу
            уншиж, vertex болон instance оролт болгон задална.
*/


#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <glm/glm.hpp>

#include "shc/rhi/vertex_layout.hpp"
#include "shc/shader/instance_attributes.hpp"
#include "shc/shader/vertex_formats.hpp"

namespace shc
{
    struct VertexBufferView
    {
        const std::byte* data = nullptr;
        size_t size_bytes = 0;

        bool valid() const { return data != nullptr && size_bytes > 0; }
    };

    template<typename T>
    inline VertexBufferView make_buffer_view(const std::vector<T>& v)
    {
        VertexBufferView view{};
        view.data = reinterpret_cast<const std::byte*>(v.data());
        view.size_bytes = v.size() * sizeof(T);
        return view;
    }

    struct AttributeLanes
    {
        std::array<glm::vec4, SHC_MAX_ATTRIBUTE_LOCATIONS> lanes{};
        uint32_t mask = 0u;

        bool has(uint32_t location) const
        {
            return location < SHC_MAX_ATTRIBUTE_LOCATIONS && (mask & (1u << location)) != 0u;
        }

        glm::vec4 get(uint32_t location, const glm::vec4& fallback = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f)) const
        {
            return has(location) ? lanes[location] : fallback;
        }
    };

    // Дутуу component-ууд (0, 0, 0, 1) утгатай болно.
    inline glm::vec4 decode_attribute(const std::byte* src, RHIVertexFormat fmt)
    {
        float f[4] = {0.0f, 0.0f, 0.0f, 1.0f};
        std::memcpy(f, src, vertex_format_size(fmt));
        return glm::vec4(f[0], f[1], f[2], f[3]);
    }

    // Buffer-ийн хязгаараас гарсан уншилт lane-ийг тэглэнэ (robust buffer access).
    inline void fetch_attribute_lanes(
        const RHIVertexBufferLayoutDesc& layout,
        const VertexBufferView& buffer,
        uint32_t vertex_index,
        uint32_t instance_index,
        AttributeLanes& out
    )
    {
        const uint32_t element = layout.step_mode == RHIVertexStepMode::Instance ? instance_index : vertex_index;
        const size_t base = (size_t)element * (size_t)layout.stride;
        for (const RHIVertexAttributeDesc& a : layout.attributes)
        {
            if (a.location >= SHC_MAX_ATTRIBUTE_LOCATIONS) continue;
            const size_t begin = base + a.offset;
            const size_t end = begin + vertex_format_size(a.format);
            if (!buffer.data || end > buffer.size_bytes)
            {
                out.lanes[a.location] = glm::vec4(0.0f);
            }
            else
            {
                out.lanes[a.location] = decode_attribute(buffer.data + begin, a.format);
            }
            out.mask |= (1u << a.location);
        }
    }

    struct VertexInput
    {
        glm::vec3 position{0.0f};
        glm::vec2 uv{0.0f};
        glm::vec3 normal{0.0f, 0.0f, 1.0f};
        glm::vec3 tangent{1.0f, 0.0f, 0.0f};
        glm::vec3 bitangent{0.0f, 1.0f, 0.0f};
    };

    inline VertexInput read_vertex_input(const AttributeLanes& l)
    {
        VertexInput v{};
        v.position = glm::vec3(l.get(SHC_LOC_POSITION));
        v.uv = glm::vec2(l.get(SHC_LOC_TEXCOORD));
        if (l.has(SHC_LOC_NORMAL)) v.normal = glm::vec3(l.lanes[SHC_LOC_NORMAL]);
        if (l.has(SHC_LOC_TANGENT)) v.tangent = glm::vec3(l.lanes[SHC_LOC_TANGENT]);
        if (l.has(SHC_LOC_BITANGENT)) v.bitangent = glm::vec3(l.lanes[SHC_LOC_BITANGENT]);
        return v;
    }

    // Lane 5-8 нь model багана, 9-11 нь normal багана. Bind хийгдээгүй бол identity хэвээр.
    inline InstanceInput read_instance_input(const AttributeLanes& l)
    {
        InstanceInput in{};
        for (uint32_t c = 0; c < 4; ++c)
        {
            if (l.has(SHC_LOC_MODEL_COL0 + c)) in.model_cols[c] = l.lanes[SHC_LOC_MODEL_COL0 + c];
        }
        for (uint32_t c = 0; c < 3; ++c)
        {
            if (l.has(SHC_LOC_NORMAL_COL0 + c)) in.normal_cols[c] = glm::vec3(l.lanes[SHC_LOC_NORMAL_COL0 + c]);
        }
        return in;
    }
}
