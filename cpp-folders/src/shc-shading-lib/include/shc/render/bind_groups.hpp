#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: bind_groups.hpp
    МОДУЛЬ: render
    ЗОРИЛГО: Draw-д холбох resource-уудын бүлэг (texture, sampler, uniform buffer),
            тэдгээрийг layout-тай тулгах шалгалт, shader resource болгон задлах.
*/


#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "shc/core/result.hpp"
#include "shc/resources/texture.hpp"
#include "shc/rhi/binding_layout.hpp"
#include "shc/rhi/resource_desc.hpp"
#include "shc/shader/binding_contract.hpp"
#include "shc/shader/types.hpp"

namespace shc
{
    // GPU uniform buffer-тэй адил зөвхөн byte агуулна. Shader тал layout-аар нь уншина.
    struct UniformBuffer
    {
        std::string label{};
        std::vector<std::byte> bytes{};

        size_t size() const { return bytes.size(); }
    };

    template<typename T>
    inline UniformBuffer make_uniform_buffer(const T& value, std::string label = {})
    {
        UniformBuffer u{};
        u.label = std::move(label);
        u.bytes.resize(sizeof(T));
        std::memcpy(u.bytes.data(), &value, sizeof(T));
        return u;
    }

    template<typename T>
    inline void write_uniform(UniformBuffer& u, const T& value)
    {
        if (u.bytes.size() < sizeof(T)) u.bytes.resize(sizeof(T));
        std::memcpy(u.bytes.data(), &value, sizeof(T));
    }

    // Buffer хангалттай урттай эсэхийг validate_bind_groups урьдчилан шалгасан байх ёстой.
    template<typename T>
    inline T read_uniform(const UniformBuffer& u)
    {
        T out{};
        std::memcpy(&out, u.bytes.data(), std::min(sizeof(T), u.bytes.size()));
        return out;
    }

    using BindingResource = std::variant<
        std::monostate,
        const Texture2DData*,
        const RHISamplerDesc*,
        const UniformBuffer*
    >;

    struct BindGroupEntry
    {
        uint32_t binding = 0;
        BindingResource resource{};
    };

    struct BindGroup
    {
        std::string label{};
        std::vector<BindGroupEntry> entries{};

        const BindGroupEntry* find(uint32_t binding) const
        {
            for (const BindGroupEntry& e : entries)
            {
                if (e.binding == binding) return &e;
            }
            return nullptr;
        }
    };

    // Group index бүрт холбогдсон bind group. Эзэмшихгүй, draw дуустал амьд байх ёстой.
    struct BindGroupSet
    {
        std::array<const BindGroup*, SHC_MAX_BIND_GROUPS> groups{};

        void set(uint32_t index, const BindGroup* g)
        {
            if (index < SHC_MAX_BIND_GROUPS) groups[index] = g;
        }

        const BindGroup* get(uint32_t index) const
        {
            return index < SHC_MAX_BIND_GROUPS ? groups[index] : nullptr;
        }
    };

    inline RHIBindingType binding_resource_type(const BindingResource& r, bool& empty)
    {
        empty = false;
        if (std::holds_alternative<const Texture2DData*>(r)) return RHIBindingType::SampledTexture2D;
        if (std::holds_alternative<const RHISamplerDesc*>(r)) return RHIBindingType::Sampler;
        if (std::holds_alternative<const UniformBuffer*>(r)) return RHIBindingType::UniformBuffer;
        empty = true;
        return RHIBindingType::UniformBuffer;
    }

    inline Status validate_bind_groups(const RHIPipelineLayoutDesc& layout, const BindGroupSet& set)
    {
        for (const RHIBindGroupLayoutDesc& gl : layout.groups)
        {
            const std::string gname = "bind group " + std::to_string(gl.group) + " '" + gl.label + "'";
            const BindGroup* g = set.get(gl.group);
            if (!g) return Status::failure(gname + " is not bound");

            for (const RHIBindingLayoutEntry& el : gl.entries)
            {
                const std::string sname = gname + " slot " + std::to_string(el.binding);
                const BindGroupEntry* e = g->find(el.binding);
                if (!e) return Status::failure(sname + " has no resource");

                bool empty = false;
                const RHIBindingType t = binding_resource_type(e->resource, empty);
                if (empty) return Status::failure(sname + " has no resource");
                if (t != el.type)
                {
                    return Status::failure(
                        sname + " holds " + binding_type_name(t) + ", layout expects " + binding_type_name(el.type)
                    );
                }

                switch (t)
                {
                    case RHIBindingType::SampledTexture2D:
                    {
                        const Texture2DData* tex = std::get<const Texture2DData*>(e->resource);
                        if (!tex) return Status::failure(sname + " texture is null");
                        if (!tex->valid()) return Status::failure(sname + " texture '" + tex->label + "' has no texels");
                        break;
                    }
                    case RHIBindingType::Sampler:
                    {
                        if (!std::get<const RHISamplerDesc*>(e->resource)) return Status::failure(sname + " sampler is null");
                        break;
                    }
                    case RHIBindingType::UniformBuffer:
                    {
                        const UniformBuffer* u = std::get<const UniformBuffer*>(e->resource);
                        if (!u) return Status::failure(sname + " uniform buffer is null");
                        if ((uint64_t)u->size() < el.min_binding_size)
                        {
                            return Status::failure(
                                sname + " uniform buffer is " + std::to_string(u->size()) +
                                " bytes, layout needs " + std::to_string(el.min_binding_size)
                            );
                        }
                        break;
                    }
                }
            }
        }
        return Status::success();
    }

    inline BindGroup make_material_bind_group(
        const Texture2DData* diffuse,
        const RHISamplerDesc* diffuse_sampler,
        const Texture2DData* normal = nullptr,
        const RHISamplerDesc* normal_sampler = nullptr
    )
    {
        BindGroup g{};
        g.label = "material";
        g.entries.push_back({SHC_SLOT_DIFFUSE_TEXTURE, diffuse});
        g.entries.push_back({SHC_SLOT_DIFFUSE_SAMPLER, diffuse_sampler});
        if (normal || normal_sampler)
        {
            g.entries.push_back({SHC_SLOT_NORMAL_TEXTURE, normal});
            g.entries.push_back({SHC_SLOT_NORMAL_SAMPLER, normal_sampler});
        }
        return g;
    }

    inline BindGroup make_camera_bind_group(const UniformBuffer* camera)
    {
        BindGroup g{};
        g.label = "camera";
        g.entries.push_back({SHC_SLOT_CAMERA_UNIFORM, camera});
        return g;
    }

    inline BindGroup make_light_bind_group(const UniformBuffer* light)
    {
        BindGroup g{};
        g.label = "light";
        g.entries.push_back({SHC_SLOT_LIGHT_UNIFORM, light});
        return g;
    }

    namespace detail
    {
        template<typename T>
        inline T binding_as(const BindGroupSet& set, uint32_t group, uint32_t slot)
        {
            const BindGroup* g = set.get(group);
            if (!g) return nullptr;
            const BindGroupEntry* e = g->find(slot);
            if (!e) return nullptr;
            const T* p = std::get_if<T>(&e->resource);
            return p ? *p : nullptr;
        }
    }

    // validate_bind_groups амжилттай болсны дараа дуудна.
    inline ShaderResources resolve_shader_resources(PipelineKind kind, const BindGroupSet& set, const LightingConfig& lighting)
    {
        ShaderResources r{};
        r.lighting = lighting;

        r.diffuse_tex = detail::binding_as<const Texture2DData*>(set, SHC_GROUP_MATERIAL, SHC_SLOT_DIFFUSE_TEXTURE);
        if (const RHISamplerDesc* s = detail::binding_as<const RHISamplerDesc*>(set, SHC_GROUP_MATERIAL, SHC_SLOT_DIFFUSE_SAMPLER))
        {
            r.diffuse_sampler = *s;
        }

        if (const UniformBuffer* cam = detail::binding_as<const UniformBuffer*>(set, SHC_GROUP_CAMERA, SHC_SLOT_CAMERA_UNIFORM))
        {
            r.camera = read_uniform<CameraUniform>(*cam);
        }

        if (kind == PipelineKind::Lit)
        {
            r.normal_tex = detail::binding_as<const Texture2DData*>(set, SHC_GROUP_MATERIAL, SHC_SLOT_NORMAL_TEXTURE);
            if (const RHISamplerDesc* s = detail::binding_as<const RHISamplerDesc*>(set, SHC_GROUP_MATERIAL, SHC_SLOT_NORMAL_SAMPLER))
            {
                r.normal_sampler = *s;
            }
            if (const UniformBuffer* light = detail::binding_as<const UniformBuffer*>(set, SHC_GROUP_LIGHT, SHC_SLOT_LIGHT_UNIFORM))
            {
                r.light = read_uniform<LightUniform>(*light);
            }
        }
        return r;
    }
}
