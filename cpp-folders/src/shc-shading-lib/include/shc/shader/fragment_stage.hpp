#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: fragment_stage.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Basic: diffuse texture-ийг шууд гаргана.
            Lit: normal map + tangent-space Blinn-Phong, нэг point light.
*/


#include <glm/glm.hpp>

#include "shc/resources/sampler.hpp"
#include "shc/shader/lighting.hpp"
#include "shc/shader/pipeline_kind.hpp"
#include "shc/shader/types.hpp"

namespace shc
{
    inline glm::vec2 fragment_uv(const FragmentIn& in)
    {
        return glm::vec2(get_varying(in, VaryingSemantic::TexCoord));
    }

    inline FragmentOut fragment_stage_basic(const FragmentIn& in, const ShaderResources& res)
    {
        const glm::vec4 albedo = sample_texture2d(res.diffuse_tex, res.diffuse_sampler, fragment_uv(in));
        FragmentOut out{};
        out.color = to_color(albedo);
        return out;
    }

    // Гэрэл гадаргуугийн ард байх, normal map unit биш байх зэргийг илрүүлэхгүй,
    // max(.., 0)-ээр математикаар шингээнэ.
    inline glm::vec4 shade_lit(const FragmentIn& in, const ShaderResources& res)
    {
        const glm::vec2 uv = fragment_uv(in);
        const glm::vec4 albedo = sample_texture2d(res.diffuse_tex, res.diffuse_sampler, uv);
        const glm::vec3 n = decode_normal_sample(sample_texture2d(res.normal_tex, res.normal_sampler, uv));

        const glm::vec3 tp = glm::vec3(get_varying(in, VaryingSemantic::TangentPosition));
        const glm::vec3 tlp = glm::vec3(get_varying(in, VaryingSemantic::TangentLightPosition));
        const glm::vec3 tvp = glm::vec3(get_varying(in, VaryingSemantic::TangentViewPosition));
        const glm::vec3 L = glm::normalize(tlp - tp);
        const glm::vec3 V = glm::normalize(tvp - tp);

        const BlinnPhongTerms terms = evaluate_blinn_phong(n, L, V, res.light.color, res.lighting);
        return combine_blinn_phong(terms, albedo);
    }

    inline FragmentOut fragment_stage_lit(const FragmentIn& in, const ShaderResources& res)
    {
        FragmentOut out{};
        out.color = to_color(shade_lit(in, res));
        return out;
    }

    inline FragmentOut run_fragment_stage(PipelineKind kind, const FragmentIn& in, const ShaderResources& res)
    {
        if (kind == PipelineKind::Lit) return fragment_stage_lit(in, res);
        return fragment_stage_basic(in, res);
    }
}
