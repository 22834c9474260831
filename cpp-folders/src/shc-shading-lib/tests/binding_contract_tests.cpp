#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "shc/core/log.hpp"
#include "shc/render/bind_groups.hpp"
#include "shc/render/pipeline.hpp"
#include "shc/resources/procedural_textures.hpp"
#include "shc/shader/binding_contract.hpp"
#include "shc/shader/uniforms.hpp"

namespace
{
    bool contains(const std::string& s, const char* needle)
    {
        return s.find(needle) != std::string::npos;
    }

    struct MaterialFixture
    {
        shc::Texture2DData diffuse = shc::make_checker_texture(4, 4, 2, shc::Color{255, 255, 255, 255}, shc::Color{0, 0, 0, 255});
        shc::Texture2DData normal = shc::make_flat_normal_map(4, 4);
        shc::RHISamplerDesc sampler{};
        shc::UniformBuffer camera = shc::make_uniform_buffer(shc::CameraUniform{}, "camera");
        shc::UniformBuffer light = shc::make_uniform_buffer(shc::make_light_uniform(glm::vec3(2.0f), glm::vec3(1.0f, 0.5f, 0.25f)), "light");

        shc::BindGroup material = shc::make_material_bind_group(&diffuse, &sampler, &normal, &sampler);
        shc::BindGroup camera_group = shc::make_camera_bind_group(&camera);
        shc::BindGroup light_group = shc::make_light_bind_group(&light);

        shc::BindGroupSet set() const
        {
            shc::BindGroupSet s{};
            s.set(shc::SHC_GROUP_MATERIAL, &material);
            s.set(shc::SHC_GROUP_CAMERA, &camera_group);
            s.set(shc::SHC_GROUP_LIGHT, &light_group);
            return s;
        }
    };

    bool test_uniform_byte_layouts()
    {
        if (sizeof(shc::CameraUniform) != 80) return false;
        if (offsetof(shc::CameraUniform, view_proj) != 16) return false;
        if (sizeof(shc::LightUniform) != 32) return false;
        if (offsetof(shc::LightUniform, color) != 16) return false;

        shc::CameraUniform cam{};
        cam.view_position = glm::vec4(1.0f, 2.0f, 3.0f, 1.0f);
        cam.view_proj[3] = glm::vec4(4.0f, 5.0f, 6.0f, 1.0f);
        const shc::UniformBuffer buf = shc::make_uniform_buffer(cam);
        if (buf.size() != 80) return false;
        const shc::CameraUniform back = shc::read_uniform<shc::CameraUniform>(buf);
        return back.view_position == cam.view_position && back.view_proj == cam.view_proj;
    }

    bool test_expected_layout_matches_contract()
    {
        const shc::RHIPipelineLayoutDesc basic = shc::expected_pipeline_layout(shc::PipelineKind::Basic);
        const shc::RHIPipelineLayoutDesc lit = shc::expected_pipeline_layout(shc::PipelineKind::Lit);
        if (basic.groups.size() != 2 || lit.groups.size() != 3) return false;
        if (basic.find_group(2) != nullptr) return false;

        const shc::RHIBindGroupLayoutDesc* mat = lit.find_group(0);
        if (!mat || mat->entries.size() != 4) return false;
        if (mat->find(0)->type != shc::RHIBindingType::SampledTexture2D) return false;
        if (mat->find(1)->type != shc::RHIBindingType::Sampler) return false;
        if (mat->find(2)->type != shc::RHIBindingType::SampledTexture2D) return false;
        if (mat->find(3)->type != shc::RHIBindingType::Sampler) return false;
        if (basic.find_group(0)->entries.size() != 2) return false;

        const shc::RHIBindGroupLayoutDesc* cam = lit.find_group(1);
        if (!cam || cam->find(0)->type != shc::RHIBindingType::UniformBuffer || cam->find(0)->min_binding_size != 80) return false;
        const shc::RHIBindGroupLayoutDesc* light = lit.find_group(2);
        if (!light || light->find(0)->type != shc::RHIBindingType::UniformBuffer || light->find(0)->min_binding_size != 32) return false;

        return (bool)shc::validate_pipeline_layout(shc::PipelineKind::Basic, basic) &&
            (bool)shc::validate_pipeline_layout(shc::PipelineKind::Lit, lit);
    }

    bool test_layout_validation_catches_wrong_slot()
    {
        shc::RHIPipelineLayoutDesc l = shc::expected_pipeline_layout(shc::PipelineKind::Lit);
        // Normal texture, sampler хоёрын slot-ыг солино.
        l.groups[0].entries[2].type = shc::RHIBindingType::Sampler;
        l.groups[0].entries[3].type = shc::RHIBindingType::SampledTexture2D;
        const shc::Status st = shc::validate_pipeline_layout(shc::PipelineKind::Lit, l);
        return !st.ok && contains(st.error, "slot 2") && contains(st.error, "material");
    }

    bool test_layout_validation_catches_wrong_group()
    {
        shc::RHIPipelineLayoutDesc l = shc::expected_pipeline_layout(shc::PipelineKind::Lit);
        l.groups[2].group = 3;
        const shc::Status st = shc::validate_pipeline_layout(shc::PipelineKind::Lit, l);
        if (st.ok || !contains(st.error, "group 3")) return false;

        // Basic pipeline light group зарлахгүй.
        const shc::Status extra = shc::validate_pipeline_layout(shc::PipelineKind::Basic, shc::expected_pipeline_layout(shc::PipelineKind::Lit));
        return !extra.ok;
    }

    bool test_layout_validation_catches_missing_light_group()
    {
        shc::RHIPipelineLayoutDesc l = shc::expected_pipeline_layout(shc::PipelineKind::Lit);
        l.groups.pop_back();
        const shc::Status st = shc::validate_pipeline_layout(shc::PipelineKind::Lit, l);
        return !st.ok && contains(st.error, "missing group 2 'light'");
    }

    bool test_layout_validation_catches_duplicate_group()
    {
        shc::RHIPipelineLayoutDesc l = shc::expected_pipeline_layout(shc::PipelineKind::Basic);
        shc::RHIBindGroupLayoutDesc dup = *l.find_group(1);
        dup.entries[0].type = shc::RHIBindingType::Sampler;
        l.groups.push_back(dup);
        const shc::Status st = shc::validate_pipeline_layout(shc::PipelineKind::Basic, l);
        if (st.ok || !contains(st.error, "bind group 1 'camera' declared more than once")) return false;

        // Давхардсан group бүрэн зөв байсан ч хүлээн авахгүй.
        shc::RHIPipelineLayoutDesc same = shc::expected_pipeline_layout(shc::PipelineKind::Lit);
        same.groups.push_back(same.groups.front());
        return !shc::validate_pipeline_layout(shc::PipelineKind::Lit, same).ok;
    }

    bool test_layout_validation_catches_small_uniform()
    {
        shc::RHIPipelineLayoutDesc l = shc::expected_pipeline_layout(shc::PipelineKind::Lit);
        l.groups[1].entries[0].min_binding_size = 64;
        const shc::Status st = shc::validate_pipeline_layout(shc::PipelineKind::Lit, l);
        return !st.ok && contains(st.error, "min size");
    }

    bool test_pipeline_rejects_mismatched_vertex_layout()
    {
        shc::ShadingPipelineDesc d = shc::make_default_pipeline_desc(shc::PipelineKind::Lit);
        if (!shc::create_shading_pipeline(d).ok) return false;

        d.vertex_buffers[0] = shc::vertex_basic_layout();
        const shc::Result<shc::ShadingPipeline> r = shc::create_shading_pipeline(d);
        if (r.ok || !contains(r.error, "vertex layout")) return false;

        shc::ShadingPipelineDesc wrong_format = shc::make_default_pipeline_desc(shc::PipelineKind::Basic);
        wrong_format.vertex_buffers[0].attributes[1].format = shc::RHIVertexFormat::Float32x3;
        if (shc::create_shading_pipeline(wrong_format).ok) return false;

        shc::ShadingPipelineDesc wrong_step = shc::make_default_pipeline_desc(shc::PipelineKind::Basic);
        wrong_step.vertex_buffers[1].step_mode = shc::RHIVertexStepMode::Vertex;
        if (shc::create_shading_pipeline(wrong_step).ok) return false;

        shc::ShadingPipelineDesc short_stride = shc::make_default_pipeline_desc(shc::PipelineKind::Basic);
        short_stride.vertex_buffers[1].stride = 60;
        return !shc::create_shading_pipeline(short_stride).ok;
    }

    bool test_pipeline_rejects_mismatched_bind_layout()
    {
        shc::ShadingPipelineDesc d = shc::make_default_pipeline_desc(shc::PipelineKind::Lit);
        d.layout = shc::expected_pipeline_layout(shc::PipelineKind::Basic);
        const shc::Result<shc::ShadingPipeline> r = shc::create_shading_pipeline(d);
        if (r.ok || !contains(r.error, "pipeline layout")) return false;

        shc::ShadingPipelineDesc ldr = shc::make_default_pipeline_desc(shc::PipelineKind::Basic);
        ldr.color_format = shc::RHIFormat::RGBA8_UNorm;
        return !shc::create_shading_pipeline(ldr).ok;
    }

    bool test_pipeline_keeps_lighting_config()
    {
        shc::LightingConfig cfg{};
        cfg.ambient_strength = 0.2f;
        cfg.shininess = 8.0f;
        const shc::Result<shc::ShadingPipeline> r = shc::create_shading_pipeline(shc::make_default_pipeline_desc(shc::PipelineKind::Lit, cfg));
        if (!r.ok) return false;
        if (r.value.lighting.ambient_strength != 0.2f || r.value.lighting.shininess != 8.0f) return false;
        if (!r.value.program.valid() || r.value.program.kind != shc::PipelineKind::Lit) return false;

        const shc::LightingConfig defaults{};
        return defaults.ambient_strength == 0.1f && defaults.shininess == 32.0f;
    }

    bool test_bind_group_validation_accepts_complete_set()
    {
        MaterialFixture fx{};
        const shc::BindGroupSet s = fx.set();
        return (bool)shc::validate_bind_groups(shc::expected_pipeline_layout(shc::PipelineKind::Lit), s) &&
            (bool)shc::validate_bind_groups(shc::expected_pipeline_layout(shc::PipelineKind::Basic), s);
    }

    bool test_bind_group_validation_catches_missing_texture()
    {
        MaterialFixture fx{};
        fx.material = shc::make_material_bind_group(&fx.diffuse, &fx.sampler, nullptr, &fx.sampler);
        const shc::Status st = shc::validate_bind_groups(shc::expected_pipeline_layout(shc::PipelineKind::Lit), fx.set());
        if (st.ok || !contains(st.error, "slot 2")) return false;

        // Basic pipeline normal map уншихгүй.
        return (bool)shc::validate_bind_groups(shc::expected_pipeline_layout(shc::PipelineKind::Basic), fx.set());
    }

    bool test_bind_group_validation_catches_wrong_resource()
    {
        MaterialFixture fx{};
        fx.material.entries[1].resource = static_cast<const shc::Texture2DData*>(&fx.diffuse);
        const shc::Status st = shc::validate_bind_groups(shc::expected_pipeline_layout(shc::PipelineKind::Basic), fx.set());
        return !st.ok && contains(st.error, "Sampler");
    }

    bool test_bind_group_validation_catches_short_uniform()
    {
        MaterialFixture fx{};
        fx.light.bytes.resize(16);
        const shc::Status st = shc::validate_bind_groups(shc::expected_pipeline_layout(shc::PipelineKind::Lit), fx.set());
        if (st.ok || !contains(st.error, "light")) return false;

        shc::BindGroupSet missing = fx.set();
        missing.set(shc::SHC_GROUP_CAMERA, nullptr);
        const shc::Status st2 = shc::validate_bind_groups(shc::expected_pipeline_layout(shc::PipelineKind::Basic), missing);
        return !st2.ok && contains(st2.error, "not bound");
    }

    bool test_resolve_reads_uniforms_and_textures()
    {
        MaterialFixture fx{};
        shc::CameraUniform cam{};
        cam.view_position = glm::vec4(0.0f, 1.0f, 2.0f, 1.0f);
        shc::write_uniform(fx.camera, cam);

        shc::LightingConfig cfg{};
        cfg.shininess = 16.0f;
        const shc::ShaderResources lit = shc::resolve_shader_resources(shc::PipelineKind::Lit, fx.set(), cfg);
        if (lit.diffuse_tex != &fx.diffuse || lit.normal_tex != &fx.normal) return false;
        if (lit.camera.view_position != cam.view_position) return false;
        if (lit.light.position != glm::vec3(2.0f) || lit.light.color != glm::vec3(1.0f, 0.5f, 0.25f)) return false;
        if (lit.lighting.shininess != 16.0f) return false;

        const shc::ShaderResources basic = shc::resolve_shader_resources(shc::PipelineKind::Basic, fx.set(), cfg);
        return basic.normal_tex == nullptr && basic.diffuse_tex == &fx.diffuse;
    }
}

int main()
{
    // Алдааны замуудыг зориуд шалгадаг тул log-ийг хаана.
    shc::set_log_level(shc::LogLevel::Off);

    const bool ok_uniforms = test_uniform_byte_layouts();
    const bool ok_expected = test_expected_layout_matches_contract();
    const bool ok_wrong_slot = test_layout_validation_catches_wrong_slot();
    const bool ok_wrong_group = test_layout_validation_catches_wrong_group();
    const bool ok_missing_light = test_layout_validation_catches_missing_light_group();
    const bool ok_duplicate = test_layout_validation_catches_duplicate_group();
    const bool ok_small_uniform = test_layout_validation_catches_small_uniform();
    const bool ok_vertex_layout = test_pipeline_rejects_mismatched_vertex_layout();
    const bool ok_bind_layout = test_pipeline_rejects_mismatched_bind_layout();
    const bool ok_lighting = test_pipeline_keeps_lighting_config();
    const bool ok_complete = test_bind_group_validation_accepts_complete_set();
    const bool ok_missing_tex = test_bind_group_validation_catches_missing_texture();
    const bool ok_wrong_res = test_bind_group_validation_catches_wrong_resource();
    const bool ok_short_uniform = test_bind_group_validation_catches_short_uniform();
    const bool ok_resolve = test_resolve_reads_uniforms_and_textures();

    if (!ok_uniforms) std::fprintf(stderr, "[binding-tests] uniform byte layout failed\n");
    if (!ok_expected) std::fprintf(stderr, "[binding-tests] expected pipeline layout failed\n");
    if (!ok_wrong_slot) std::fprintf(stderr, "[binding-tests] wrong slot not rejected\n");
    if (!ok_wrong_group) std::fprintf(stderr, "[binding-tests] wrong group not rejected\n");
    if (!ok_missing_light) std::fprintf(stderr, "[binding-tests] missing light group not rejected\n");
    if (!ok_duplicate) std::fprintf(stderr, "[binding-tests] duplicate bind group not rejected\n");
    if (!ok_small_uniform) std::fprintf(stderr, "[binding-tests] undersized uniform layout not rejected\n");
    if (!ok_vertex_layout) std::fprintf(stderr, "[binding-tests] mismatched vertex layout not rejected\n");
    if (!ok_bind_layout) std::fprintf(stderr, "[binding-tests] mismatched bind layout not rejected\n");
    if (!ok_lighting) std::fprintf(stderr, "[binding-tests] pipeline lighting config failed\n");
    if (!ok_complete) std::fprintf(stderr, "[binding-tests] complete bind group set rejected\n");
    if (!ok_missing_tex) std::fprintf(stderr, "[binding-tests] missing texture not rejected\n");
    if (!ok_wrong_res) std::fprintf(stderr, "[binding-tests] wrong resource type not rejected\n");
    if (!ok_short_uniform) std::fprintf(stderr, "[binding-tests] short uniform buffer not rejected\n");
    if (!ok_resolve) std::fprintf(stderr, "[binding-tests] shader resource resolve failed\n");

    if (!(ok_uniforms && ok_expected && ok_wrong_slot && ok_wrong_group && ok_missing_light && ok_duplicate && ok_small_uniform &&
          ok_vertex_layout && ok_bind_layout && ok_lighting && ok_complete && ok_missing_tex && ok_wrong_res &&
          ok_short_uniform && ok_resolve)) return 1;
    std::fprintf(stderr, "[binding-tests] all tests passed\n");
    return 0;
}
