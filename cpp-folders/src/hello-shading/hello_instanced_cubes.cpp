#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <shc/core/log.hpp>
#include <shc/core/time.hpp>
#include <shc/gfx/rt_types.hpp>
#include <shc/job/thread_pool_job_system.hpp>
#include <shc/platform/platform_input.hpp>
#include <shc/platform/platform_runtime.hpp>
#include <shc/platform/sdl/sdl_runtime.hpp>
#include <shc/render/bind_groups.hpp>
#include <shc/render/draw.hpp>
#include <shc/render/pipeline.hpp>
#include <shc/resources/primitives.hpp>
#include <shc/resources/procedural_textures.hpp>
#include <shc/scene/camera.hpp>
#include <shc/scene/camera_controller.hpp>
#include <shc/scene/instance_grid.hpp>
#include <shc/scene/light.hpp>
#include <shc/shader/vertex_formats.hpp>

namespace
{
constexpr int kWindowW = 1280;
constexpr int kWindowH = 720;
constexpr int kSurfaceW = 640;
constexpr int kSurfaceH = 360;
const shc::ColorF kBackground{0.1f, 0.2f, 0.3f, 1.0f};

struct DemoSettings
{
    shc::PipelineKind kind = shc::PipelineKind::Lit;
    shc::LightingConfig lighting{};
    uint32_t workers = 0;
};

uint32_t parse_env_u32(const char* value, uint32_t fallback)
{
    if (!value || *value == '\0') return fallback;
    char* end = nullptr;
    const unsigned long parsed = std::strtoul(value, &end, 10);
    if (end == value) return fallback;
    return (uint32_t)std::min<unsigned long>(parsed, (unsigned long)std::numeric_limits<uint32_t>::max());
}

float parse_env_f32(const char* value, float fallback, float min_value)
{
    if (!value || *value == '\0') return fallback;
    char* end = nullptr;
    const double parsed = std::strtod(value, &end);
    if (end == value || !std::isfinite(parsed)) return fallback;
    return std::max(min_value, (float)parsed);
}

DemoSettings settings_from_env()
{
    DemoSettings s{};
    const unsigned hw = std::thread::hardware_concurrency();
    s.workers = hw > 1u ? hw : 0u;

    if (const char* p = std::getenv("SHC_PIPELINE"))
    {
        std::string v(p);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return (char)std::tolower(c);
        });
        if (v == "basic") s.kind = shc::PipelineKind::Basic;
        else if (v == "lit") s.kind = shc::PipelineKind::Lit;
        else shc::log_warn("SHC_PIPELINE='" + v + "' is unknown, using lit");
    }
    s.lighting.ambient_strength = parse_env_f32(std::getenv("SHC_AMBIENT"), s.lighting.ambient_strength, 0.0f);
    s.lighting.shininess = parse_env_f32(std::getenv("SHC_SHININESS"), s.lighting.shininess, 1.0f);
    s.workers = parse_env_u32(std::getenv("SHC_WORKERS"), s.workers);
    return s;
}

class HelloInstancedCubesApp
{
public:
    explicit HelloInstancedCubesApp(const DemoSettings& s) : settings_(s) {}

    void run()
    {
        init_runtime();
        init_jobs();
        init_pipelines();
        init_scene();
        main_loop();
    }

private:
    void init_runtime()
    {
        shc::WindowDesc win{};
        win.title = "hello_instanced_cubes";
        win.width = kWindowW;
        win.height = kWindowH;

        shc::SurfaceDesc surface{};
        surface.width = kSurfaceW;
        surface.height = kSurfaceH;

        runtime_ = std::make_unique<shc::SdlRuntime>(win, surface);
        if (!runtime_ || !runtime_->valid())
        {
            throw std::runtime_error("SdlRuntime init failed");
        }
        clock_.tick_hz = (double)SDL_GetPerformanceFrequency();
    }

    void init_jobs()
    {
        if (settings_.workers > 0)
        {
            jobs_ = std::make_unique<shc::ThreadPoolJobSystem>((size_t)settings_.workers);
            draw_opts_.job_system = jobs_.get();
        }
        shc::log_info("workers: " + std::to_string(settings_.workers));
    }

    void init_pipelines()
    {
        shc::Result<shc::ShadingPipeline> basic = shc::create_shading_pipeline(
            shc::make_default_pipeline_desc(shc::PipelineKind::Basic, settings_.lighting));
        if (!basic.ok) throw std::runtime_error(basic.error);
        shc::Result<shc::ShadingPipeline> lit = shc::create_shading_pipeline(
            shc::make_default_pipeline_desc(shc::PipelineKind::Lit, settings_.lighting));
        if (!lit.ok) throw std::runtime_error(lit.error);

        basic_ = std::move(basic.value);
        lit_ = std::move(lit.value);
        kind_ = settings_.kind;
    }

    void init_scene()
    {
        cube_ = shc::make_cube();
        cube_basic_ = shc::pack_vertices_basic(cube_);
        cube_lit_ = shc::pack_vertices_lit(cube_);
        grid_instances_ = shc::pack_instances(shc::make_instance_grid());
        light_instance_.resize(1);

        diffuse_ = shc::make_checker_texture(64, 64, 8, shc::Color{222, 184, 135, 255}, shc::Color{139, 90, 43, 255});
        normal_ = shc::make_bump_normal_map(64, 64, 8, 0.6f);
        white_ = shc::make_solid_texture(1, 1, shc::Color{255, 255, 255, 255}, shc::RHIFormat::RGBA8_UNorm_sRGB);
        sampler_.mag_filter = shc::RHIFilter::Linear;
        sampler_.min_filter = shc::RHIFilter::Linear;

        camera_ = shc::Camera(shc::CameraConfig{});
        camera_.set_aspect(kSurfaceW, kSurfaceH);
        camera_ubo_ = shc::make_uniform_buffer(shc::make_camera_uniform(camera_), "camera");
        light_ubo_ = shc::make_uniform_buffer(shc::make_light_uniform(light_), "light");

        material_group_ = shc::make_material_bind_group(&diffuse_, &sampler_, &normal_, &sampler_);
        marker_group_ = shc::make_material_bind_group(&white_, &sampler_);
        camera_group_ = shc::make_camera_bind_group(&camera_ubo_);
        light_group_ = shc::make_light_bind_group(&light_ubo_);
    }

    void main_loop()
    {
        bool running = true;
        while (running)
        {
            shc::PlatformInputState input{};
            running = runtime_->pump_input(input);
            if (!running || input.quit) break;

            const float dt = clock_.begin_frame(SDL_GetPerformanceCounter());
            handle_input(input, dt);
            draw_frame();
            if (dt > 0.0f) frame_rate_.push_frame(dt);
            update_title();
        }
    }

    void handle_input(const shc::PlatformInputState& input, float dt)
    {
        if (input.toggle_frame_rate) show_frame_rate_ = !show_frame_rate_;
        if (input.toggle_pipeline)
        {
            kind_ = kind_ == shc::PipelineKind::Lit ? shc::PipelineKind::Basic : shc::PipelineKind::Lit;
            shc::log_info(std::string("pipeline: ") + shc::pipeline_kind_name(kind_));
        }
        if (input.up_axis_x) camera_.set_up_axis(shc::CameraUpAxis::X);
        if (input.up_axis_y) camera_.set_up_axis(shc::CameraUpAxis::Y);
        if (input.up_axis_z) camera_.set_up_axis(shc::CameraUpAxis::Z);
        if (input.mouse_moved)
        {
            light_.color = shc::light_color_from_cursor(input.mouse_x, input.mouse_y, input.window_w, input.window_h);
        }

        controller_.update(camera_, input, dt);
        light_animator_.update(light_, dt);
    }

    void draw_frame()
    {
        color_.clear(kBackground);
        depth_.clear(1.0f);

        shc::write_uniform(camera_ubo_, shc::make_camera_uniform(camera_));
        shc::write_uniform(light_ubo_, shc::make_light_uniform(light_));

        shc::BindGroupSet groups{};
        groups.set(shc::SHC_GROUP_MATERIAL, &material_group_);
        groups.set(shc::SHC_GROUP_CAMERA, &camera_group_);
        groups.set(shc::SHC_GROUP_LIGHT, &light_group_);

        const shc::ShadingPipeline& active = kind_ == shc::PipelineKind::Lit ? lit_ : basic_;
        shc::DrawCall grid{};
        grid.vertex_buffers[0] = kind_ == shc::PipelineKind::Lit ? shc::make_buffer_view(cube_lit_) : shc::make_buffer_view(cube_basic_);
        grid.vertex_buffers[1] = shc::make_buffer_view(grid_instances_);
        grid.indices = shc::make_index_view(cube_.indices);
        grid.instance_count = (uint32_t)grid_instances_.size();

        const shc::RasterizerTarget target{&color_, &depth_};
        const shc::Result<shc::DrawStats> drawn = shc::draw_instanced(active, grid, groups, target, draw_opts_);
        if (!drawn.ok) throw std::runtime_error(drawn.error);

        // Гэрлийн байрлалыг жижиг цагаан cube-ээр тэмдэглэнэ.
        const glm::mat4 marker = glm::scale(glm::translate(glm::mat4(1.0f), light_.position), glm::vec3(0.2f));
        light_instance_[0] = shc::pack_instance(marker);
        groups.set(shc::SHC_GROUP_MATERIAL, &marker_group_);

        shc::DrawCall light_draw{};
        light_draw.vertex_buffers[0] = shc::make_buffer_view(cube_basic_);
        light_draw.vertex_buffers[1] = shc::make_buffer_view(light_instance_);
        light_draw.indices = shc::make_index_view(cube_.indices);
        const shc::Result<shc::DrawStats> marked = shc::draw_instanced(basic_, light_draw, groups, target, draw_opts_);
        if (!marked.ok) throw std::runtime_error(marked.error);

        // Canvas-ийн (0,0) доод зүүн өнцөгт тул мөрүүдийг эргүүлж resolve хийнэ.
        shc::resolve_to_rgba8(color_, rgba_staging_, true);
        if (!runtime_->present_frame(shc::make_rgba8_frame(rgba_staging_, color_.w, color_.h)))
        {
            throw std::runtime_error("present_frame failed");
        }
    }

    void update_title()
    {
        std::string title = std::string("hello_instanced_cubes | ") + shc::pipeline_kind_name(kind_);
        if (show_frame_rate_)
        {
            char buf[64];
            std::snprintf(buf, sizeof(buf), " | %.1f fps (avg %.1f)", frame_rate_.frame_rate(), frame_rate_.average_frame_rate());
            title += buf;
        }
        if (title != last_title_)
        {
            runtime_->set_title(title);
            last_title_ = title;
        }
    }

private:
    DemoSettings settings_{};
    std::unique_ptr<shc::SdlRuntime> runtime_{};
    std::unique_ptr<shc::ThreadPoolJobSystem> jobs_{};
    shc::DrawOptions draw_opts_{};

    shc::ShadingPipeline basic_{};
    shc::ShadingPipeline lit_{};
    shc::PipelineKind kind_ = shc::PipelineKind::Lit;

    shc::MeshData cube_{};
    std::vector<shc::VertexBasic> cube_basic_{};
    std::vector<shc::VertexLit> cube_lit_{};
    std::vector<shc::InstanceRaw> grid_instances_{};
    std::vector<shc::InstanceRaw> light_instance_{};

    shc::Texture2DData diffuse_{};
    shc::Texture2DData normal_{};
    shc::Texture2DData white_{};
    shc::RHISamplerDesc sampler_{};

    shc::Camera camera_{};
    shc::OrbitCameraController controller_{};
    shc::PointLight light_{};
    shc::LightAnimator light_animator_{};
    shc::UniformBuffer camera_ubo_{};
    shc::UniformBuffer light_ubo_{};

    shc::BindGroup material_group_{};
    shc::BindGroup marker_group_{};
    shc::BindGroup camera_group_{};
    shc::BindGroup light_group_{};

    shc::FrameClock clock_{};
    shc::FrameRateTracker frame_rate_{};
    bool show_frame_rate_ = true;
    std::string last_title_{};

    shc::RT_ColorHDR color_{kSurfaceW, kSurfaceH, kBackground};
    shc::RT_DepthBuffer depth_{kSurfaceW, kSurfaceH};
    std::vector<uint8_t> rgba_staging_{};
};
}

int main()
{
    try
    {
        const DemoSettings settings = settings_from_env();
        HelloInstancedCubesApp app(settings);
        app.run();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
}
