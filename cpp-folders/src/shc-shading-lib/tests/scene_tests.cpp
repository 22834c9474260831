#include <cmath>
#include <cstdio>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include "shc/core/time.hpp"
#include "shc/scene/camera.hpp"
#include "shc/scene/camera_controller.hpp"
#include "shc/scene/instance_grid.hpp"
#include "shc/scene/light.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_vec3(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps) && approx_eq(a.z, b.z, eps);
    }

    float clip_depth_of(const glm::mat4& view_proj, const glm::vec3& p)
    {
        const glm::vec4 c = view_proj * glm::vec4(p, 1.0f);
        return c.z / c.w;
    }

    bool test_camera_defaults()
    {
        const shc::Camera cam{};
        if (!approx_vec3(cam.eye, glm::vec3(0.0f, 1.0f, 2.0f))) return false;
        if (!approx_vec3(cam.up, glm::vec3(0.0f, 1.0f, 0.0f))) return false;
        if (!approx_eq(cam.aspect, 16.0f / 9.0f)) return false;
        if (cam.fovy_deg != 45.0f || cam.znear != 0.1f || cam.zfar != 100.0f) return false;
        return cam.clip_depth == shc::RHIClipDepth::ZeroToOne;
    }

    bool test_zero_to_one_depth_range()
    {
        shc::Camera cam{};
        cam.eye = glm::vec3(0.0f);
        cam.target = glm::vec3(0.0f, 0.0f, -1.0f);
        const glm::mat4 vp = cam.view_projection();
        if (!approx_eq(clip_depth_of(vp, glm::vec3(0.0f, 0.0f, -0.1f)), 0.0f)) return false;
        if (!approx_eq(clip_depth_of(vp, glm::vec3(0.0f, 0.0f, -100.0f)), 1.0f)) return false;

        // Нэг удаа хөрвүүлсэн projection нь glm-ийн ZO projection-тэй тэнцүү.
        const glm::mat4 zo = glm::perspectiveRH_ZO(glm::radians(cam.fovy_deg), cam.aspect, cam.znear, cam.zfar);
        const glm::mat4 p = cam.projection();
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                if (!approx_eq(p[c][r], zo[c][r], 1e-5f)) return false;
            }
        }

        cam.clip_depth = shc::RHIClipDepth::NegOneToOne;
        return approx_eq(clip_depth_of(cam.view_projection(), glm::vec3(0.0f, 0.0f, -0.1f)), -1.0f);
    }

    bool test_camera_uniform_and_up_axis()
    {
        shc::Camera cam{};
        cam.set_up_axis(shc::CameraUpAxis::Z);
        if (!approx_vec3(cam.up, glm::vec3(0.0f, 0.0f, 1.0f))) return false;
        cam.set_up_axis(shc::CameraUpAxis::X);
        if (!approx_vec3(cam.up, glm::vec3(1.0f, 0.0f, 0.0f))) return false;

        cam.set_aspect(800, 0);
        if (!approx_eq(cam.aspect, 16.0f / 9.0f)) return false;
        cam.set_aspect(800, 600);
        if (!approx_eq(cam.aspect, 4.0f / 3.0f)) return false;

        const shc::CameraUniform u = shc::make_camera_uniform(cam);
        if (u.view_position != glm::vec4(cam.eye, 1.0f)) return false;
        return u.view_proj == cam.view_projection();
    }

    bool test_orbit_sideways_keeps_radius()
    {
        shc::Camera cam{};
        const float radius = glm::length(cam.eye - cam.target);
        const shc::OrbitCameraController ctl{};

        shc::OrbitControlState right{};
        right.right = true;
        const glm::vec3 before = cam.eye;
        ctl.update(cam, right, 0.016f);
        if (approx_vec3(cam.eye, before, 1e-6f)) return false;
        if (!approx_eq(glm::length(cam.eye - cam.target), radius)) return false;

        shc::OrbitControlState left{};
        left.left = true;
        ctl.update(cam, left, 0.016f);
        return approx_eq(glm::length(cam.eye - cam.target), radius);
    }

    bool test_orbit_forward_stops_before_target()
    {
        shc::Camera cam{};
        const float radius = glm::length(cam.eye - cam.target);
        const shc::OrbitCameraController ctl{};

        shc::OrbitControlState fwd{};
        fwd.forward = true;
        const glm::vec3 before = cam.eye;
        ctl.update(cam, fwd, 1.0f);
        if (!approx_vec3(cam.eye, before, 1e-6f)) return false;

        ctl.update(cam, fwd, 0.01f);
        if (!approx_eq(glm::length(cam.eye - cam.target), radius - 0.3f)) return false;

        shc::OrbitControlState back{};
        back.backward = true;
        ctl.update(cam, back, 0.1f);
        return approx_eq(glm::length(cam.eye - cam.target), radius - 0.3f + 3.0f);
    }

    bool test_light_rotation_returns_after_full_turn()
    {
        shc::PointLight light{};
        const glm::vec3 start = light.position;
        const shc::LightAnimator anim{};

        // 3s * 30 град = +Y тойрон 90 градус: (x, z) -> (z, -x).
        anim.update(light, 3.0f);
        if (!approx_vec3(light.position, glm::vec3(2.0f, 2.0f, -2.0f))) return false;
        if (!approx_eq(glm::length(light.position), glm::length(start))) return false;

        for (int i = 0; i < 9; ++i) anim.update(light, 1.0f);
        return approx_vec3(light.position, start, 1e-3f);
    }

    bool test_light_color_from_cursor()
    {
        if (!approx_vec3(shc::light_color_from_cursor(400.0f, 300.0f, 800, 600), glm::vec3(0.5f, 0.5f, 0.5f))) return false;
        if (!approx_vec3(shc::light_color_from_cursor(-10.0f, 900.0f, 800, 600), glm::vec3(0.0f, 1.0f, 0.5f))) return false;
        if (!approx_vec3(shc::light_color_from_cursor(10.0f, 10.0f, 0, 600), glm::vec3(1.0f))) return false;

        shc::PointLight light{};
        light.color = glm::vec3(0.25f, 0.5f, 0.5f);
        const shc::LightUniform u = shc::make_light_uniform(light);
        return approx_vec3(u.position, light.position) && approx_vec3(u.color, light.color);
    }

    bool test_instance_grid_layout()
    {
        const std::vector<shc::InstanceTransform> grid = shc::make_instance_grid();
        if (grid.size() != 100) return false;
        if (!approx_vec3(grid[0].position, glm::vec3(-15.0f, 0.0f, -15.0f))) return false;
        if (!approx_vec3(grid[1].position, glm::vec3(-12.0f, 0.0f, -15.0f))) return false;
        if (!approx_vec3(grid[10].position, glm::vec3(-15.0f, 0.0f, -12.0f))) return false;

        // 5*10 + 5 нь эх цэг дээр байрлана.
        const shc::InstanceTransform& center = grid[55];
        if (!approx_vec3(center.position, glm::vec3(0.0f))) return false;
        if (!approx_eq(glm::angle(center.rotation), 0.0f, 1e-3f)) return false;

        const glm::quat q = grid[0].rotation;
        if (!approx_eq(glm::angle(q), glm::radians(45.0f), 1e-3f)) return false;
        if (!approx_vec3(glm::axis(q), glm::normalize(grid[0].position), 1e-3f)) return false;

        return shc::pack_instances(grid).size() == grid.size();
    }

    bool test_frame_rate_tracker()
    {
        shc::FrameRateTracker t{};
        if (t.frame_rate() != 0.0f || t.average_frame_rate() != 0.0f) return false;

        for (int i = 0; i < 200; ++i) t.push_frame(0.01f);
        if (t.frame_count() != shc::SHC_FRAME_HISTORY || t.rate_count() != shc::SHC_FRAME_RATE_HISTORY) return false;
        if (!approx_eq(t.frame_rate(), 100.0f, 0.01f)) return false;
        if (!approx_eq(t.average_frame_rate(), 100.0f, 0.01f)) return false;

        for (int i = 0; i < 128; ++i) t.push_frame(0.02f);
        if (!approx_eq(t.frame_rate(), 50.0f, 0.01f)) return false;
        const float avg = t.average_frame_rate();
        return avg > 50.0f && avg < 100.0f;
    }

    bool test_frame_clock()
    {
        shc::FrameClock clock{};
        clock.tick_hz = 1000.0;
        if (clock.begin_frame(1000) != 0.0f) return false;
        return approx_eq(clock.begin_frame(1016), 0.016f, 1e-6f);
    }
}

int main()
{
    const bool ok_defaults = test_camera_defaults();
    const bool ok_depth = test_zero_to_one_depth_range();
    const bool ok_uniform = test_camera_uniform_and_up_axis();
    const bool ok_orbit = test_orbit_sideways_keeps_radius();
    const bool ok_forward = test_orbit_forward_stops_before_target();
    const bool ok_light = test_light_rotation_returns_after_full_turn();
    const bool ok_cursor = test_light_color_from_cursor();
    const bool ok_grid = test_instance_grid_layout();
    const bool ok_rate = test_frame_rate_tracker();
    const bool ok_clock = test_frame_clock();

    if (!ok_defaults) std::fprintf(stderr, "[scene-tests] camera defaults failed\n");
    if (!ok_depth) std::fprintf(stderr, "[scene-tests] zero-to-one depth range failed\n");
    if (!ok_uniform) std::fprintf(stderr, "[scene-tests] camera uniform / up axis failed\n");
    if (!ok_orbit) std::fprintf(stderr, "[scene-tests] orbit radius not preserved\n");
    if (!ok_forward) std::fprintf(stderr, "[scene-tests] forward step overshoots target\n");
    if (!ok_light) std::fprintf(stderr, "[scene-tests] light rotation failed\n");
    if (!ok_cursor) std::fprintf(stderr, "[scene-tests] light color from cursor failed\n");
    if (!ok_grid) std::fprintf(stderr, "[scene-tests] instance grid layout failed\n");
    if (!ok_rate) std::fprintf(stderr, "[scene-tests] frame rate tracker failed\n");
    if (!ok_clock) std::fprintf(stderr, "[scene-tests] frame clock failed\n");

    if (!(ok_defaults && ok_depth && ok_uniform && ok_orbit && ok_forward && ok_light && ok_cursor && ok_grid && ok_rate && ok_clock)) return 1;
    std::fprintf(stderr, "[scene-tests] all tests passed\n");
    return 0;
}
