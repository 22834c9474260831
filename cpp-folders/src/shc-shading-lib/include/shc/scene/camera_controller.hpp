#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: camera_controller.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: Target-ийг тойрох камер. W/S target руу ойртох/холдох,
            A/D target-ийг тойрон эргэж радиусаа хадгална.
*/


#include <glm/glm.hpp>

#include "shc/platform/platform_input.hpp"
#include "shc/scene/camera.hpp"

namespace shc
{
    struct OrbitControllerConfig
    {
        float speed = 30.0f;
    };

    struct OrbitControlState
    {
        bool forward = false;
        bool backward = false;
        bool left = false;
        bool right = false;
    };

    inline OrbitControlState orbit_state_from_input(const PlatformInputState& in)
    {
        return OrbitControlState{in.forward, in.backward, in.left, in.right};
    }

    class OrbitCameraController
    {
    public:
        OrbitCameraController() = default;
        explicit OrbitCameraController(const OrbitControllerConfig& cfg) : cfg_(cfg) {}

        const OrbitControllerConfig& config() const { return cfg_; }

        void update(Camera& cam, const OrbitControlState& s, float dt) const
        {
            const float step = cfg_.speed * dt;

            glm::vec3 forward = cam.target - cam.eye;
            const float forward_len = glm::length(forward);
            if (forward_len <= 1e-6f) return;
            const glm::vec3 forward_dir = forward / forward_len;

            // Target-ийн дээгүүр гарахгүйн тулд алхам зайнаас бага үед л урагшилна.
            if (s.forward && forward_len > step) cam.eye += forward_dir * step;
            if (s.backward) cam.eye -= forward_dir * step;

            const glm::vec3 right = glm::cross(forward_dir, cam.up);

            forward = cam.target - cam.eye;
            const float radius = glm::length(forward);
            if (s.right)
            {
                cam.eye = cam.target - glm::normalize(forward - right * step) * radius;
            }
            if (s.left)
            {
                cam.eye = cam.target - glm::normalize(forward + right * step) * radius;
            }
        }

        void update(Camera& cam, const PlatformInputState& in, float dt) const
        {
            update(cam, orbit_state_from_input(in), dt);
        }

    private:
        OrbitControllerConfig cfg_{};
    };
}
