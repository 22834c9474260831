#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: light.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: Нэг point light, түүнийг +Y тэнхлэгийг тойрон эргүүлэх animator.
*/


#include <algorithm>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "shc/shader/uniforms.hpp"

namespace shc
{
    struct PointLight
    {
        glm::vec3 position{2.0f, 2.0f, 2.0f};
        glm::vec3 color{1.0f, 1.0f, 1.0f};
    };

    struct LightAnimatorConfig
    {
        float degrees_per_second = 30.0f;
        glm::vec3 axis{0.0f, 1.0f, 0.0f};
    };

    class LightAnimator
    {
    public:
        LightAnimator() = default;
        explicit LightAnimator(const LightAnimatorConfig& cfg) : cfg_(cfg) {}

        void update(PointLight& light, float dt) const
        {
            const glm::quat q = glm::angleAxis(glm::radians(cfg_.degrees_per_second * dt), glm::normalize(cfg_.axis));
            light.position = q * light.position;
        }

    private:
        LightAnimatorConfig cfg_{};
    };

    // Cursor-ийн цонх доторх байрлалаас (x/w, y/h, 0.5) өнгө.
    inline glm::vec3 light_color_from_cursor(float x, float y, int window_w, int window_h)
    {
        if (window_w <= 0 || window_h <= 0) return glm::vec3(1.0f);
        const float r = std::clamp(x / (float)window_w, 0.0f, 1.0f);
        const float g = std::clamp(y / (float)window_h, 0.0f, 1.0f);
        return glm::vec3(r, g, 0.5f);
    }

    inline LightUniform make_light_uniform(const PointLight& light)
    {
        return make_light_uniform(light.position, light.color);
    }
}
