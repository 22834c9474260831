#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: camera.hpp
    МОДУЛЬ: scene
    ЗОРИЛГО: Look-at + perspective камер (RH). Clip depth нь ZeroToOne үед OpenGL-ийн
            [-1,1] depth-ийг [0,1] руу нэг удаа хөрвүүлнэ.
*/


#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "shc/rhi/pipeline_desc.hpp"
#include "shc/shader/uniforms.hpp"

namespace shc
{
    enum class CameraUpAxis : uint8_t
    {
        X = 0,
        Y = 1,
        Z = 2
    };

    inline glm::vec3 up_axis_vector(CameraUpAxis a)
    {
        switch (a)
        {
            case CameraUpAxis::X: return glm::vec3(1.0f, 0.0f, 0.0f);
            case CameraUpAxis::Z: return glm::vec3(0.0f, 0.0f, 1.0f);
            case CameraUpAxis::Y:
            default: return glm::vec3(0.0f, 1.0f, 0.0f);
        }
    }

    // z' = 0.5 * z + 0.5 * w. [-w, w] clip depth-ийг [0, w] болгоно.
    inline glm::mat4 opengl_to_zero_one_depth()
    {
        glm::mat4 m(1.0f);
        m[2][2] = 0.5f;
        m[3][2] = 0.5f;
        return m;
    }

    struct CameraConfig
    {
        glm::vec3 eye{0.0f, 1.0f, 2.0f};
        glm::vec3 target{0.0f, 0.0f, 0.0f};
        CameraUpAxis up_axis = CameraUpAxis::Y;
        float aspect = 16.0f / 9.0f;
        float fovy_deg = 45.0f;
        float znear = 0.1f;
        float zfar = 100.0f;
        RHIClipDepth clip_depth = RHIClipDepth::ZeroToOne;
    };

    struct Camera
    {
        glm::vec3 eye{0.0f, 1.0f, 2.0f};
        glm::vec3 target{0.0f};
        glm::vec3 up{0.0f, 1.0f, 0.0f};
        float aspect = 16.0f / 9.0f;
        float fovy_deg = 45.0f;
        float znear = 0.1f;
        float zfar = 100.0f;
        RHIClipDepth clip_depth = RHIClipDepth::ZeroToOne;

        Camera() = default;

        explicit Camera(const CameraConfig& c)
            : eye(c.eye)
            , target(c.target)
            , up(up_axis_vector(c.up_axis))
            , aspect(c.aspect)
            , fovy_deg(c.fovy_deg)
            , znear(c.znear)
            , zfar(c.zfar)
            , clip_depth(c.clip_depth)
        {}

        void set_aspect(int width, int height)
        {
            if (width > 0 && height > 0) aspect = (float)width / (float)height;
        }

        void set_up_axis(CameraUpAxis a)
        {
            up = up_axis_vector(a);
        }

        // Eye, target хоёуланг нь шилжүүлнэ.
        void translate(const glm::vec3& delta)
        {
            eye += delta;
            target += delta;
        }

        glm::mat4 view() const
        {
            return glm::lookAtRH(eye, target, up);
        }

        glm::mat4 projection() const
        {
            const glm::mat4 proj = glm::perspectiveRH_NO(glm::radians(fovy_deg), aspect, znear, zfar);
            if (clip_depth == RHIClipDepth::ZeroToOne) return opengl_to_zero_one_depth() * proj;
            return proj;
        }

        glm::mat4 view_projection() const
        {
            return projection() * view();
        }
    };

    inline CameraUniform make_camera_uniform(const Camera& cam)
    {
        CameraUniform u{};
        u.view_position = glm::vec4(cam.eye, 1.0f);
        u.view_proj = cam.view_projection();
        return u;
    }
}
