#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: platform_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Demo-д шаардлагатай цонх, оролт, resolve хийсэн RGBA8 кадрыг дэлгэцлэх интерфэйс.
*/


#include <cstdint>
#include <string>
#include <vector>

#include "shc/platform/platform_input.hpp"

namespace shc
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
    };

    // Shading хийгдэх software surface. Цонхны хэмжээнд сунгаж харуулна.
    struct SurfaceDesc
    {
        int width = 640;
        int height = 360;
    };

    // Дээд мөрөөс эхэлсэн RGBA8 пикселүүд.
    struct Rgba8Frame
    {
        const uint8_t* pixels = nullptr;
        int width = 0;
        int height = 0;
        int pitch_bytes = 0;

        bool valid() const
        {
            return pixels != nullptr && width > 0 && height > 0 && pitch_bytes >= width * 4;
        }
    };

    inline Rgba8Frame make_rgba8_frame(const std::vector<uint8_t>& rgba, int width, int height)
    {
        Rgba8Frame f{};
        if (rgba.size() < (size_t)width * (size_t)height * 4u) return f;
        f.pixels = rgba.data();
        f.width = width;
        f.height = height;
        f.pitch_bytes = width * 4;
        return f;
    }

    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        // Нэг кадрын event-үүдийг цуглуулна. Quit ирвэл false.
        virtual bool pump_input(PlatformInputState& out) = 0;
        virtual void set_title(const std::string& title) = 0;
        virtual bool present_frame(const Rgba8Frame& frame) = 0;
    };
}
