#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: sdl_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL2 цонх, streaming texture болон keyboard/mouse оролт.
*/


#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>

#include "shc/core/log.hpp"
#include "shc/platform/platform_runtime.hpp"

namespace shc
{
    class SdlRuntime final : public IPlatformRuntime
    {
    public:
        SdlRuntime(const WindowDesc& win, const SurfaceDesc& surface)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                log_error(std::string("SDL_Init failed: ") + SDL_GetError());
                return;
            }

            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                win.width,
                win.height,
                SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
            );
            if (!window_)
            {
                log_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                return;
            }

            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
            if (!renderer_)
            {
                log_error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                return;
            }

            texture_ = SDL_CreateTexture(
                renderer_,
                SDL_PIXELFORMAT_RGBA32,
                SDL_TEXTUREACCESS_STREAMING,
                surface.width,
                surface.height
            );
            if (!texture_)
            {
                log_error(std::string("SDL_CreateTexture failed: ") + SDL_GetError());
                return;
            }

            surface_w_ = surface.width;
            surface_h_ = surface.height;
            valid_ = true;
        }

        ~SdlRuntime() override
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            SDL_Quit();
        }

        SdlRuntime(const SdlRuntime&) = delete;
        SdlRuntime& operator=(const SdlRuntime&) = delete;

        bool valid() const override { return valid_; }

        bool pump_input(PlatformInputState& out) override
        {
            out = PlatformInputState{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) out.quit = true;
                if (e.type == SDL_KEYDOWN && e.key.repeat == 0)
                {
                    switch (e.key.keysym.sym)
                    {
                        case SDLK_ESCAPE: out.quit = true; break;
                        case SDLK_f: out.toggle_frame_rate = true; break;
                        case SDLK_SPACE: out.toggle_pipeline = true; break;
                        case SDLK_LEFT: out.up_axis_x = true; break;
                        case SDLK_UP: out.up_axis_y = true; break;
                        case SDLK_RIGHT: out.up_axis_z = true; break;
                        default: break;
                    }
                }
                if (e.type == SDL_MOUSEMOTION)
                {
                    out.mouse_moved = true;
                    out.mouse_x = (float)e.motion.x;
                    out.mouse_y = (float)e.motion.y;
                }
            }

            if (window_) SDL_GetWindowSize(window_, &out.window_w, &out.window_h);

            const uint8_t* ks = SDL_GetKeyboardState(nullptr);
            out.forward = ks[SDL_SCANCODE_W] != 0;
            out.backward = ks[SDL_SCANCODE_S] != 0;
            out.left = ks[SDL_SCANCODE_A] != 0;
            out.right = ks[SDL_SCANCODE_D] != 0;
            return !out.quit;
        }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        // Surface texture-ийн хэмжээтэй таарахгүй кадрыг хүлээж авахгүй.
        bool present_frame(const Rgba8Frame& frame) override
        {
            if (!valid_ || !frame.valid()) return false;
            if (frame.width != surface_w_ || frame.height != surface_h_)
            {
                log_warn(
                    "present_frame: " + std::to_string(frame.width) + "x" + std::to_string(frame.height) +
                    " frame does not match " + std::to_string(surface_w_) + "x" + std::to_string(surface_h_) + " surface"
                );
                return false;
            }

            void* dst = nullptr;
            int dst_pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &dst, &dst_pitch) != 0)
            {
                log_warn(std::string("SDL_LockTexture failed: ") + SDL_GetError());
                return false;
            }
            uint8_t* d = (uint8_t*)dst;
            const size_t row_bytes = (size_t)frame.width * 4u;
            for (int y = 0; y < frame.height; ++y)
            {
                std::memcpy(d + (size_t)y * (size_t)dst_pitch, frame.pixels + (size_t)y * (size_t)frame.pitch_bytes, row_bytes);
            }
            SDL_UnlockTexture(texture_);

            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
            return true;
        }

    private:
        bool valid_ = false;
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
        int surface_w_ = 0;
        int surface_h_ = 0;
    };
}
