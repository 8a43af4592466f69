#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: sdl_presenter.hpp
    МОДУЛЬ: platform/sdl
    ЗОРИЛГО: Software рендерийн 8 битийн буферийг SDL2 цонхонд харуулах ба
            demo-гийн тохиргоог сэлгэх товчлуурууд.
*/


#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>

#include "murk/core/result.hpp"
#include "murk/gfx/rt_types.hpp"

namespace murk
{
    // Нэг фрэймд хуримтлагдсан үйлдлүүд.
    struct ViewerInput
    {
        bool quit = false;
        bool toggle_shadows = false;
        bool toggle_fog = false;
        bool toggle_fog_self_shadow = false;
        bool toggle_fog_depth_gating = false;
        bool toggle_light_gizmo = false;
        bool toggle_pause = false;
    };

    class SdlPresenter
    {
    public:
        SdlPresenter(const std::string& title, int width, int height, int scale = 1)
            : width_(width), height_(height)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                error_ = std::string("SDL_Init: ") + SDL_GetError();
                return;
            }
            sdl_initialized_ = true;

            window_ = SDL_CreateWindow(
                title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                width * scale,
                height * scale,
                SDL_WINDOW_SHOWN
            );
            if (!window_)
            {
                error_ = std::string("SDL_CreateWindow: ") + SDL_GetError();
                return;
            }

            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
            if (!renderer_)
            {
                error_ = std::string("SDL_CreateRenderer: ") + SDL_GetError();
                return;
            }

            texture_ = SDL_CreateTexture(
                renderer_,
                SDL_PIXELFORMAT_RGBA32,
                SDL_TEXTUREACCESS_STREAMING,
                width,
                height
            );
            if (!texture_)
            {
                error_ = std::string("SDL_CreateTexture: ") + SDL_GetError();
                return;
            }
        }

        SdlPresenter(const SdlPresenter&) = delete;
        SdlPresenter& operator=(const SdlPresenter&) = delete;

        ~SdlPresenter()
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            if (sdl_initialized_) SDL_Quit();
        }

        bool valid() const { return texture_ != nullptr; }
        const std::string& error() const { return error_; }

        ViewerInput pump_input()
        {
            ViewerInput in{};
            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) in.quit = true;
                if (e.type != SDL_KEYDOWN) continue;
                switch (e.key.keysym.sym)
                {
                    case SDLK_ESCAPE: in.quit = true; break;
                    case SDLK_F1: in.toggle_shadows = true; break;
                    case SDLK_F2: in.toggle_fog = true; break;
                    case SDLK_F3: in.toggle_fog_self_shadow = true; break;
                    case SDLK_F4: in.toggle_fog_depth_gating = true; break;
                    case SDLK_F5: in.toggle_light_gizmo = true; break;
                    case SDLK_SPACE: in.toggle_pause = true; break;
                    default: break;
                }
            }
            return in;
        }

        void set_title(const std::string& title)
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        Status present(const RT_ColorLDR& ldr)
        {
            if (!valid()) return Status::failure("presenter is not initialized");
            if (ldr.w != width_ || ldr.h != height_) return Status::failure("frame size does not match the window surface");

            void* dst = nullptr;
            int dst_pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &dst, &dst_pitch) != 0)
            {
                return Status::failure(std::string("SDL_LockTexture: ") + SDL_GetError());
            }
            auto* d = static_cast<uint8_t*>(dst);
            const size_t row_bytes = (size_t)ldr.w * sizeof(Color);
            for (int y = 0; y < ldr.h; ++y)
            {
                std::memcpy(d + (size_t)y * (size_t)dst_pitch, &ldr.color.at(0, y), row_bytes);
            }
            SDL_UnlockTexture(texture_);

            SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
            return ok_status();
        }

    private:
        int width_ = 0;
        int height_ = 0;
        bool sdl_initialized_ = false;
        std::string error_{};
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
    };
}
