#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: sdl_gl_runtime.hpp
    MODULE: platform
    PURPOSE: SDL2 window with an OpenGL 4.2 core context stretched over the desktop,
            plus monitor enumeration and keyboard/mouse forwarding.
*/


#include <string>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "sbg/core/log.hpp"
#include "sbg/platform/platform_runtime.hpp"

namespace sbg
{
    // Browser keyCode values, which is what ShaderToy keyboard textures are indexed by.
    inline int sdl_key_to_js_keycode(SDL_Keycode k)
    {
        if (k >= SDLK_a && k <= SDLK_z) return 65 + (int)(k - SDLK_a);
        if (k >= SDLK_0 && k <= SDLK_9) return 48 + (int)(k - SDLK_0);
        if (k >= SDLK_F1 && k <= SDLK_F12) return 112 + (int)(k - SDLK_F1);
        if (k >= SDLK_KP_1 && k <= SDLK_KP_9) return 97 + (int)(k - SDLK_KP_1);
        switch (k)
        {
            case SDLK_BACKSPACE: return 8;
            case SDLK_TAB: return 9;
            case SDLK_RETURN: return 13;
            case SDLK_KP_ENTER: return 13;
            case SDLK_LSHIFT: case SDLK_RSHIFT: return 16;
            case SDLK_LCTRL: case SDLK_RCTRL: return 17;
            case SDLK_LALT: case SDLK_RALT: return 18;
            case SDLK_PAUSE: return 19;
            case SDLK_CAPSLOCK: return 20;
            case SDLK_ESCAPE: return 27;
            case SDLK_SPACE: return 32;
            case SDLK_PAGEUP: return 33;
            case SDLK_PAGEDOWN: return 34;
            case SDLK_END: return 35;
            case SDLK_HOME: return 36;
            case SDLK_LEFT: return 37;
            case SDLK_UP: return 38;
            case SDLK_RIGHT: return 39;
            case SDLK_DOWN: return 40;
            case SDLK_INSERT: return 45;
            case SDLK_DELETE: return 46;
            case SDLK_KP_0: return 96;
            case SDLK_KP_MULTIPLY: return 106;
            case SDLK_KP_PLUS: return 107;
            case SDLK_KP_MINUS: return 109;
            case SDLK_KP_PERIOD: return 110;
            case SDLK_KP_DIVIDE: return 111;
            case SDLK_SEMICOLON: return 186;
            case SDLK_EQUALS: return 187;
            case SDLK_COMMA: return 188;
            case SDLK_MINUS: return 189;
            case SDLK_PERIOD: return 190;
            case SDLK_SLASH: return 191;
            case SDLK_BACKQUOTE: return 192;
            case SDLK_LEFTBRACKET: return 219;
            case SDLK_BACKSLASH: return 220;
            case SDLK_RIGHTBRACKET: return 221;
            case SDLK_QUOTE: return 222;
            default: return 0;
        }
    }

    class SdlGlRuntime final : public IPlatformRuntime
    {
    public:
        explicit SdlGlRuntime(const WindowDesc& win)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                log_error(std::string("SDL_Init failed: ") + SDL_GetError());
                return;
            }
            sdl_ready_ = true;

            const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
            if ((IMG_Init(img_flags) & img_flags) == 0)
            {
                log_error(std::string("IMG_Init failed: ") + IMG_GetError());
                return;
            }

            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 4);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 2);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
            SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
            SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 0);

            IRect bounds = win.bounds;
            if (bounds.empty())
            {
                for (const MonitorInfo& m : monitors()) bounds = rect_union(bounds, m.geometry);
            }
            if (bounds.empty()) bounds = IRect{0, 0, 1280, 720};

            Uint32 flags = SDL_WINDOW_OPENGL | SDL_WINDOW_SHOWN;
            if (win.borderless) flags |= SDL_WINDOW_BORDERLESS;
            window_ = SDL_CreateWindow(win.title.c_str(), bounds.x, bounds.y, bounds.w, bounds.h, flags);
            if (!window_)
            {
                log_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                return;
            }

            context_ = SDL_GL_CreateContext(window_);
            if (!context_)
            {
                log_error(std::string("SDL_GL_CreateContext failed: ") + SDL_GetError());
                return;
            }
            if (SDL_GL_SetSwapInterval(win.vsync ? 1 : 0) != 0)
            {
                log_warn(std::string("swap interval not set: ") + SDL_GetError());
            }
            covered_ = bounds;
            valid_ = true;
        }

        ~SdlGlRuntime() override
        {
            if (context_) SDL_GL_DeleteContext(context_);
            if (window_) SDL_DestroyWindow(window_);
            if (sdl_ready_)
            {
                IMG_Quit();
                SDL_Quit();
            }
        }

        SdlGlRuntime(const SdlGlRuntime&) = delete;
        SdlGlRuntime& operator=(const SdlGlRuntime&) = delete;

        bool valid() const override { return valid_; }

        std::vector<MonitorInfo> monitors() const override
        {
            std::vector<MonitorInfo> out{};
            const int n = SDL_GetNumVideoDisplays();
            for (int i = 0; i < n; ++i)
            {
                SDL_Rect r{};
                if (SDL_GetDisplayBounds(i, &r) != 0) continue;
                MonitorInfo m{};
                const char* name = SDL_GetDisplayName(i);
                m.name = name ? name : ("display-" + std::to_string(i));
                m.geometry = IRect{r.x, r.y, r.w, r.h};
                out.push_back(m);
            }
            return out;
        }

        bool pump_input(PlatformInputState& out, KeyboardState& keyboard, MouseState& mouse) override
        {
            out = PlatformInputState{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) out.quit = true;
                if (e.type == SDL_DISPLAYEVENT) out.displays_changed = true;
                if (e.type == SDL_KEYDOWN && e.key.repeat == 0)
                {
                    if (e.key.keysym.sym == SDLK_F5 && (e.key.keysym.mod & KMOD_CTRL) != 0) out.reload_requested = true;
                    keyboard.key_down(sdl_key_to_js_keycode(e.key.keysym.sym));
                }
                if (e.type == SDL_KEYUP)
                {
                    keyboard.key_up(sdl_key_to_js_keycode(e.key.keysym.sym));
                }
                if (e.type == SDL_MOUSEMOTION)
                {
                    mouse.move_to((double)(covered_.x + e.motion.x), (double)(covered_.y + e.motion.y));
                }
                if (e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_LEFT)
                {
                    mouse.move_to((double)(covered_.x + e.button.x), (double)(covered_.y + e.button.y));
                    mouse.set_button(true);
                }
                if (e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT)
                {
                    mouse.set_button(false);
                }
                if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_FOCUS_LOST)
                {
                    out.focus_lost = true;
                    keyboard.release_all();
                    mouse.set_button(false);
                }
            }
            return !out.quit;
        }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        void cover(const IRect& desktop) override
        {
            if (!window_ || desktop.empty() || desktop == covered_) return;
            SDL_SetWindowPosition(window_, desktop.x, desktop.y);
            SDL_SetWindowSize(window_, desktop.w, desktop.h);
            covered_ = desktop;
        }

        void present() override
        {
            if (window_) SDL_GL_SwapWindow(window_);
        }

        SDL_Window* window() const { return window_; }
        const IRect& covered() const { return covered_; }

    private:
        bool sdl_ready_ = false;
        bool valid_ = false;
        SDL_Window* window_ = nullptr;
        SDL_GLContext context_ = nullptr;
        IRect covered_{};
    };
}
