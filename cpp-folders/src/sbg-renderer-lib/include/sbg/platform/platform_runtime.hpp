#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: platform_runtime.hpp
    MODULE: platform
    PURPOSE: Window, GL context and input source the wallpaper renders into.
*/


#include <string>
#include <vector>

#include "sbg/input/keyboard_state.hpp"
#include "sbg/input/mouse_state.hpp"
#include "sbg/layout/layout_resolver.hpp"
#include "sbg/platform/platform_input.hpp"

namespace sbg
{
    struct WindowDesc
    {
        std::string title{};
        // Desktop rectangle to cover. Empty means the union of all monitors.
        IRect bounds{};
        bool borderless = true;
        bool vsync = true;
    };

    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        virtual std::vector<MonitorInfo> monitors() const = 0;
        // Mouse positions are reported in desktop coordinates.
        virtual bool pump_input(PlatformInputState& out, KeyboardState& keyboard, MouseState& mouse) = 0;
        virtual void set_title(const std::string& title) = 0;
        virtual void cover(const IRect& desktop) = 0;
        virtual void present() = 0;
    };
}
