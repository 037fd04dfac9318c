#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: platform_input.hpp
    MODULE: platform
    PURPOSE: Window-level events collected by one pump. Shader-visible keyboard and
            mouse state is fed separately into KeyboardState and MouseState.
*/


namespace sbg
{
    struct PlatformInputState
    {
        bool quit = false;
        bool reload_requested = false;
        bool displays_changed = false;
        bool focus_lost = false;
    };
}
