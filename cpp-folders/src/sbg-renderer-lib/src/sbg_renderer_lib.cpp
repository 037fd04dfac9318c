/*
    SBG SHADER BACKGROUND SAN

    FILE: sbg_renderer_lib.cpp
    MODULE: sbg-renderer-lib
    PURPOSE: Compiled library target anchor translation unit.
*/

#include "sbg/runtime/preset_watcher.hpp"
#include "sbg/runtime/wallpaper_runtime.hpp"

namespace sbg
{
    int sbg_renderer_compiled_target_anchor()
    {
        return 0;
    }
}
