#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: keyboard_state.hpp
    MODULE: input
    PURPOSE: ShaderToy keyboard texture state, 256x3 R8 indexed by JavaScript key code.
            Row 0 is held, row 1 pressed since the last rendered frame, row 2 toggled.
            Written from the input thread, consumed once per rendered frame.
*/


#include <array>
#include <cstdint>
#include <mutex>

namespace sbg
{
    inline constexpr int kKeyboardTextureWidth = 256;
    inline constexpr int kKeyboardTextureHeight = 3;

    using KeyboardTexels = std::array<uint8_t, kKeyboardTextureWidth * kKeyboardTextureHeight>;

    class KeyboardState
    {
    public:
        void key_down(int js_code)
        {
            if (js_code <= 0 || js_code >= kKeyboardTextureWidth) return;
            std::lock_guard<std::mutex> lock(mtx_);
            uint8_t& held = texels_[(size_t)js_code];
            if (held != 0) return; // auto-repeat
            held = 255;
            texels_[(size_t)(kKeyboardTextureWidth + js_code)] = 255;
            uint8_t& toggled = texels_[(size_t)(2 * kKeyboardTextureWidth + js_code)];
            toggled = toggled != 0 ? 0 : 255;
        }

        void key_up(int js_code)
        {
            if (js_code <= 0 || js_code >= kKeyboardTextureWidth) return;
            std::lock_guard<std::mutex> lock(mtx_);
            texels_[(size_t)js_code] = 0;
        }

        // Focus loss: nothing stays held.
        void release_all()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (int i = 0; i < kKeyboardTextureWidth; ++i) texels_[(size_t)i] = 0;
        }

        KeyboardTexels snapshot() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return texels_;
        }

        // Snapshot for a frame about to render; clears the one-frame pressed row.
        KeyboardTexels take_frame()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            KeyboardTexels out = texels_;
            for (int i = 0; i < kKeyboardTextureWidth; ++i) texels_[(size_t)(kKeyboardTextureWidth + i)] = 0;
            return out;
        }

        // The frame that took `taken` was dropped; its pressed row goes to the next one.
        void restore_frame(const KeyboardTexels& taken)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (int i = 0; i < kKeyboardTextureWidth; ++i)
            {
                const size_t k = (size_t)(kKeyboardTextureWidth + i);
                if (taken[k] != 0) texels_[k] = taken[k];
            }
        }

    private:
        mutable std::mutex mtx_{};
        KeyboardTexels texels_{};
    };
}
