#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: mouse_state.hpp
    MODULE: input
    PURPOSE: Pointer state in desktop coordinates and its mapping to the ShaderToy
            iMouse uniform of a canvas.
*/


#include <cmath>
#include <mutex>

#include <glm/glm.hpp>

#include "sbg/geometry/rect.hpp"

namespace sbg
{
    struct MouseSnapshot
    {
        // Last position seen while the button was down.
        glm::dvec2 position{0.0};
        glm::dvec2 click{0.0};
        bool down = false;
        // Button went down since the previous rendered frame.
        bool clicked = false;
        bool ever_clicked = false;
    };

    class MouseState
    {
    public:
        void move_to(double x, double y)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            pointer_ = glm::dvec2(x, y);
            if (state_.down) state_.position = pointer_;
        }

        void set_button(bool down)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (down && !state_.down)
            {
                state_.click = pointer_;
                state_.position = pointer_;
                state_.clicked = true;
                state_.ever_clicked = true;
            }
            state_.down = down;
        }

        MouseSnapshot snapshot() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return state_;
        }

        // Snapshot for a frame about to render; the click pulse is consumed.
        MouseSnapshot take_frame()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            MouseSnapshot out = state_;
            state_.clicked = false;
            return out;
        }

        // The frame that took `taken` was dropped; its click pulse goes to the next one.
        void restore_frame(const MouseSnapshot& taken)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (taken.clicked) state_.clicked = true;
        }

    private:
        mutable std::mutex mtx_{};
        glm::dvec2 pointer_{0.0};
        MouseSnapshot state_{};
    };

    // Desktop point to canvas pixels: bottom-left origin, scaled to the canvas size.
    inline glm::vec2 desktop_to_canvas(const glm::dvec2& p, const IRect& bounds, glm::ivec2 canvas_size)
    {
        if (bounds.empty()) return glm::vec2(0.0f);
        const double sx = (double)canvas_size.x / (double)bounds.w;
        const double sy = (double)canvas_size.y / (double)bounds.h;
        const double x = (p.x - (double)bounds.x) * sx;
        const double y = (double)canvas_size.y - (p.y - (double)bounds.y) * sy;
        return glm::vec2((float)std::round(x), (float)std::round(y));
    }

    // xy: position while held (kept after release); zw: click position,
    // z negative once released, w positive only on the click frame.
    inline glm::vec4 shadertoy_mouse(const MouseSnapshot& m, const IRect& bounds, glm::ivec2 canvas_size)
    {
        if (!m.ever_clicked) return glm::vec4(0.0f);
        const glm::vec2 pos = desktop_to_canvas(m.position, bounds, canvas_size);
        const glm::vec2 click = desktop_to_canvas(m.click, bounds, canvas_size);
        const float z = m.down ? click.x : -click.x;
        const float w = (m.down && m.clicked) ? click.y : -click.y;
        return glm::vec4(pos.x, pos.y, z, w);
    }
}
