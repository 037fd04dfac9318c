#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: rect.hpp
    MODULE: geometry
    PURPOSE: Integer pixel rectangles in desktop coordinates (top-left origin, y down).
*/


#include <algorithm>

#include <glm/glm.hpp>

namespace sbg
{
    struct IRect
    {
        int x = 0;
        int y = 0;
        int w = 0;
        int h = 0;

        int left() const { return x; }
        int top() const { return y; }
        int right() const { return x + w; }
        int bottom() const { return y + h; }
        bool empty() const { return w <= 0 || h <= 0; }
        long long area() const { return empty() ? 0 : (long long)w * (long long)h; }
        glm::ivec2 origin() const { return glm::ivec2(x, y); }
        glm::ivec2 size() const { return glm::ivec2(w, h); }

        bool operator==(const IRect&) const = default;
    };

    inline IRect rect_union(const IRect& a, const IRect& b)
    {
        if (a.empty()) return b;
        if (b.empty()) return a;
        const int l = std::min(a.left(), b.left());
        const int t = std::min(a.top(), b.top());
        const int r = std::max(a.right(), b.right());
        const int btm = std::max(a.bottom(), b.bottom());
        return IRect{l, t, r - l, btm - t};
    }

    inline IRect rect_intersection(const IRect& a, const IRect& b)
    {
        const int l = std::max(a.left(), b.left());
        const int t = std::max(a.top(), b.top());
        const int r = std::min(a.right(), b.right());
        const int btm = std::min(a.bottom(), b.bottom());
        if (r <= l || btm <= t) return IRect{};
        return IRect{l, t, r - l, btm - t};
    }

    inline IRect rect_translate(const IRect& r, int dx, int dy)
    {
        return IRect{r.x + dx, r.y + dy, r.w, r.h};
    }

    // Offset of `inner` inside `outer` expressed with a bottom-left origin,
    // which is what gl_FragCoord and glViewport expect.
    inline glm::ivec2 gl_offset_in(const IRect& outer, const IRect& inner)
    {
        return glm::ivec2(inner.x - outer.x, outer.h - (inner.y - outer.y + inner.h));
    }

    inline int scaled_extent(int extent, double scale)
    {
        const double v = (double)extent * scale;
        const int r = (int)(v + 0.5);
        return std::max(1, r);
    }
}
