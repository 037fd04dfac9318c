#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: layout_resolver.hpp
    MODULE: layout
    PURPOSE: Maps monitors to rendered canvases. Decides how many canvases exist, their
            desktop bounds and pixel size, and for each monitor which canvas region
            lands where.
*/


#include <algorithm>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "sbg/geometry/rect.hpp"
#include "sbg/preset/preset.hpp"
#include "sbg/rhi/gpu_device.hpp"

namespace sbg
{
    struct MonitorInfo
    {
        // Connector name, e.g. "DP-1".
        std::string name{};
        IRect geometry{};

        bool operator==(const MonitorInfo&) const = default;
    };

    struct LayoutSettings
    {
        ScreenBoundsPolicy policy = ScreenBoundsPolicy::AllMonitors;
        std::vector<std::string> selection{"*"};
        LayoutMode mode = LayoutMode::Stretch;
        double resolution_scale = 1.0;

        bool operator==(const LayoutSettings&) const = default;
    };

    inline LayoutSettings layout_settings_from(const Preset& p)
    {
        LayoutSettings s{};
        s.policy = p.screen_bounds_policy;
        s.selection = p.monitor_selection;
        s.mode = p.layout_mode;
        s.resolution_scale = p.resolution_scale;
        return s;
    }

    struct CanvasLayout
    {
        // Desktop rectangle the canvas represents.
        IRect bounds{};
        // Rendered pixel size, bounds scaled by resolution_scale.
        glm::ivec2 size{1};
        // Canvas origin inside the whole desktop, bottom-left origin, in canvas pixels.
        // Uploaded as iResolutionOffset.
        glm::ivec2 gl_offset{0};

        bool operator==(const CanvasLayout& o) const
        {
            return bounds == o.bounds && size == o.size && gl_offset == o.gl_offset;
        }
    };

    struct MonitorLayout
    {
        std::string monitor{};
        IRect geometry{};
        size_t canvas = 0;
        // Canvas region sampled, canvas pixels with a top-left origin.
        FRect source{};
        // Desktop rectangle the region is drawn into; inside `geometry`.
        IRect dest{};
        PresentWrap wrap = PresentWrap::Clamp;

        bool operator==(const MonitorLayout& o) const
        {
            return monitor == o.monitor && geometry == o.geometry && canvas == o.canvas && source == o.source
                && dest == o.dest && wrap == o.wrap;
        }
    };

    struct LayoutPlan
    {
        std::vector<CanvasLayout> canvases{};
        std::vector<MonitorLayout> monitors{};

        bool operator==(const LayoutPlan&) const = default;
    };

    inline bool monitor_selected(const MonitorInfo& m, const std::vector<std::string>& selection)
    {
        for (const std::string& s : selection)
        {
            if (s == "*" || s == m.name) return true;
        }
        return false;
    }

    inline std::vector<MonitorInfo> select_monitors(const std::vector<MonitorInfo>& monitors, const std::vector<std::string>& selection)
    {
        std::vector<MonitorInfo> out{};
        for (const MonitorInfo& m : monitors)
        {
            if (monitor_selected(m, selection)) out.push_back(m);
        }
        return out;
    }

    inline IRect monitors_union(const std::vector<MonitorInfo>& monitors)
    {
        IRect u{};
        for (const MonitorInfo& m : monitors) u = rect_union(u, m.geometry);
        return u;
    }

    namespace detail
    {
        inline CanvasLayout make_canvas(const IRect& bounds, const IRect& desktop, double resolution_scale)
        {
            CanvasLayout c{};
            c.bounds = bounds;
            c.size = glm::ivec2(scaled_extent(bounds.w, resolution_scale),
                                scaled_extent(bounds.h, resolution_scale));
            const glm::ivec2 off = gl_offset_in(desktop, bounds);
            c.gl_offset = glm::ivec2((int)((double)off.x * resolution_scale + 0.5),
                                     (int)((double)off.y * resolution_scale + 0.5));
            return c;
        }

        inline MonitorLayout map_monitor(const MonitorInfo& m, size_t canvas_index, const CanvasLayout& canvas, LayoutMode mode)
        {
            MonitorLayout ml{};
            ml.monitor = m.name;
            ml.geometry = m.geometry;
            ml.canvas = canvas_index;
            const IRect& b = canvas.bounds;

            switch (mode)
            {
                case LayoutMode::Stretch:
                {
                    // The monitor's own slice of the canvas, in canvas pixels.
                    const double sx = (double)canvas.size.x / (double)b.w;
                    const double sy = (double)canvas.size.y / (double)b.h;
                    ml.source = FRect{
                        (double)(m.geometry.x - b.x) * sx,
                        (double)(m.geometry.y - b.y) * sy,
                        (double)m.geometry.w * sx,
                        (double)m.geometry.h * sy};
                    ml.dest = m.geometry;
                    ml.wrap = PresentWrap::Clamp;
                    break;
                }
                case LayoutMode::Center:
                {
                    // One canvas pixel per desktop pixel, centered on the canvas bounds.
                    const IRect placed{
                        b.x + (b.w - canvas.size.x) / 2,
                        b.y + (b.h - canvas.size.y) / 2,
                        canvas.size.x,
                        canvas.size.y};
                    const IRect visible = rect_intersection(placed, m.geometry);
                    ml.dest = visible;
                    ml.source = FRect{
                        (double)(visible.x - placed.x),
                        (double)(visible.y - placed.y),
                        (double)visible.w,
                        (double)visible.h};
                    ml.wrap = PresentWrap::Clamp;
                    break;
                }
                case LayoutMode::Repeat:
                case LayoutMode::MirroredRepeat:
                {
                    // Tiles of canvas size laid from the bounds origin.
                    ml.dest = m.geometry;
                    ml.source = FRect{
                        (double)(m.geometry.x - b.x),
                        (double)(m.geometry.y - b.y),
                        (double)m.geometry.w,
                        (double)m.geometry.h};
                    ml.wrap = mode == LayoutMode::Repeat ? PresentWrap::Repeat : PresentWrap::MirroredRepeat;
                    break;
                }
            }
            return ml;
        }
    }

    // Monitors outside the selection get nothing. With no usable monitor the plan is empty.
    inline LayoutPlan resolve_layout(const std::vector<MonitorInfo>& monitors, const LayoutSettings& settings)
    {
        LayoutPlan plan{};
        const std::vector<MonitorInfo> selected = select_monitors(monitors, settings.selection);
        if (selected.empty()) return plan;
        const IRect desktop = monitors_union(monitors);

        if (settings.policy == ScreenBoundsPolicy::Cloned)
        {
            for (const MonitorInfo& m : selected)
            {
                if (m.geometry.empty()) continue;
                const CanvasLayout c = detail::make_canvas(m.geometry, desktop, settings.resolution_scale);
                plan.canvases.push_back(c);
                plan.monitors.push_back(detail::map_monitor(m, plan.canvases.size() - 1, c, settings.mode));
            }
            return plan;
        }

        const IRect bounds = settings.policy == ScreenBoundsPolicy::AllMonitors ? desktop : monitors_union(selected);
        if (bounds.empty()) return plan;

        const CanvasLayout c = detail::make_canvas(bounds, desktop, settings.resolution_scale);
        plan.canvases.push_back(c);
        for (const MonitorInfo& m : selected)
        {
            if (m.geometry.empty()) continue;
            plan.monitors.push_back(detail::map_monitor(m, 0, c, settings.mode));
        }
        return plan;
    }

    class LayoutResolver
    {
    public:
        // Returns true when the plan changed.
        bool update(const std::vector<MonitorInfo>& monitors, const LayoutSettings& settings)
        {
            if (computed_ && monitors == monitors_ && settings == settings_) return false;
            monitors_ = monitors;
            settings_ = settings;
            computed_ = true;
            LayoutPlan next = resolve_layout(monitors_, settings_);
            if (next == plan_) return false;
            plan_ = std::move(next);
            return true;
        }

        const LayoutPlan& plan() const { return plan_; }
        const std::vector<MonitorInfo>& monitors() const { return monitors_; }
        const LayoutSettings& settings() const { return settings_; }

    private:
        std::vector<MonitorInfo> monitors_{};
        LayoutSettings settings_{};
        LayoutPlan plan_{};
        bool computed_ = false;
    };
}
