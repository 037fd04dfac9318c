#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: time_source.hpp
    MODULE: frame
    PURPOSE: Simulation clock of the loaded graph. Wall time is accumulated every tick
            but only converted into scaled simulation time when a frame renders.
*/


#include <chrono>
#include <cstdint>
#include <ctime>
#include <deque>

#include <glm/glm.hpp>

#include "sbg/core/duration.hpp"

namespace sbg
{
    struct TimeState
    {
        double time = 0.0;
        double time_delta = 0.0;
        double frame_rate = 0.0;
        uint64_t frame = 0;
    };

    class TimeSource
    {
    public:
        static constexpr double kFrameRateWindow = 1.0;

        void configure(double time_scale, Duration time_offset)
        {
            time_scale_ = time_scale < 0.0 ? 0.0 : time_scale;
            time_offset_ = duration_seconds(time_offset);
        }

        // Graph (re)build: time and frame counter start over.
        void reset()
        {
            accumulated_ = 0.0;
            pending_wall_ = 0.0;
            wall_clock_ = 0.0;
            frames_rendered_ = 0;
            render_times_.clear();
            state_ = TimeState{};
            state_.time = time_offset_;
            begun_wall_ = 0.0;
            begun_accumulated_ = 0.0;
            begun_state_ = state_;
        }

        void advance_wall(double wall_delta)
        {
            if (wall_delta < 0.0) wall_delta = 0.0;
            pending_wall_ += wall_delta;
            wall_clock_ += wall_delta;
        }

        // Called when the scheduler decides to render. Consumes the wall time
        // accumulated since the previous render.
        const TimeState& begin_frame()
        {
            begun_wall_ = pending_wall_;
            begun_accumulated_ = accumulated_;
            begun_state_ = state_;
            const double scaled = pending_wall_ * time_scale_;
            pending_wall_ = 0.0;
            accumulated_ += scaled;

            state_.time = accumulated_ + time_offset_;
            state_.time_delta = scaled;
            state_.frame = frames_rendered_;
            state_.frame_rate = smoothed_frame_rate();
            return state_;
        }

        // The frame that begin_frame() prepared was drawn and committed.
        void end_frame()
        {
            ++frames_rendered_;
            render_times_.push_back(wall_clock_);
            while (!render_times_.empty() && wall_clock_ - render_times_.front() > kFrameRateWindow)
            {
                render_times_.pop_front();
            }
        }

        // The frame that begin_frame() prepared was dropped. Its wall time is handed
        // back so the next rendered frame covers it.
        void abort_frame()
        {
            pending_wall_ += begun_wall_;
            begun_wall_ = 0.0;
            accumulated_ = begun_accumulated_;
            state_ = begun_state_;
        }

        const TimeState& state() const { return state_; }
        uint64_t frames_rendered() const { return frames_rendered_; }
        double time_scale() const { return time_scale_; }
        double time_offset() const { return time_offset_; }

    private:
        double smoothed_frame_rate() const
        {
            if (render_times_.size() < 2) return 0.0;
            const double span = render_times_.back() - render_times_.front();
            if (span <= 0.0) return 0.0;
            return (double)(render_times_.size() - 1) / span;
        }

        double time_scale_ = 1.0;
        double time_offset_ = 0.0;
        double accumulated_ = 0.0;
        double pending_wall_ = 0.0;
        double wall_clock_ = 0.0;
        uint64_t frames_rendered_ = 0;
        std::deque<double> render_times_{};
        TimeState state_{};
        double begun_wall_ = 0.0;
        double begun_accumulated_ = 0.0;
        TimeState begun_state_{};
    };

    // iDate: year, month (0-based), day of month, seconds since local midnight.
    inline glm::vec4 shadertoy_date(std::chrono::system_clock::time_point now)
    {
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&t, &local);
        const auto since_second = now - std::chrono::system_clock::from_time_t(t);
        const double frac = std::chrono::duration<double>(since_second).count();
        const double seconds = (double)(local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec) + frac;
        return glm::vec4((float)(local.tm_year + 1900), (float)local.tm_mon, (float)local.tm_mday, (float)seconds);
    }
}
