#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: frame_scheduler.hpp
    MODULE: frame
    PURPOSE: Decides per tick whether a new frame renders or the last one is held,
            and computes the cross-fade weight between the two newest frames.
*/


#include <algorithm>
#include <cstdint>

#include "sbg/core/duration.hpp"

namespace sbg
{
    enum class SchedulerState : uint8_t
    {
        Idle = 0,
        Rendering,
        Holding
    };

    inline const char* scheduler_state_name(SchedulerState s)
    {
        switch (s)
        {
            case SchedulerState::Idle: return "idle";
            case SchedulerState::Rendering: return "rendering";
            case SchedulerState::Holding: return "holding";
        }
        return "unknown";
    }

    struct ScheduleDecision
    {
        SchedulerState state = SchedulerState::Idle;
        bool render = false;
        // Weight of the newest frame against the one before it.
        float blend_weight = 1.0f;
    };

    // Rises linearly from 0 to 1 over the last `ratio * interval` seconds of the interval.
    inline float crossfade_weight(double elapsed, double interval, double ratio)
    {
        const double window = interval * ratio;
        if (interval <= 0.0 || window <= 0.0) return 1.0f;
        const double start = interval - window;
        const double w = (elapsed - start) / window;
        return (float)std::clamp(w, 0.0, 1.0);
    }

    class FrameScheduler
    {
    public:
        void configure(Duration interval, double crossfade_ratio)
        {
            interval_ = duration_seconds(interval);
            ratio_ = std::clamp(crossfade_ratio, 0.0, 1.0);
        }

        void reset()
        {
            state_ = SchedulerState::Idle;
            elapsed_ = 0.0;
        }

        ScheduleDecision tick(double wall_delta)
        {
            if (wall_delta < 0.0) wall_delta = 0.0;
            ScheduleDecision d{};

            if (interval_ <= 0.0)
            {
                state_ = SchedulerState::Rendering;
                d.state = state_;
                d.render = true;
                d.blend_weight = 1.0f;
                return d;
            }

            if (state_ == SchedulerState::Idle)
            {
                elapsed_ = 0.0;
                state_ = SchedulerState::Rendering;
            }
            else
            {
                elapsed_ += wall_delta;
                if (elapsed_ >= interval_)
                {
                    elapsed_ -= interval_;
                    // Stalled longer than a whole interval: restart the phase.
                    if (elapsed_ >= interval_) elapsed_ = 0.0;
                    state_ = SchedulerState::Rendering;
                }
                else
                {
                    state_ = SchedulerState::Holding;
                }
            }

            d.state = state_;
            d.render = state_ == SchedulerState::Rendering;
            d.blend_weight = blend_weight();
            return d;
        }

        float blend_weight() const
        {
            return crossfade_weight(elapsed_, interval_, ratio_);
        }

        bool crossfading() const { return interval_ > 0.0 && ratio_ > 0.0; }
        SchedulerState state() const { return state_; }
        double elapsed_in_interval() const { return elapsed_; }
        double interval() const { return interval_; }
        double crossfade_ratio() const { return ratio_; }

    private:
        SchedulerState state_ = SchedulerState::Idle;
        double interval_ = 0.0;
        double ratio_ = 0.0;
        double elapsed_ = 0.0;
    };
}
