#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: overlay.hpp
    MODULE: runtime
    PURPOSE: Name/author caption shown after a preset loads, then faded out.
*/


#include <optional>
#include <string>

namespace sbg
{
    struct OverlayInfo
    {
        std::string name{};
        std::string author{};
        // 1 while fully visible, falls to 0 during the fade.
        float opacity = 1.0f;
    };

    class OverlayTimer
    {
    public:
        static constexpr double kVisibleSeconds = 10.0;
        static constexpr double kFadeSeconds = 2.0;

        void arm(std::string name, std::string author)
        {
            name_ = std::move(name);
            author_ = std::move(author);
            age_ = 0.0;
            armed_ = !name_.empty() || !author_.empty();
        }

        void disarm() { armed_ = false; }

        void advance(double wall_delta)
        {
            if (armed_ && wall_delta > 0.0) age_ += wall_delta;
        }

        std::optional<OverlayInfo> current() const
        {
            if (!armed_) return std::nullopt;
            if (age_ >= kVisibleSeconds + kFadeSeconds) return std::nullopt;
            OverlayInfo info{name_, author_, 1.0f};
            if (age_ > kVisibleSeconds) info.opacity = (float)(1.0 - (age_ - kVisibleSeconds) / kFadeSeconds);
            return info;
        }

    private:
        std::string name_{};
        std::string author_{};
        double age_ = 0.0;
        bool armed_ = false;
    };
}
