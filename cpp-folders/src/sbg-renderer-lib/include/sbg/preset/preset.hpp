#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: preset.hpp
    MODULE: preset
    PURPOSE: Declarative preset model: metadata, per-pass shader text with input wiring,
            and the global rendering/presentation settings.
*/


#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sbg/core/duration.hpp"
#include "sbg/pipeline/pass_id.hpp"

namespace sbg
{
    enum class InputType : uint8_t
    {
        Misc = 0,
        Texture,
        Cubemap,
        Volume,
        Keyboard,
        Video,
        Music,
        MusicStream,
        Webcam,
        Microphone
    };

    enum class WrapMode : uint8_t
    {
        Clamp = 0,
        Repeat
    };

    enum class FilterMode : uint8_t
    {
        Linear = 0,
        Nearest,
        Mipmap
    };

    // Which frame of a buffer an input reads. Auto follows the ShaderToy convention.
    enum class FrameSelect : uint8_t
    {
        Auto = 0,
        Previous,
        Current
    };

    enum class LayoutMode : uint8_t
    {
        Stretch = 0,
        Center,
        Repeat,
        MirroredRepeat
    };

    enum class ScreenBoundsPolicy : uint8_t
    {
        AllMonitors = 0,
        SelectionMonitors,
        Cloned
    };

    inline const char* input_type_name(InputType t)
    {
        switch (t)
        {
            case InputType::Misc: return "misc";
            case InputType::Texture: return "texture";
            case InputType::Cubemap: return "cubemap";
            case InputType::Volume: return "volume";
            case InputType::Keyboard: return "keyboard";
            case InputType::Video: return "video";
            case InputType::Music: return "music";
            case InputType::MusicStream: return "music_stream";
            case InputType::Webcam: return "webcam";
            case InputType::Microphone: return "microphone";
        }
        return "unknown";
    }

    inline std::optional<InputType> parse_input_type(std::string_view s)
    {
        if (s == "misc") return InputType::Misc;
        if (s == "texture") return InputType::Texture;
        if (s == "cubemap") return InputType::Cubemap;
        if (s == "volume") return InputType::Volume;
        if (s == "keyboard") return InputType::Keyboard;
        if (s == "video") return InputType::Video;
        if (s == "music") return InputType::Music;
        if (s == "music_stream") return InputType::MusicStream;
        if (s == "webcam") return InputType::Webcam;
        if (s == "microphone") return InputType::Microphone;
        return std::nullopt;
    }

    // Inputs recognized in presets that never produce GPU work.
    inline bool input_type_is_unsupported_media(InputType t)
    {
        return t == InputType::Video || t == InputType::Music || t == InputType::MusicStream
            || t == InputType::Webcam || t == InputType::Microphone;
    }

    inline const char* wrap_mode_name(WrapMode m)
    {
        return m == WrapMode::Repeat ? "repeat" : "clamp";
    }

    inline std::optional<WrapMode> parse_wrap_mode(std::string_view s)
    {
        if (s == "clamp") return WrapMode::Clamp;
        if (s == "repeat") return WrapMode::Repeat;
        return std::nullopt;
    }

    inline const char* filter_mode_name(FilterMode m)
    {
        switch (m)
        {
            case FilterMode::Linear: return "linear";
            case FilterMode::Nearest: return "nearest";
            case FilterMode::Mipmap: return "mipmap";
        }
        return "unknown";
    }

    inline std::optional<FilterMode> parse_filter_mode(std::string_view s)
    {
        if (s == "linear") return FilterMode::Linear;
        if (s == "nearest") return FilterMode::Nearest;
        if (s == "mipmap") return FilterMode::Mipmap;
        return std::nullopt;
    }

    inline const char* frame_select_name(FrameSelect f)
    {
        switch (f)
        {
            case FrameSelect::Auto: return "auto";
            case FrameSelect::Previous: return "previous";
            case FrameSelect::Current: return "current";
        }
        return "unknown";
    }

    inline std::optional<FrameSelect> parse_frame_select(std::string_view s)
    {
        if (s == "auto") return FrameSelect::Auto;
        if (s == "previous") return FrameSelect::Previous;
        if (s == "current") return FrameSelect::Current;
        return std::nullopt;
    }

    inline const char* layout_mode_name(LayoutMode m)
    {
        switch (m)
        {
            case LayoutMode::Stretch: return "stretch";
            case LayoutMode::Center: return "center";
            case LayoutMode::Repeat: return "repeat";
            case LayoutMode::MirroredRepeat: return "mirrored_repeat";
        }
        return "unknown";
    }

    inline std::optional<LayoutMode> parse_layout_mode(std::string_view s)
    {
        if (s == "stretch") return LayoutMode::Stretch;
        if (s == "center") return LayoutMode::Center;
        if (s == "repeat") return LayoutMode::Repeat;
        if (s == "mirrored_repeat") return LayoutMode::MirroredRepeat;
        return std::nullopt;
    }

    inline const char* screen_bounds_policy_name(ScreenBoundsPolicy p)
    {
        switch (p)
        {
            case ScreenBoundsPolicy::AllMonitors: return "all_monitors";
            case ScreenBoundsPolicy::SelectionMonitors: return "selected_monitors";
            case ScreenBoundsPolicy::Cloned: return "cloned";
        }
        return "unknown";
    }

    inline std::optional<ScreenBoundsPolicy> parse_screen_bounds_policy(std::string_view s)
    {
        if (s == "all_monitors") return ScreenBoundsPolicy::AllMonitors;
        if (s == "selected_monitors" || s == "selection_monitors") return ScreenBoundsPolicy::SelectionMonitors;
        if (s == "cloned") return ScreenBoundsPolicy::Cloned;
        return std::nullopt;
    }

    struct InputSpec
    {
        InputType type = InputType::Misc;
        std::string name{};
        WrapMode wrap = WrapMode::Clamp;
        FilterMode filter = FilterMode::Linear;
        bool vflip = false;
        FrameSelect frame = FrameSelect::Auto;

        bool operator==(const InputSpec&) const = default;
    };

    inline constexpr int kMaxInputSlots = 4;

    struct PassSpec
    {
        std::string shader{};
        std::array<std::optional<InputSpec>, kMaxInputSlots> inputs{};

        bool has_shader() const
        {
            return shader.find_first_not_of(" \t\r\n") != std::string::npos;
        }

        bool operator==(const PassSpec&) const = default;
    };

    struct Preset
    {
        std::string id{};
        std::string name{};
        std::string author{};
        std::string description{};

        // Indexed by pass_index(PassId).
        std::array<PassSpec, kPassCount> passes{};

        double resolution_scale = 1.0;
        FilterMode filter_mode = FilterMode::Linear;
        LayoutMode layout_mode = LayoutMode::Stretch;
        Duration interval_between_frames{0};
        double crossfade_overlap_ratio = 0.0;
        double time_scale = 1.0;
        Duration time_offset{0};
        ScreenBoundsPolicy screen_bounds_policy = ScreenBoundsPolicy::AllMonitors;
        std::vector<std::string> monitor_selection{"*"};

        PassSpec& pass(PassId id) { return passes[pass_index(id)]; }
        const PassSpec& pass(PassId id) const { return passes[pass_index(id)]; }

        bool operator==(const Preset&) const = default;
    };

    inline const char* default_image_shader()
    {
        return "void mainImage(out vec4 fragColor, in vec2 fragCoord)\n"
               "{\n"
               "    vec2 uv = fragCoord / iResolution.xy;\n"
               "    vec3 col = .5 + .5 * cos(iTime + uv.xyx + vec3(0, 2, 4));\n"
               "    fragColor = vec4(col, 1);\n"
               "}";
    }
}
