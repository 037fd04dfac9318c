#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: pass_id.hpp
    MODULE: pipeline
    PURPOSE: Canonical typed identifiers for the ShaderToy pass set and the fixed
            order they execute in.
*/


#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sbg
{
    // Enumerator value is the position in the fixed execution order.
    enum class PassId : uint8_t
    {
        Common = 0,
        BufferA = 1,
        BufferB = 2,
        BufferC = 3,
        BufferD = 4,
        CubeA = 5,
        Image = 6
    };

    inline constexpr size_t kPassCount = 7;

    inline constexpr std::array<PassId, kPassCount> kPassOrder = {
        PassId::Common,
        PassId::BufferA,
        PassId::BufferB,
        PassId::BufferC,
        PassId::BufferD,
        PassId::CubeA,
        PassId::Image,
    };

    inline constexpr size_t pass_index(PassId id)
    {
        return (size_t)id;
    }

    // Passes that keep a ping-pong slot readable by other passes.
    inline constexpr bool pass_is_buffer(PassId id)
    {
        return id != PassId::Common && id != PassId::Image;
    }

    inline constexpr bool pass_renders(PassId id)
    {
        return id != PassId::Common;
    }

    // TOML table key.
    inline const char* pass_id_name(PassId id)
    {
        switch (id)
        {
            case PassId::Common: return "common";
            case PassId::BufferA: return "buffer_a";
            case PassId::BufferB: return "buffer_b";
            case PassId::BufferC: return "buffer_c";
            case PassId::BufferD: return "buffer_d";
            case PassId::CubeA: return "cube_a";
            case PassId::Image: return "image";
        }
        return "unknown";
    }

    // Name shaders and inputs use to refer to a pass output.
    inline const char* pass_display_name(PassId id)
    {
        switch (id)
        {
            case PassId::Common: return "Common";
            case PassId::BufferA: return "Buffer A";
            case PassId::BufferB: return "Buffer B";
            case PassId::BufferC: return "Buffer C";
            case PassId::BufferD: return "Buffer D";
            case PassId::CubeA: return "Cubemap A";
            case PassId::Image: return "Image";
        }
        return "Unknown";
    }

    inline std::optional<PassId> parse_pass_id(std::string_view id)
    {
        for (PassId p : kPassOrder)
        {
            if (id == pass_id_name(p)) return p;
        }
        return std::nullopt;
    }

    // Resolves a misc input name to the buffer pass it reads.
    inline std::optional<PassId> parse_buffer_reference(std::string_view name)
    {
        if (name == "Buffer A" || name == "buffer_a") return PassId::BufferA;
        if (name == "Buffer B" || name == "buffer_b") return PassId::BufferB;
        if (name == "Buffer C" || name == "buffer_c") return PassId::BufferC;
        if (name == "Buffer D" || name == "buffer_d") return PassId::BufferD;
        if (name == "Cubemap A" || name == "Cube A" || name == "cube_a") return PassId::CubeA;
        return std::nullopt;
    }
}
