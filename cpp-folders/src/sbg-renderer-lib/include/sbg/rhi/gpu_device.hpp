#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: gpu_device.hpp
    MODULE: rhi
    PURPOSE: GPU device interface the render graph runs against: fragment programs,
            ping-pong render targets, sampled textures, pass draws and presentation.
            The OpenGL driver implements it; tests use a recording fake.
*/


#include <array>
#include <cstdint>
#include <span>
#include <string>

#include <glm/glm.hpp>

#include "sbg/core/result.hpp"
#include "sbg/geometry/rect.hpp"
#include "sbg/preset/preset.hpp"

namespace sbg
{
    enum class GpuBackendType : uint8_t
    {
        Null = 0,
        OpenGL = 1
    };

    inline const char* gpu_backend_type_name(GpuBackendType type)
    {
        switch (type)
        {
            case GpuBackendType::Null: return "null";
            case GpuBackendType::OpenGL: return "opengl";
        }
        return "unknown";
    }

    struct ProgramHandle
    {
        uint32_t id = 0;
        bool valid() const { return id != 0; }
        bool operator==(const ProgramHandle&) const = default;
    };

    struct TargetHandle
    {
        uint32_t id = 0;
        bool valid() const { return id != 0; }
        bool operator==(const TargetHandle&) const = default;
    };

    struct TextureHandle
    {
        uint32_t id = 0;
        bool valid() const { return id != 0; }
        bool operator==(const TextureHandle&) const = default;
    };

    enum class TextureDimension : uint8_t
    {
        Texture2D = 0,
        Cubemap,
        Volume
    };

    enum class TargetFormat : uint8_t
    {
        RGBA8 = 0,
        RGBA32F
    };

    struct RenderTargetDesc
    {
        TextureDimension dimension = TextureDimension::Texture2D;
        TargetFormat format = TargetFormat::RGBA8;
        // Face size for cubemaps.
        int width = 1;
        int height = 1;
        std::string label{};

        bool operator==(const RenderTargetDesc&) const = default;
    };

    struct TextureDesc
    {
        TextureDimension dimension = TextureDimension::Texture2D;
        int width = 1;
        int height = 1;
        // Faces for cubemaps, slices for volumes.
        int layers = 1;
        // 1 (R8), 3 (RGB8) or 4 (RGBA8).
        int channels = 4;
        bool mipmaps = false;
        std::string label{};
    };

    struct ProgramDesc
    {
        std::string label{};
        std::string fragment_source{};
        // Cube passes get a per-face ray direction varying.
        bool cubemap = false;
    };

    enum class ChannelSource : uint8_t
    {
        None = 0,
        Target,
        Texture
    };

    struct ChannelBinding
    {
        ChannelSource source = ChannelSource::None;
        TargetHandle target{};
        TextureHandle texture{};
        TextureDimension dimension = TextureDimension::Texture2D;
        WrapMode wrap = WrapMode::Clamp;
        FilterMode filter = FilterMode::Linear;
        glm::vec3 resolution{0.0f};
    };

    // Built-in ShaderToy uniforms for one draw.
    struct PassUniforms
    {
        glm::vec3 resolution{0.0f};
        float time = 0.0f;
        float time_delta = 0.0f;
        float frame_rate = 0.0f;
        int frame = 0;
        glm::vec4 mouse{0.0f};
        glm::vec4 date{0.0f};
        std::array<glm::vec3, 4> channel_resolution{};
        // Playback time of each channel. No channel is a media stream, so all zero.
        std::array<float, 4> channel_time{};
        glm::vec2 resolution_offset{0.0f};
        float sample_rate = 44100.0f;
    };

    struct DrawPassRequest
    {
        std::string label{};
        ProgramHandle program{};
        TargetHandle target{};
        std::array<ChannelBinding, 4> channels{};
        PassUniforms uniforms{};
    };

    enum class PresentWrap : uint8_t
    {
        Clamp = 0,
        Repeat,
        MirroredRepeat
    };

    struct FRect
    {
        double x = 0.0;
        double y = 0.0;
        double w = 0.0;
        double h = 0.0;

        bool operator==(const FRect&) const = default;
    };

    struct PresentRequest
    {
        std::string monitor{};
        // Desktop rectangle the drawable surface covers.
        IRect surface{};
        // Monitor rectangle, cleared to black before the image is drawn.
        IRect viewport{};
        // Where the image lands, desktop coordinates.
        IRect dest{};
        // Region of the image sampled, in image pixels with a top-left origin.
        // May exceed the image bounds for the repeat modes.
        FRect source{};
        glm::ivec2 image_size{0};
        TargetHandle newest{};
        // Blended in with weight (1 - blend_weight). Invalid when not cross-fading.
        TargetHandle previous{};
        float blend_weight = 1.0f;
        PresentWrap wrap = PresentWrap::Clamp;
        FilterMode filter = FilterMode::Linear;
    };

    class IGpuDevice
    {
    public:
        virtual ~IGpuDevice() = default;

        virtual GpuBackendType type() const = 0;
        virtual const char* name() const { return gpu_backend_type_name(type()); }

        // Compile errors come back as ErrorKind::Compile with the driver log.
        virtual Result<ProgramHandle> compile_program(const ProgramDesc& desc) = 0;
        virtual void destroy_program(ProgramHandle program) = 0;

        virtual Result<TargetHandle> create_target(const RenderTargetDesc& desc) = 0;
        virtual void destroy_target(TargetHandle target) = 0;
        virtual void clear_target(TargetHandle target) = 0;

        // `pixels` holds desc.layers tightly packed layers, bottom row first.
        virtual Result<TextureHandle> create_texture(const TextureDesc& desc, std::span<const uint8_t> pixels) = 0;
        virtual Status update_texture(TextureHandle texture, std::span<const uint8_t> pixels) = 0;
        virtual void destroy_texture(TextureHandle texture) = 0;

        // Cube targets are drawn once per face.
        virtual Status draw_pass(const DrawPassRequest& request) = 0;

        virtual void begin_present(const IRect& surface) { (void)surface; }
        virtual Status present(const PresentRequest& request) = 0;
        virtual Status end_present() { return Status::success(); }
    };
}
