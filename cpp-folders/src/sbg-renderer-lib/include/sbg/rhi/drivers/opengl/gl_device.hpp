#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: gl_device.hpp
    MODULE: rhi
    PURPOSE: OpenGL 4.2 core implementation of IGpuDevice. Requires a current context
            on the calling thread for its whole lifetime.
*/


#include <cstdint>
#include <string>
#include <unordered_map>

#include "sbg/rhi/gpu_device.hpp"

namespace sbg
{
    // Parses "<string>:<line>(" (Mesa) and "<string>(<line>)" (NVIDIA) locations.
    // Returns the line of the first message, 0 when none is found.
    int parse_glsl_log_line(const std::string& log);

    class OpenGLGpuDevice final : public IGpuDevice
    {
    public:
        OpenGLGpuDevice();
        ~OpenGLGpuDevice() override;

        OpenGLGpuDevice(const OpenGLGpuDevice&) = delete;
        OpenGLGpuDevice& operator=(const OpenGLGpuDevice&) = delete;

        bool valid() const { return valid_; }
        const std::string& init_error() const { return init_error_; }

        GpuBackendType type() const override { return GpuBackendType::OpenGL; }

        Result<ProgramHandle> compile_program(const ProgramDesc& desc) override;
        void destroy_program(ProgramHandle program) override;

        Result<TargetHandle> create_target(const RenderTargetDesc& desc) override;
        void destroy_target(TargetHandle target) override;
        void clear_target(TargetHandle target) override;

        Result<TextureHandle> create_texture(const TextureDesc& desc, std::span<const uint8_t> pixels) override;
        Status update_texture(TextureHandle texture, std::span<const uint8_t> pixels) override;
        void destroy_texture(TextureHandle texture) override;

        Status draw_pass(const DrawPassRequest& request) override;

        void begin_present(const IRect& surface) override;
        Status present(const PresentRequest& request) override;
        Status end_present() override;

    private:
        struct GlProgram
        {
            uint32_t program = 0;
            bool cubemap = false;
            int loc_resolution = -1;
            int loc_time = -1;
            int loc_global_time = -1;
            int loc_time_delta = -1;
            int loc_frame_rate = -1;
            int loc_frame = -1;
            int loc_mouse = -1;
            int loc_date = -1;
            int loc_channel_resolution = -1;
            int loc_channel_time = -1;
            int loc_sample_rate = -1;
            int loc_resolution_offset = -1;
            int loc_cube_face = -1;
            int loc_channel[4] = {-1, -1, -1, -1};
        };

        struct GlTarget
        {
            RenderTargetDesc desc{};
            uint32_t texture = 0;
            uint32_t fbo = 0;
        };

        struct GlTexture
        {
            TextureDesc desc{};
            uint32_t texture = 0;
        };

        struct BlitProgram
        {
            uint32_t program = 0;
            int loc_newest = -1;
            int loc_previous = -1;
            int loc_has_previous = -1;
            int loc_blend = -1;
            int loc_source = -1;
            int loc_image_size = -1;
        };

        bool init();
        Status check_gl(const char* what, const std::string& label) const;
        void bind_channel(int unit, const ChannelBinding& ch);
        void bind_present_texture(int unit, uint32_t texture, const PresentRequest& req);
        size_t expected_bytes(const TextureDesc& d) const;
        void upload_texture_pixels(const GlTexture& t, const uint8_t* pixels);

        bool valid_ = false;
        std::string init_error_{};
        uint32_t vao_ = 0;
        uint32_t vertex_shader_ = 0;
        BlitProgram blit_{};
        IRect surface_{};

        uint32_t next_id_ = 1;
        std::unordered_map<uint32_t, GlProgram> programs_{};
        std::unordered_map<uint32_t, GlTarget> targets_{};
        std::unordered_map<uint32_t, GlTexture> textures_{};
    };
}
