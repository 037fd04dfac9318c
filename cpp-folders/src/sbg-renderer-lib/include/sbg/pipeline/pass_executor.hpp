#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: pass_executor.hpp
    MODULE: pipeline
    PURPOSE: Runs a compiled graph against one canvas: binds inputs and built-in
            uniforms per pass and draws each pass into its slot's back target.
*/


#include <string>

#include <glm/glm.hpp>

#include "sbg/gfx/render_canvas.hpp"
#include "sbg/pipeline/compiled_graph.hpp"
#include "sbg/resources/texture_registry.hpp"

namespace sbg
{
    // Per-frame values shared by every pass and canvas.
    struct FrameUniforms
    {
        double time = 0.0;
        double time_delta = 0.0;
        double frame_rate = 0.0;
        uint64_t frame = 0;
        glm::vec4 date{0.0f};
    };

    class PassExecutor
    {
    public:
        PassExecutor(IGpuDevice& device, TextureRegistry& textures)
            : device_(device), textures_(textures)
        {}

        ChannelBinding bind_channel(const std::optional<ResolvedBinding>& binding, const RenderCanvas& canvas) const
        {
            ChannelBinding ch{};
            if (!binding) return ch;
            ch.wrap = binding->input.wrap;
            ch.filter = binding->input.filter;

            switch (binding->kind)
            {
                case BindingKind::PreviousFrame:
                case BindingKind::CurrentFrame:
                {
                    const ResourceSlot& s = canvas.slot(binding->source);
                    if (!s.allocated()) return ChannelBinding{};
                    ch.source = ChannelSource::Target;
                    // Earlier passes wrote their back target this frame; it is swapped in at commit.
                    ch.target = binding->kind == BindingKind::CurrentFrame ? s.write_target() : s.current();
                    ch.dimension = s.desc().dimension;
                    ch.resolution = s.resolution();
                    break;
                }
                case BindingKind::Asset:
                {
                    const RegisteredTexture* t = textures_.find(binding->input);
                    if (!t || !t->handle.valid()) return ChannelBinding{};
                    ch.source = ChannelSource::Texture;
                    ch.texture = t->handle;
                    ch.dimension = t->dimension;
                    ch.resolution = t->resolution;
                    if (ch.filter == FilterMode::Mipmap && !t->mipmaps) ch.filter = FilterMode::Linear;
                    break;
                }
                case BindingKind::Keyboard:
                {
                    const RegisteredTexture& k = textures_.keyboard();
                    if (!k.handle.valid()) return ChannelBinding{};
                    ch.source = ChannelSource::Texture;
                    ch.texture = k.handle;
                    ch.dimension = TextureDimension::Texture2D;
                    ch.resolution = k.resolution;
                    ch.filter = FilterMode::Nearest;
                    ch.wrap = WrapMode::Clamp;
                    break;
                }
                case BindingKind::None:
                    return ChannelBinding{};
            }
            return ch;
        }

        // Stops at the first failing draw; nothing is committed here.
        Status execute(const CompiledGraph& compiled, RenderCanvas& canvas, const FrameUniforms& frame,
                       const glm::vec4& mouse, const glm::vec2& resolution_offset = glm::vec2(0.0f))
        {
            const RenderGraph& graph = compiled.graph();
            for (size_t i = 0; i < compiled.passes().size(); ++i)
            {
                const CompiledPass& cp = compiled.passes()[i];
                const GraphPass& gp = graph.passes[i];
                ResourceSlot& slot = canvas.slot(cp.id);
                if (!slot.allocated())
                {
                    return Status::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::ResourceAllocationFailed,
                                                      "no render target", pass_id_name(cp.id)));
                }

                DrawPassRequest req{};
                req.label = pass_id_name(cp.id);
                req.program = cp.program;
                req.target = slot.write_target();

                PassUniforms& u = req.uniforms;
                u.resolution = slot.resolution();
                u.time = (float)frame.time;
                u.time_delta = (float)frame.time_delta;
                u.frame_rate = (float)frame.frame_rate;
                u.frame = (int)frame.frame;
                u.mouse = mouse;
                u.date = frame.date;
                u.resolution_offset = cp.id == PassId::CubeA ? glm::vec2(0.0f) : resolution_offset;

                for (size_t c = 0; c < req.channels.size(); ++c)
                {
                    req.channels[c] = bind_channel(gp.bindings[c], canvas);
                    u.channel_resolution[c] = req.channels[c].resolution;
                }

                Status st = device_.draw_pass(req);
                if (!st.ok)
                {
                    st.error.kind = ErrorKind::RuntimeGpu;
                    if (st.error.code == ErrorCode::None) st.error.code = ErrorCode::GpuDrawFailed;
                    st.error.pass = pass_id_name(cp.id);
                    return st;
                }
            }
            return Status::success();
        }

    private:
        IGpuDevice& device_;
        TextureRegistry& textures_;
    };
}
