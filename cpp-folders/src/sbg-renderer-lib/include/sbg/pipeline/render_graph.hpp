#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: render_graph.hpp
    MODULE: pipeline
    PURPOSE: Turns a Preset into an ordered pass list with resolved input bindings.
            Order is the fixed declaration order; only current-frame reads form
            edges, and those edges are checked against that order.
*/


#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sbg/core/result.hpp"
#include "sbg/preset/asset_catalog.hpp"
#include "sbg/preset/preset.hpp"

namespace sbg
{
    enum class BindingKind : uint8_t
    {
        None = 0,
        PreviousFrame,
        CurrentFrame,
        Asset,
        Keyboard
    };

    inline const char* binding_kind_name(BindingKind kind)
    {
        switch (kind)
        {
            case BindingKind::None: return "none";
            case BindingKind::PreviousFrame: return "previous_frame";
            case BindingKind::CurrentFrame: return "current_frame";
            case BindingKind::Asset: return "asset";
            case BindingKind::Keyboard: return "keyboard";
        }
        return "unknown";
    }

    struct ResolvedBinding
    {
        BindingKind kind = BindingKind::None;
        // Buffer pass read by PreviousFrame/CurrentFrame bindings.
        PassId source = PassId::Image;
        // Declared input, kept so the graph can be written back as a preset.
        InputSpec input{};

        bool reads_buffer() const
        {
            return kind == BindingKind::PreviousFrame || kind == BindingKind::CurrentFrame;
        }

        bool operator==(const ResolvedBinding&) const = default;
    };

    struct GraphPass
    {
        PassId id = PassId::Image;
        // Pass code without the common prelude.
        std::string shader{};
        std::array<std::optional<ResolvedBinding>, kMaxInputSlots> bindings{};

        bool operator==(const GraphPass&) const = default;
    };

    struct RenderGraph
    {
        std::string common_source{};
        // Execution order.
        std::vector<GraphPass> passes{};
        std::vector<std::string> warnings{};

        const GraphPass* find(PassId id) const
        {
            for (const GraphPass& p : passes)
            {
                if (p.id == id) return &p;
            }
            return nullptr;
        }

        bool contains(PassId id) const { return find(id) != nullptr; }

        std::vector<PassId> execution_order() const
        {
            std::vector<PassId> out{};
            out.reserve(passes.size());
            for (const GraphPass& p : passes) out.push_back(p.id);
            return out;
        }

        // Warnings are diagnostics, not structure.
        bool operator==(const RenderGraph& o) const
        {
            return common_source == o.common_source && passes == o.passes;
        }
    };

    namespace detail
    {
        inline Result<ResolvedBinding> resolve_buffer_input(
            const Preset& preset, PassId reader, const InputSpec& in, std::vector<std::string>& warnings)
        {
            const std::string reader_name = pass_id_name(reader);
            std::optional<PassId> source = parse_buffer_reference(in.name);
            if (!source)
            {
                return Result<ResolvedBinding>::failure(make_error(
                    ErrorKind::Config, ErrorCode::InvalidInputReference,
                    "'" + in.name + "' does not name a buffer pass", reader_name));
            }
            if (!preset.pass(*source).has_shader())
            {
                return Result<ResolvedBinding>::failure(make_error(
                    ErrorKind::Build, ErrorCode::DanglingBufferReference,
                    "reads '" + in.name + "' which has no shader", reader_name));
            }

            ResolvedBinding b{};
            b.source = *source;
            b.input = in;

            if (*source == reader)
            {
                if (in.frame == FrameSelect::Current)
                {
                    warnings.push_back(reader_name + ": current-frame read of itself treated as feedback");
                }
                b.kind = BindingKind::PreviousFrame;
            }
            else if (in.frame == FrameSelect::Previous)
            {
                b.kind = BindingKind::PreviousFrame;
            }
            else if (in.frame == FrameSelect::Current)
            {
                b.kind = BindingKind::CurrentFrame;
            }
            else
            {
                // Earlier passes have already written this frame; later ones have not.
                b.kind = pass_index(*source) < pass_index(reader) ? BindingKind::CurrentFrame : BindingKind::PreviousFrame;
            }
            return Result<ResolvedBinding>::success(std::move(b));
        }

        inline Result<ResolvedBinding> resolve_input(
            const Preset& preset, PassId reader, const InputSpec& in, std::vector<std::string>& warnings)
        {
            const std::string reader_name = pass_id_name(reader);
            switch (in.type)
            {
                case InputType::Misc:
                    return resolve_buffer_input(preset, reader, in, warnings);

                case InputType::Texture:
                case InputType::Cubemap:
                case InputType::Volume:
                {
                    if (!find_predefined_asset(in.type, in.name) && !looks_like_file_path(in.name))
                    {
                        return Result<ResolvedBinding>::failure(make_error(
                            ErrorKind::Config, ErrorCode::InvalidInputReference,
                            std::string("unknown ") + input_type_name(in.type) + " '" + in.name + "'", reader_name));
                    }
                    ResolvedBinding b{};
                    b.kind = BindingKind::Asset;
                    b.input = in;
                    return Result<ResolvedBinding>::success(std::move(b));
                }

                case InputType::Keyboard:
                {
                    ResolvedBinding b{};
                    b.kind = BindingKind::Keyboard;
                    b.input = in;
                    return Result<ResolvedBinding>::success(std::move(b));
                }

                default:
                {
                    warnings.push_back(reader_name + ": " + input_type_name(in.type) + " input is not supported and stays unbound");
                    ResolvedBinding b{};
                    b.kind = BindingKind::None;
                    b.input = in;
                    return Result<ResolvedBinding>::success(std::move(b));
                }
            }
        }

        // DFS over current-frame edges (reader -> source). Returns a pass on a cycle.
        inline std::optional<PassId> find_current_frame_cycle(const std::array<std::vector<PassId>, kPassCount>& edges)
        {
            std::array<int, kPassCount> color{};
            std::optional<PassId> hit{};

            auto visit = [&](auto&& self, PassId n) -> bool
            {
                color[pass_index(n)] = 1;
                for (PassId m : edges[pass_index(n)])
                {
                    if (color[pass_index(m)] == 1)
                    {
                        hit = m;
                        return true;
                    }
                    if (color[pass_index(m)] == 0 && self(self, m)) return true;
                }
                color[pass_index(n)] = 2;
                return false;
            };

            for (PassId p : kPassOrder)
            {
                if (color[pass_index(p)] == 0 && visit(visit, p)) return hit;
            }
            return std::nullopt;
        }
    }

    inline Result<RenderGraph> build_render_graph(const Preset& preset)
    {
        RenderGraph graph{};
        const PassSpec& common = preset.pass(PassId::Common);
        if (common.has_shader()) graph.common_source = common.shader;

        std::array<std::vector<PassId>, kPassCount> current_edges{};

        for (PassId id : kPassOrder)
        {
            if (!pass_renders(id)) continue;
            const PassSpec& spec = preset.pass(id);
            if (!spec.has_shader() && id != PassId::Image) continue;

            GraphPass gp{};
            gp.id = id;
            gp.shader = spec.has_shader() ? spec.shader : std::string(default_image_shader());

            for (size_t slot = 0; slot < (size_t)kMaxInputSlots; ++slot)
            {
                const std::optional<InputSpec>& in = spec.inputs[slot];
                if (!in) continue;
                Result<ResolvedBinding> b = detail::resolve_input(preset, id, *in, graph.warnings);
                if (!b.ok)
                {
                    b.error.message = "input_" + std::to_string(slot) + ": " + b.error.message;
                    return Result<RenderGraph>::failure(std::move(b.error));
                }
                if (b.value.kind == BindingKind::CurrentFrame)
                {
                    auto& e = current_edges[pass_index(id)];
                    if (std::find(e.begin(), e.end(), b.value.source) == e.end()) e.push_back(b.value.source);
                }
                gp.bindings[slot] = std::move(b.value);
            }
            graph.passes.push_back(std::move(gp));
        }

        if (std::optional<PassId> cyc = detail::find_current_frame_cycle(current_edges))
        {
            return Result<RenderGraph>::failure(make_error(
                ErrorKind::Build, ErrorCode::CyclicCurrentFrameDependency,
                "passes read each other's current frame", pass_id_name(*cyc)));
        }

        for (PassId reader : kPassOrder)
        {
            for (PassId source : current_edges[pass_index(reader)])
            {
                if (pass_index(source) > pass_index(reader))
                {
                    return Result<RenderGraph>::failure(make_error(
                        ErrorKind::Build, ErrorCode::CurrentFrameOrderViolation,
                        std::string("reads the current frame of '") + pass_id_name(source) + "', which runs later",
                        pass_id_name(reader)));
                }
            }
        }

        return Result<RenderGraph>::success(std::move(graph));
    }

    // Writes the graph's passes back over `base`'s pass table.
    inline Preset preset_from_render_graph(const RenderGraph& graph, Preset base = {})
    {
        for (PassSpec& p : base.passes) p = PassSpec{};
        base.pass(PassId::Common).shader = graph.common_source;
        for (const GraphPass& gp : graph.passes)
        {
            PassSpec& spec = base.pass(gp.id);
            spec.shader = gp.shader;
            for (size_t slot = 0; slot < (size_t)kMaxInputSlots; ++slot)
            {
                if (gp.bindings[slot]) spec.inputs[slot] = gp.bindings[slot]->input;
            }
        }
        return base;
    }
}
