#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: compiled_graph.hpp
    MODULE: pipeline
    PURPOSE: A RenderGraph together with one GPU program per pass. A pass whose code
            fails to compile gets substitute code; only a failing substitute fails
            the whole graph.
*/


#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sbg/core/log.hpp"
#include "sbg/core/result.hpp"
#include "sbg/pipeline/render_graph.hpp"
#include "sbg/rhi/gpu_device.hpp"
#include "sbg/shader/shader_source.hpp"

namespace sbg
{
    struct CompiledPass
    {
        PassId id = PassId::Image;
        ProgramHandle program{};
        bool fallback = false;
        std::array<SamplerType, 4> samplers{};
    };

    class CompiledGraph
    {
        struct Token
        {
            explicit Token() = default;
        };

    public:
        // Only compile() can name Token.
        CompiledGraph(Token, IGpuDevice& device, RenderGraph graph)
            : device_(device), graph_(std::move(graph))
        {}

        CompiledGraph(const CompiledGraph&) = delete;
        CompiledGraph& operator=(const CompiledGraph&) = delete;

        ~CompiledGraph()
        {
            for (CompiledPass& p : passes_)
            {
                if (p.program.valid()) device_.destroy_program(p.program);
            }
        }

        static Result<std::unique_ptr<CompiledGraph>> compile(IGpuDevice& device, RenderGraph graph)
        {
            std::unique_ptr<CompiledGraph> out = std::make_unique<CompiledGraph>(Token{}, device, std::move(graph));
            for (const GraphPass& gp : out->graph_.passes)
            {
                CompiledPass cp{};
                cp.id = gp.id;
                cp.samplers = sampler_types_for(gp);

                ProgramDesc desc{};
                desc.label = pass_id_name(gp.id);
                desc.cubemap = gp.id == PassId::CubeA;
                desc.fragment_source = assemble_fragment_source(out->graph_, gp);

                Result<ProgramHandle> prog = device.compile_program(desc);
                if (!prog.ok)
                {
                    Error e = std::move(prog.error);
                    e.kind = ErrorKind::Compile;
                    e.code = ErrorCode::ShaderCompileFailed;
                    e.pass = pass_id_name(gp.id);
                    log_warn("pass '" + e.pass + "' failed to compile, using substitute: " + e.describe());
                    out->compile_errors_.push_back(e);

                    desc.fragment_source = assemble_fragment_source(std::string{}, fallback_pass_code(gp), cp.samplers, desc.cubemap);
                    prog = device.compile_program(desc);
                    if (!prog.ok)
                    {
                        return Result<std::unique_ptr<CompiledGraph>>::failure(make_error(
                            ErrorKind::Build, ErrorCode::FallbackShaderFailed,
                            "substitute shader did not compile: " + prog.error.message, pass_id_name(gp.id)));
                    }
                    cp.fallback = true;
                }
                cp.program = prog.value;
                out->passes_.push_back(cp);
            }
            return Result<std::unique_ptr<CompiledGraph>>::success(std::move(out));
        }

        const RenderGraph& graph() const { return graph_; }
        const std::vector<CompiledPass>& passes() const { return passes_; }
        const std::vector<Error>& compile_errors() const { return compile_errors_; }

    private:
        IGpuDevice& device_;
        RenderGraph graph_{};
        std::vector<CompiledPass> passes_{};
        std::vector<Error> compile_errors_{};
    };
}
