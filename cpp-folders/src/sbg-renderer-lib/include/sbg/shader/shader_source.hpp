#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: shader_source.hpp
    MODULE: shader
    PURPOSE: Assembles ShaderToy pass code into a complete GLSL 4.20 fragment shader
            and provides the substitute code used when a pass fails to compile.
*/


#include <array>
#include <cstdint>
#include <string>

#include "sbg/pipeline/render_graph.hpp"

namespace sbg
{
    inline constexpr const char* kGlslVersionDirective = "#version 420 core\n";

    enum class SamplerType : uint8_t
    {
        Sampler2D = 0,
        SamplerCube,
        Sampler3D
    };

    inline const char* sampler_type_glsl(SamplerType t)
    {
        switch (t)
        {
            case SamplerType::Sampler2D: return "sampler2D";
            case SamplerType::SamplerCube: return "samplerCube";
            case SamplerType::Sampler3D: return "sampler3D";
        }
        return "sampler2D";
    }

    inline SamplerType sampler_type_for(const std::optional<ResolvedBinding>& binding)
    {
        if (!binding) return SamplerType::Sampler2D;
        switch (binding->kind)
        {
            case BindingKind::PreviousFrame:
            case BindingKind::CurrentFrame:
                return binding->source == PassId::CubeA ? SamplerType::SamplerCube : SamplerType::Sampler2D;
            case BindingKind::Asset:
                if (binding->input.type == InputType::Cubemap) return SamplerType::SamplerCube;
                if (binding->input.type == InputType::Volume) return SamplerType::Sampler3D;
                return SamplerType::Sampler2D;
            default:
                return SamplerType::Sampler2D;
        }
    }

    inline std::array<SamplerType, 4> sampler_types_for(const GraphPass& pass)
    {
        std::array<SamplerType, 4> out{};
        for (size_t i = 0; i < out.size(); ++i) out[i] = sampler_type_for(pass.bindings[i]);
        return out;
    }

    inline const char* shadertoy_uniform_block()
    {
        return
            "in vec2 sbg_FragTexCoord;\n"
            "#ifdef SHADERBG_CUBEMAP\n"
            "in vec3 sbg_FragRayDir;\n"
            "#endif\n"
            "out vec4 sbg_FragColor;\n"
            "\n"
            "uniform vec3  iResolution;\n"
            "uniform float iTime;\n"
            "uniform float iGlobalTime;\n"
            "uniform float iTimeDelta;\n"
            "uniform float iFrameRate;\n"
            "uniform int   iFrame;\n"
            "uniform vec4  iMouse;\n"
            "uniform vec4  iDate;\n"
            "uniform vec3  iChannelResolution[4];\n"
            "uniform float iChannelTime[4];\n"
            "uniform float iSampleRate;\n"
            "uniform vec2  iResolutionOffset;\n";
    }

    inline const char* shadertoy_entry_point(bool cubemap)
    {
        if (cubemap)
        {
            return
                "\nvoid main()\n"
                "{\n"
                "    vec4 color = vec4(0.0);\n"
                "    mainCubemap(color, gl_FragCoord.xy, vec3(0.0), normalize(sbg_FragRayDir));\n"
                "    sbg_FragColor = color;\n"
                "}\n";
        }
        return
            "\nvoid main()\n"
            "{\n"
            "    vec4 color = vec4(0.0);\n"
            "    mainImage(color, gl_FragCoord.xy + iResolutionOffset);\n"
            "    sbg_FragColor = color;\n"
            "}\n";
    }

    // Line numbers in compile logs: source string 1 is the common code, 2 the pass code.
    inline std::string assemble_fragment_source(
        const std::string& common,
        const std::string& pass_code,
        const std::array<SamplerType, 4>& channels,
        bool cubemap)
    {
        std::string src{};
        src.reserve(common.size() + pass_code.size() + 2048);
        src += kGlslVersionDirective;
        if (cubemap) src += "#define SHADERBG_CUBEMAP\n";
        src += "#define SHADERBG\n";
        src += shadertoy_uniform_block();
        for (size_t i = 0; i < channels.size(); ++i)
        {
            src += "uniform ";
            src += sampler_type_glsl(channels[i]);
            src += " iChannel" + std::to_string(i) + ";\n";
        }
        if (!common.empty())
        {
            src += "#line 1 1\n";
            src += common;
            src += "\n";
        }
        src += "#line 1 2\n";
        src += pass_code;
        src += "\n#line 1 3\n";
        src += shadertoy_entry_point(cubemap);
        return src;
    }

    inline std::string assemble_fragment_source(const RenderGraph& graph, const GraphPass& pass)
    {
        return assemble_fragment_source(graph.common_source, pass.shader, sampler_types_for(pass), pass.id == PassId::CubeA);
    }

    // Substitute code for a pass whose own code does not compile. Copies channel 0
    // through when it is bound; otherwise draws the built-in gradient.
    inline std::string fallback_pass_code(const GraphPass& pass)
    {
        const PassId id = pass.id;
        const bool bound = pass.bindings[0].has_value() && pass.bindings[0]->kind != BindingKind::None;
        const SamplerType channel0 = sampler_type_for(pass.bindings[0]);
        if (id == PassId::CubeA)
        {
            if (bound && channel0 == SamplerType::SamplerCube)
            {
                return "void mainCubemap(out vec4 fragColor, in vec2 fragCoord, in vec3 rayOri, in vec3 rayDir)\n"
                       "{\n"
                       "    fragColor = texture(iChannel0, rayDir);\n"
                       "}\n";
            }
            return "void mainCubemap(out vec4 fragColor, in vec2 fragCoord, in vec3 rayOri, in vec3 rayDir)\n"
                   "{\n"
                   "    fragColor = vec4(0.5 + 0.5 * rayDir, 1.0);\n"
                   "}\n";
        }
        if (bound && channel0 == SamplerType::Sampler2D)
        {
            return "void mainImage(out vec4 fragColor, in vec2 fragCoord)\n"
                   "{\n"
                   "    fragColor = texture(iChannel0, fragCoord / iResolution.xy);\n"
                   "}\n";
        }
        return default_image_shader();
    }
}
