/*
    SBG SHADER BACKGROUND SAN

    FILE: gl_device.cpp
    MODULE: rhi
    PURPOSE: OpenGL driver: programs, FBO ping-pong targets, sampled textures,
            pass draws and the per-monitor present blit.
*/


#define GL_GLEXT_PROTOTYPES 1
#include <GL/gl.h>
#include <GL/glext.h>

#include <cctype>
#include <string>
#include <vector>

#include "sbg/core/log.hpp"
#include "sbg/rhi/drivers/opengl/gl_device.hpp"

namespace sbg
{
    namespace
    {
        // Fullscreen strip from gl_VertexID, no vertex buffers. Cube passes get the
        // direction of the texel being written on face sbg_CubeFace (+X -X +Y -Y +Z -Z).
        const char* kPassVertexShader =
            "#version 420 core\n"
            "out vec2 sbg_FragTexCoord;\n"
            "out vec3 sbg_FragRayDir;\n"
            "uniform int sbg_CubeFace;\n"
            "const vec2 kCorners[4] = vec2[4](vec2(-1.0, -1.0), vec2(1.0, -1.0), vec2(-1.0, 1.0), vec2(1.0, 1.0));\n"
            "void main()\n"
            "{\n"
            "    vec2 p = kCorners[gl_VertexID];\n"
            "    sbg_FragTexCoord = p * 0.5 + 0.5;\n"
            "    float u = p.x;\n"
            "    float v = p.y;\n"
            "    vec3 d = vec3(0.0, 0.0, 1.0);\n"
            "    if (sbg_CubeFace == 0) d = vec3(1.0, -v, -u);\n"
            "    else if (sbg_CubeFace == 1) d = vec3(-1.0, -v, u);\n"
            "    else if (sbg_CubeFace == 2) d = vec3(u, 1.0, v);\n"
            "    else if (sbg_CubeFace == 3) d = vec3(u, -1.0, -v);\n"
            "    else if (sbg_CubeFace == 4) d = vec3(u, -v, 1.0);\n"
            "    else if (sbg_CubeFace == 5) d = vec3(-u, -v, -1.0);\n"
            "    sbg_FragRayDir = d;\n"
            "    gl_Position = vec4(p, 0.0, 1.0);\n"
            "}\n";

        // Source rect is in image pixels with a top-left origin; the image texture has
        // its first row at the bottom.
        const char* kBlitFragmentShader =
            "#version 420 core\n"
            "in vec2 sbg_FragTexCoord;\n"
            "out vec4 sbg_FragColor;\n"
            "uniform sampler2D sbg_Newest;\n"
            "uniform sampler2D sbg_Previous;\n"
            "uniform int sbg_HasPrevious;\n"
            "uniform float sbg_BlendWeight;\n"
            "uniform vec4 sbg_SourceRect;\n"
            "uniform vec2 sbg_ImageSize;\n"
            "void main()\n"
            "{\n"
            "    vec2 t = sbg_FragTexCoord;\n"
            "    float px = sbg_SourceRect.x + t.x * sbg_SourceRect.z;\n"
            "    float py = sbg_SourceRect.y + (1.0 - t.y) * sbg_SourceRect.w;\n"
            "    vec2 uv = vec2(px / sbg_ImageSize.x, 1.0 - py / sbg_ImageSize.y);\n"
            "    vec4 c = texture(sbg_Newest, uv);\n"
            "    if (sbg_HasPrevious != 0) c = mix(texture(sbg_Previous, uv), c, sbg_BlendWeight);\n"
            "    sbg_FragColor = vec4(c.rgb, 1.0);\n"
            "}\n";

        const char* gl_error_name(GLenum e)
        {
            switch (e)
            {
                case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
                case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
                case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
                case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
                case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
                default: return "GL error";
            }
        }

        void drain_gl_errors()
        {
            while (glGetError() != GL_NO_ERROR) {}
        }

        std::string shader_log(GLuint shader)
        {
            GLint len = 0;
            glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
            if (len <= 1) return std::string{};
            std::vector<char> buf((size_t)len);
            glGetShaderInfoLog(shader, len, nullptr, buf.data());
            return std::string(buf.data());
        }

        std::string program_log(GLuint program)
        {
            GLint len = 0;
            glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
            if (len <= 1) return std::string{};
            std::vector<char> buf((size_t)len);
            glGetProgramInfoLog(program, len, nullptr, buf.data());
            return std::string(buf.data());
        }

        GLuint compile_shader(GLenum stage, const std::string& src, std::string& log)
        {
            GLuint sh = glCreateShader(stage);
            const char* p = src.c_str();
            glShaderSource(sh, 1, &p, nullptr);
            glCompileShader(sh);
            GLint ok = GL_FALSE;
            glGetShaderiv(sh, GL_COMPILE_STATUS, &ok);
            if (ok != GL_TRUE)
            {
                log = shader_log(sh);
                glDeleteShader(sh);
                return 0;
            }
            return sh;
        }

        GLuint link_program(GLuint vs, GLuint fs, std::string& log)
        {
            GLuint prog = glCreateProgram();
            glAttachShader(prog, vs);
            glAttachShader(prog, fs);
            glLinkProgram(prog);
            glDetachShader(prog, vs);
            glDetachShader(prog, fs);
            GLint ok = GL_FALSE;
            glGetProgramiv(prog, GL_LINK_STATUS, &ok);
            if (ok != GL_TRUE)
            {
                log = program_log(prog);
                glDeleteProgram(prog);
                return 0;
            }
            return prog;
        }

        GLenum gl_target_for(TextureDimension d)
        {
            switch (d)
            {
                case TextureDimension::Texture2D: return GL_TEXTURE_2D;
                case TextureDimension::Cubemap: return GL_TEXTURE_CUBE_MAP;
                case TextureDimension::Volume: return GL_TEXTURE_3D;
            }
            return GL_TEXTURE_2D;
        }

        GLenum gl_wrap_for(WrapMode w)
        {
            return w == WrapMode::Repeat ? GL_REPEAT : GL_CLAMP_TO_EDGE;
        }

        GLenum gl_wrap_for(PresentWrap w)
        {
            switch (w)
            {
                case PresentWrap::Clamp: return GL_CLAMP_TO_EDGE;
                case PresentWrap::Repeat: return GL_REPEAT;
                case PresentWrap::MirroredRepeat: return GL_MIRRORED_REPEAT;
            }
            return GL_CLAMP_TO_EDGE;
        }

        void apply_sampling(GLenum target, GLenum wrap, FilterMode filter, bool has_mips)
        {
            GLint min_f = GL_LINEAR;
            GLint mag_f = GL_LINEAR;
            if (filter == FilterMode::Nearest)
            {
                min_f = GL_NEAREST;
                mag_f = GL_NEAREST;
            }
            else if (filter == FilterMode::Mipmap && has_mips)
            {
                min_f = GL_LINEAR_MIPMAP_LINEAR;
            }
            glTexParameteri(target, GL_TEXTURE_MIN_FILTER, min_f);
            glTexParameteri(target, GL_TEXTURE_MAG_FILTER, mag_f);
            glTexParameteri(target, GL_TEXTURE_WRAP_S, (GLint)wrap);
            glTexParameteri(target, GL_TEXTURE_WRAP_T, (GLint)wrap);
            if (target != GL_TEXTURE_2D) glTexParameteri(target, GL_TEXTURE_WRAP_R, (GLint)wrap);
        }

        void pixel_format_for(int channels, GLint& internal, GLenum& format)
        {
            switch (channels)
            {
                case 1: internal = GL_R8; format = GL_RED; break;
                case 3: internal = GL_RGB8; format = GL_RGB; break;
                default: internal = GL_RGBA8; format = GL_RGBA; break;
            }
        }

        int read_int(const std::string& s, size_t& i)
        {
            int v = 0;
            while (i < s.size() && std::isdigit((unsigned char)s[i]))
            {
                v = v * 10 + (s[i] - '0');
                ++i;
            }
            return v;
        }
    }

    int parse_glsl_log_line(const std::string& log)
    {
        size_t i = 0;
        while (i < log.size())
        {
            if (std::isdigit((unsigned char)log[i]) && (i == 0 || log[i - 1] == '\n'))
            {
                size_t j = i;
                read_int(log, j);
                if (j < log.size() && log[j] == ':')
                {
                    ++j;
                    const size_t start = j;
                    const int line = read_int(log, j);
                    if (j > start && j < log.size() && log[j] == '(') return line;
                }
                else if (j < log.size() && log[j] == '(')
                {
                    ++j;
                    const size_t start = j;
                    const int line = read_int(log, j);
                    if (j > start && j < log.size() && log[j] == ')') return line;
                }
            }
            ++i;
        }
        return 0;
    }

    OpenGLGpuDevice::OpenGLGpuDevice()
    {
        valid_ = init();
        if (!valid_) log_error("OpenGL device init failed: " + init_error_);
    }

    OpenGLGpuDevice::~OpenGLGpuDevice()
    {
        for (auto& [id, p] : programs_) glDeleteProgram(p.program);
        for (auto& [id, t] : targets_)
        {
            glDeleteFramebuffers(1, &t.fbo);
            glDeleteTextures(1, &t.texture);
        }
        for (auto& [id, t] : textures_) glDeleteTextures(1, &t.texture);
        if (blit_.program) glDeleteProgram(blit_.program);
        if (vertex_shader_) glDeleteShader(vertex_shader_);
        if (vao_) glDeleteVertexArrays(1, &vao_);
    }

    bool OpenGLGpuDevice::init()
    {
        const GLubyte* version = glGetString(GL_VERSION);
        if (!version)
        {
            init_error_ = "no current OpenGL context";
            return false;
        }
        const GLubyte* renderer = glGetString(GL_RENDERER);
        log_info(std::string("OpenGL ") + (const char*)version + " on " + (renderer ? (const char*)renderer : "unknown"));

        glGenVertexArrays(1, &vao_);

        std::string log{};
        vertex_shader_ = compile_shader(GL_VERTEX_SHADER, kPassVertexShader, log);
        if (!vertex_shader_)
        {
            init_error_ = "pass vertex shader: " + log;
            return false;
        }

        GLuint fs = compile_shader(GL_FRAGMENT_SHADER, kBlitFragmentShader, log);
        if (!fs)
        {
            init_error_ = "present shader: " + log;
            return false;
        }
        blit_.program = link_program(vertex_shader_, fs, log);
        glDeleteShader(fs);
        if (!blit_.program)
        {
            init_error_ = "present program: " + log;
            return false;
        }
        blit_.loc_newest = glGetUniformLocation(blit_.program, "sbg_Newest");
        blit_.loc_previous = glGetUniformLocation(blit_.program, "sbg_Previous");
        blit_.loc_has_previous = glGetUniformLocation(blit_.program, "sbg_HasPrevious");
        blit_.loc_blend = glGetUniformLocation(blit_.program, "sbg_BlendWeight");
        blit_.loc_source = glGetUniformLocation(blit_.program, "sbg_SourceRect");
        blit_.loc_image_size = glGetUniformLocation(blit_.program, "sbg_ImageSize");

        glDisable(GL_DEPTH_TEST);
        glDisable(GL_BLEND);
        glDisable(GL_CULL_FACE);
        glEnable(GL_TEXTURE_CUBE_MAP_SEAMLESS);
        return glGetError() == GL_NO_ERROR;
    }

    Status OpenGLGpuDevice::check_gl(const char* what, const std::string& label) const
    {
        const GLenum e = glGetError();
        if (e == GL_NO_ERROR) return Status::success();
        drain_gl_errors();
        return Status::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::GpuDrawFailed,
                                          std::string(what) + ": " + gl_error_name(e), label));
    }

    Result<ProgramHandle> OpenGLGpuDevice::compile_program(const ProgramDesc& desc)
    {
        std::string log{};
        GLuint fs = compile_shader(GL_FRAGMENT_SHADER, desc.fragment_source, log);
        if (!fs)
        {
            return Result<ProgramHandle>::failure(make_error(ErrorKind::Compile, ErrorCode::ShaderCompileFailed,
                                                             log, desc.label, parse_glsl_log_line(log)));
        }
        GLuint prog = link_program(vertex_shader_, fs, log);
        glDeleteShader(fs);
        if (!prog)
        {
            return Result<ProgramHandle>::failure(make_error(ErrorKind::Compile, ErrorCode::ShaderCompileFailed,
                                                             "link: " + log, desc.label, parse_glsl_log_line(log)));
        }

        GlProgram p{};
        p.program = prog;
        p.cubemap = desc.cubemap;
        p.loc_resolution = glGetUniformLocation(prog, "iResolution");
        p.loc_time = glGetUniformLocation(prog, "iTime");
        p.loc_global_time = glGetUniformLocation(prog, "iGlobalTime");
        p.loc_time_delta = glGetUniformLocation(prog, "iTimeDelta");
        p.loc_frame_rate = glGetUniformLocation(prog, "iFrameRate");
        p.loc_frame = glGetUniformLocation(prog, "iFrame");
        p.loc_mouse = glGetUniformLocation(prog, "iMouse");
        p.loc_date = glGetUniformLocation(prog, "iDate");
        p.loc_channel_resolution = glGetUniformLocation(prog, "iChannelResolution");
        p.loc_channel_time = glGetUniformLocation(prog, "iChannelTime");
        p.loc_sample_rate = glGetUniformLocation(prog, "iSampleRate");
        p.loc_resolution_offset = glGetUniformLocation(prog, "iResolutionOffset");
        p.loc_cube_face = glGetUniformLocation(prog, "sbg_CubeFace");
        for (int i = 0; i < 4; ++i)
        {
            const std::string n = "iChannel" + std::to_string(i);
            p.loc_channel[i] = glGetUniformLocation(prog, n.c_str());
        }

        const uint32_t id = next_id_++;
        programs_.emplace(id, p);
        return Result<ProgramHandle>::success(ProgramHandle{id});
    }

    void OpenGLGpuDevice::destroy_program(ProgramHandle program)
    {
        auto it = programs_.find(program.id);
        if (it == programs_.end()) return;
        glDeleteProgram(it->second.program);
        programs_.erase(it);
    }

    Result<TargetHandle> OpenGLGpuDevice::create_target(const RenderTargetDesc& desc)
    {
        drain_gl_errors();
        GlTarget t{};
        t.desc = desc;

        const GLint internal = desc.format == TargetFormat::RGBA32F ? GL_RGBA32F : GL_RGBA8;
        const GLenum type = desc.format == TargetFormat::RGBA32F ? GL_FLOAT : GL_UNSIGNED_BYTE;
        const GLenum target = gl_target_for(desc.dimension);

        glGenTextures(1, &t.texture);
        glBindTexture(target, t.texture);
        if (desc.dimension == TextureDimension::Cubemap)
        {
            for (int f = 0; f < 6; ++f)
            {
                glTexImage2D(GL_TEXTURE_CUBE_MAP_POSITIVE_X + f, 0, internal, desc.width, desc.width, 0, GL_RGBA, type, nullptr);
            }
        }
        else
        {
            glTexImage2D(GL_TEXTURE_2D, 0, internal, desc.width, desc.height, 0, GL_RGBA, type, nullptr);
        }
        apply_sampling(target, GL_CLAMP_TO_EDGE, FilterMode::Linear, false);
        glBindTexture(target, 0);

        glGenFramebuffers(1, &t.fbo);
        glBindFramebuffer(GL_FRAMEBUFFER, t.fbo);
        const GLenum attach = desc.dimension == TextureDimension::Cubemap ? GL_TEXTURE_CUBE_MAP_POSITIVE_X : GL_TEXTURE_2D;
        glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, attach, t.texture, 0);
        const GLenum fb_status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
        glBindFramebuffer(GL_FRAMEBUFFER, 0);

        const GLenum e = glGetError();
        if (fb_status != GL_FRAMEBUFFER_COMPLETE || e != GL_NO_ERROR)
        {
            glDeleteFramebuffers(1, &t.fbo);
            glDeleteTextures(1, &t.texture);
            drain_gl_errors();
            const std::string why = e != GL_NO_ERROR ? gl_error_name(e) : "framebuffer incomplete";
            return Result<TargetHandle>::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::ResourceAllocationFailed,
                                                            why + " (" + std::to_string(desc.width) + "x"
                                                                + std::to_string(desc.height) + ")", desc.label));
        }

        const uint32_t id = next_id_++;
        targets_.emplace(id, t);
        return Result<TargetHandle>::success(TargetHandle{id});
    }

    void OpenGLGpuDevice::destroy_target(TargetHandle target)
    {
        auto it = targets_.find(target.id);
        if (it == targets_.end()) return;
        glDeleteFramebuffers(1, &it->second.fbo);
        glDeleteTextures(1, &it->second.texture);
        targets_.erase(it);
    }

    void OpenGLGpuDevice::clear_target(TargetHandle target)
    {
        auto it = targets_.find(target.id);
        if (it == targets_.end()) return;
        const GlTarget& t = it->second;
        glBindFramebuffer(GL_FRAMEBUFFER, t.fbo);
        glDisable(GL_SCISSOR_TEST);
        glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
        if (t.desc.dimension == TextureDimension::Cubemap)
        {
            for (int f = 0; f < 6; ++f)
            {
                glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_CUBE_MAP_POSITIVE_X + f, t.texture, 0);
                glClear(GL_COLOR_BUFFER_BIT);
            }
        }
        else
        {
            glClear(GL_COLOR_BUFFER_BIT);
        }
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
    }

    size_t OpenGLGpuDevice::expected_bytes(const TextureDesc& d) const
    {
        return (size_t)d.width * (size_t)d.height * (size_t)d.channels * (size_t)d.layers;
    }

    void OpenGLGpuDevice::upload_texture_pixels(const GlTexture& t, const uint8_t* pixels)
    {
        const TextureDesc& d = t.desc;
        GLint internal = GL_RGBA8;
        GLenum format = GL_RGBA;
        pixel_format_for(d.channels, internal, format);
        const GLenum target = gl_target_for(d.dimension);

        glBindTexture(target, t.texture);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        switch (d.dimension)
        {
            case TextureDimension::Texture2D:
                glTexImage2D(GL_TEXTURE_2D, 0, internal, d.width, d.height, 0, format, GL_UNSIGNED_BYTE, pixels);
                break;
            case TextureDimension::Cubemap:
            {
                const size_t face = (size_t)d.width * (size_t)d.height * (size_t)d.channels;
                for (int f = 0; f < 6; ++f)
                {
                    glTexImage2D(GL_TEXTURE_CUBE_MAP_POSITIVE_X + f, 0, internal, d.width, d.height, 0, format,
                                 GL_UNSIGNED_BYTE, pixels + face * (size_t)f);
                }
                break;
            }
            case TextureDimension::Volume:
                glTexImage3D(GL_TEXTURE_3D, 0, internal, d.width, d.height, d.layers, 0, format, GL_UNSIGNED_BYTE, pixels);
                break;
        }
        if (d.mipmaps) glGenerateMipmap(target);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
        glBindTexture(target, 0);
    }

    Result<TextureHandle> OpenGLGpuDevice::create_texture(const TextureDesc& desc, std::span<const uint8_t> pixels)
    {
        if (desc.dimension == TextureDimension::Cubemap && desc.layers != 6)
        {
            return Result<TextureHandle>::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::ResourceAllocationFailed,
                                                             "cubemap needs 6 faces", desc.label));
        }
        if (pixels.size() != expected_bytes(desc))
        {
            return Result<TextureHandle>::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::ResourceAllocationFailed,
                                                             "pixel data size mismatch", desc.label));
        }

        drain_gl_errors();
        GlTexture t{};
        t.desc = desc;
        glGenTextures(1, &t.texture);
        upload_texture_pixels(t, pixels.data());

        const GLenum e = glGetError();
        if (e != GL_NO_ERROR)
        {
            glDeleteTextures(1, &t.texture);
            drain_gl_errors();
            return Result<TextureHandle>::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::ResourceAllocationFailed,
                                                             gl_error_name(e), desc.label));
        }
        const uint32_t id = next_id_++;
        textures_.emplace(id, t);
        return Result<TextureHandle>::success(TextureHandle{id});
    }

    Status OpenGLGpuDevice::update_texture(TextureHandle texture, std::span<const uint8_t> pixels)
    {
        auto it = textures_.find(texture.id);
        if (it == textures_.end())
        {
            return Status::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::GpuDrawFailed, "unknown texture"));
        }
        if (pixels.size() != expected_bytes(it->second.desc))
        {
            return Status::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::GpuDrawFailed,
                                              "pixel data size mismatch", it->second.desc.label));
        }
        drain_gl_errors();
        upload_texture_pixels(it->second, pixels.data());
        return check_gl("texture update", it->second.desc.label);
    }

    void OpenGLGpuDevice::destroy_texture(TextureHandle texture)
    {
        auto it = textures_.find(texture.id);
        if (it == textures_.end()) return;
        glDeleteTextures(1, &it->second.texture);
        textures_.erase(it);
    }

    void OpenGLGpuDevice::bind_channel(int unit, const ChannelBinding& ch)
    {
        glActiveTexture(GL_TEXTURE0 + unit);
        glBindTexture(GL_TEXTURE_2D, 0);
        glBindTexture(GL_TEXTURE_CUBE_MAP, 0);
        glBindTexture(GL_TEXTURE_3D, 0);

        if (ch.source == ChannelSource::Target)
        {
            auto it = targets_.find(ch.target.id);
            if (it == targets_.end()) return;
            const GLenum target = gl_target_for(it->second.desc.dimension);
            glBindTexture(target, it->second.texture);
            const bool mips = ch.filter == FilterMode::Mipmap;
            if (mips) glGenerateMipmap(target);
            apply_sampling(target, gl_wrap_for(ch.wrap), ch.filter, mips);
        }
        else if (ch.source == ChannelSource::Texture)
        {
            auto it = textures_.find(ch.texture.id);
            if (it == textures_.end()) return;
            const GLenum target = gl_target_for(it->second.desc.dimension);
            glBindTexture(target, it->second.texture);
            apply_sampling(target, gl_wrap_for(ch.wrap), ch.filter, it->second.desc.mipmaps);
        }
    }

    Status OpenGLGpuDevice::draw_pass(const DrawPassRequest& request)
    {
        auto pit = programs_.find(request.program.id);
        auto tit = targets_.find(request.target.id);
        if (pit == programs_.end() || tit == targets_.end())
        {
            return Status::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::GpuDrawFailed,
                                              "unknown program or target", request.label));
        }
        const GlProgram& p = pit->second;
        const GlTarget& t = tit->second;
        drain_gl_errors();

        glUseProgram(p.program);
        const PassUniforms& u = request.uniforms;
        glUniform3f(p.loc_resolution, u.resolution.x, u.resolution.y, u.resolution.z);
        glUniform1f(p.loc_time, u.time);
        glUniform1f(p.loc_global_time, u.time);
        glUniform1f(p.loc_time_delta, u.time_delta);
        glUniform1f(p.loc_frame_rate, u.frame_rate);
        glUniform1i(p.loc_frame, u.frame);
        glUniform4f(p.loc_mouse, u.mouse.x, u.mouse.y, u.mouse.z, u.mouse.w);
        glUniform4f(p.loc_date, u.date.x, u.date.y, u.date.z, u.date.w);
        float chres[12] = {};
        float chtime[4] = {};
        for (int i = 0; i < 4; ++i)
        {
            chres[i * 3 + 0] = u.channel_resolution[i].x;
            chres[i * 3 + 1] = u.channel_resolution[i].y;
            chres[i * 3 + 2] = u.channel_resolution[i].z;
            chtime[i] = u.channel_time[i];
        }
        glUniform3fv(p.loc_channel_resolution, 4, chres);
        glUniform1fv(p.loc_channel_time, 4, chtime);
        glUniform1f(p.loc_sample_rate, u.sample_rate);
        glUniform2f(p.loc_resolution_offset, u.resolution_offset.x, u.resolution_offset.y);

        for (int i = 0; i < 4; ++i)
        {
            bind_channel(i, request.channels[(size_t)i]);
            glUniform1i(p.loc_channel[i], i);
        }

        glBindVertexArray(vao_);
        glBindFramebuffer(GL_FRAMEBUFFER, t.fbo);
        glDisable(GL_SCISSOR_TEST);
        if (t.desc.dimension == TextureDimension::Cubemap)
        {
            glViewport(0, 0, t.desc.width, t.desc.width);
            for (int f = 0; f < 6; ++f)
            {
                glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_CUBE_MAP_POSITIVE_X + f, t.texture, 0);
                glUniform1i(p.loc_cube_face, f);
                glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
            }
        }
        else
        {
            glViewport(0, 0, t.desc.width, t.desc.height);
            glUniform1i(p.loc_cube_face, -1);
            glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
        }
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glBindVertexArray(0);
        return check_gl("draw", request.label);
    }

    void OpenGLGpuDevice::begin_present(const IRect& surface)
    {
        surface_ = surface;
        drain_gl_errors();
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glDisable(GL_SCISSOR_TEST);
        glViewport(0, 0, surface.w, surface.h);
        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
    }

    void OpenGLGpuDevice::bind_present_texture(int unit, uint32_t texture, const PresentRequest& req)
    {
        glActiveTexture(GL_TEXTURE0 + unit);
        glBindTexture(GL_TEXTURE_2D, texture);
        const bool mips = req.filter == FilterMode::Mipmap;
        if (mips) glGenerateMipmap(GL_TEXTURE_2D);
        apply_sampling(GL_TEXTURE_2D, gl_wrap_for(req.wrap), req.filter, mips);
    }

    Status OpenGLGpuDevice::present(const PresentRequest& req)
    {
        auto nit = targets_.find(req.newest.id);
        if (nit == targets_.end())
        {
            return Status::failure(make_error(ErrorKind::RuntimeGpu, ErrorCode::GpuDrawFailed,
                                              "no image to present", req.monitor));
        }
        auto prev = targets_.find(req.previous.id);
        const bool has_prev = req.previous.valid() && prev != targets_.end();

        const glm::ivec2 vp = gl_offset_in(surface_, req.viewport);
        glEnable(GL_SCISSOR_TEST);
        glScissor(vp.x, vp.y, req.viewport.w, req.viewport.h);
        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        if (!req.dest.empty())
        {
            const glm::ivec2 d = gl_offset_in(surface_, req.dest);
            glViewport(d.x, d.y, req.dest.w, req.dest.h);
            glUseProgram(blit_.program);
            bind_present_texture(0, nit->second.texture, req);
            glUniform1i(blit_.loc_newest, 0);
            if (has_prev) bind_present_texture(1, prev->second.texture, req);
            glUniform1i(blit_.loc_previous, 1);
            glUniform1i(blit_.loc_has_previous, has_prev ? 1 : 0);
            glUniform1f(blit_.loc_blend, has_prev ? req.blend_weight : 1.0f);
            glUniform4f(blit_.loc_source, (float)req.source.x, (float)req.source.y, (float)req.source.w, (float)req.source.h);
            glUniform2f(blit_.loc_image_size, (float)req.image_size.x, (float)req.image_size.y);
            glBindVertexArray(vao_);
            glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
            glBindVertexArray(0);
        }
        glDisable(GL_SCISSOR_TEST);
        return check_gl("present", req.monitor);
    }

    Status OpenGLGpuDevice::end_present()
    {
        glUseProgram(0);
        return check_gl("end present", std::string{});
    }
}
