#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "sbg/resources/asset_provider.hpp"
#include "sbg/rhi/gpu_device.hpp"

namespace sbg_test
{
    // Records every call. Programs whose fragment source contains `fail_marker`
    // fail to compile; draws fail while `fail_draws` is positive, once
    // `fail_after_draws` more draws have gone through.
    struct FakeGpuDevice final : sbg::IGpuDevice
    {
        struct TargetRecord
        {
            sbg::RenderTargetDesc desc{};
            int clears = 0;
        };

        struct TextureRecord
        {
            sbg::TextureDesc desc{};
            std::vector<uint8_t> pixels{};
            int updates = 0;
        };

        sbg::GpuBackendType type() const override { return sbg::GpuBackendType::Null; }

        sbg::Result<sbg::ProgramHandle> compile_program(const sbg::ProgramDesc& desc) override
        {
            compiled.push_back(desc);
            if (!fail_marker.empty() && desc.fragment_source.find(fail_marker) != std::string::npos)
            {
                return sbg::Result<sbg::ProgramHandle>::failure(sbg::make_error(
                    sbg::ErrorKind::Compile, sbg::ErrorCode::ShaderCompileFailed, "0:3(1): error: syntax error", desc.label, 3));
            }
            const uint32_t id = next_id++;
            programs.insert(id);
            return sbg::Result<sbg::ProgramHandle>::success(sbg::ProgramHandle{id});
        }

        void destroy_program(sbg::ProgramHandle program) override
        {
            programs.erase(program.id);
            ++destroyed_programs;
        }

        sbg::Result<sbg::TargetHandle> create_target(const sbg::RenderTargetDesc& desc) override
        {
            if (fail_target_allocation)
            {
                return sbg::Result<sbg::TargetHandle>::failure(sbg::make_error(
                    sbg::ErrorKind::RuntimeGpu, sbg::ErrorCode::ResourceAllocationFailed, "out of memory", desc.label));
            }
            const uint32_t id = next_id++;
            targets[id] = TargetRecord{desc, 0};
            ++targets_created;
            return sbg::Result<sbg::TargetHandle>::success(sbg::TargetHandle{id});
        }

        void destroy_target(sbg::TargetHandle target) override
        {
            targets.erase(target.id);
        }

        void clear_target(sbg::TargetHandle target) override
        {
            auto it = targets.find(target.id);
            if (it != targets.end()) ++it->second.clears;
        }

        sbg::Result<sbg::TextureHandle> create_texture(const sbg::TextureDesc& desc, std::span<const uint8_t> pixels) override
        {
            const uint32_t id = next_id++;
            textures[id] = TextureRecord{desc, std::vector<uint8_t>(pixels.begin(), pixels.end()), 0};
            return sbg::Result<sbg::TextureHandle>::success(sbg::TextureHandle{id});
        }

        sbg::Status update_texture(sbg::TextureHandle texture, std::span<const uint8_t> pixels) override
        {
            auto it = textures.find(texture.id);
            if (it == textures.end())
            {
                return sbg::Status::failure(sbg::make_error(sbg::ErrorKind::RuntimeGpu, sbg::ErrorCode::GpuDrawFailed, "unknown texture"));
            }
            it->second.pixels.assign(pixels.begin(), pixels.end());
            ++it->second.updates;
            return sbg::Status::success();
        }

        void destroy_texture(sbg::TextureHandle texture) override
        {
            textures.erase(texture.id);
        }

        sbg::Status draw_pass(const sbg::DrawPassRequest& request) override
        {
            if (fail_draws > 0 && fail_after_draws > 0)
            {
                --fail_after_draws;
            }
            else if (fail_draws > 0)
            {
                --fail_draws;
                return sbg::Status::failure(sbg::make_error(sbg::ErrorKind::RuntimeGpu, sbg::ErrorCode::GpuDrawFailed, "GL_OUT_OF_MEMORY"));
            }
            draws.push_back(request);
            return sbg::Status::success();
        }

        void begin_present(const sbg::IRect& surface) override
        {
            surfaces.push_back(surface);
        }

        sbg::Status present(const sbg::PresentRequest& request) override
        {
            presents.push_back(request);
            return sbg::Status::success();
        }

        std::vector<std::string> draw_labels() const
        {
            std::vector<std::string> out{};
            for (const auto& d : draws) out.push_back(d.label);
            return out;
        }

        const TargetRecord* target(sbg::TargetHandle h) const
        {
            auto it = targets.find(h.id);
            return it == targets.end() ? nullptr : &it->second;
        }

        uint32_t next_id = 1;
        std::string fail_marker{};
        int fail_draws = 0;
        int fail_after_draws = 0;
        bool fail_target_allocation = false;

        std::vector<sbg::ProgramDesc> compiled{};
        std::set<uint32_t> programs{};
        int destroyed_programs = 0;
        std::map<uint32_t, TargetRecord> targets{};
        int targets_created = 0;
        std::map<uint32_t, TextureRecord> textures{};
        std::vector<sbg::DrawPassRequest> draws{};
        std::vector<sbg::IRect> surfaces{};
        std::vector<sbg::PresentRequest> presents{};
    };

    // Serves a fixed 2x2 (or 12x2 for cubemaps) image for every request and
    // counts the requests.
    struct FakeAssetProvider final : sbg::IAssetProvider
    {
        sbg::Result<sbg::ImageData> load_image(const sbg::AssetRequest& request) override
        {
            requests.push_back(request);
            if (missing.count(request.name) != 0)
            {
                return sbg::Result<sbg::ImageData>::failure(sbg::make_error(
                    sbg::ErrorKind::Io, sbg::ErrorCode::FileRead, "no such file: " + request.location));
            }
            sbg::ImageData img{};
            img.width = request.type == sbg::InputType::Cubemap ? 12 : 2;
            img.height = 2;
            img.channels = 4;
            img.pixels.resize(img.layer_bytes());
            // Top row 0xAA, bottom row 0x55.
            for (size_t i = 0; i < img.pixels.size(); ++i)
            {
                img.pixels[i] = i < img.row_bytes() ? 0xAA : 0x55;
            }
            return sbg::Result<sbg::ImageData>::success(img);
        }

        std::vector<sbg::AssetRequest> requests{};
        std::set<std::string> missing{};
    };
}
