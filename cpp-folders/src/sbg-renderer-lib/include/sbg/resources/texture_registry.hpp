#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: texture_registry.hpp
    MODULE: resources
    PURPOSE: GPU textures for asset inputs, shared between passes and kept across reloads
            while still referenced, plus the keyboard texture.
*/


#include <map>
#include <span>
#include <string>
#include <tuple>
#include <utility>

#include <glm/glm.hpp>

#include "sbg/core/log.hpp"
#include "sbg/input/keyboard_state.hpp"
#include "sbg/pipeline/render_graph.hpp"
#include "sbg/preset/asset_catalog.hpp"
#include "sbg/resources/asset_provider.hpp"
#include "sbg/rhi/gpu_device.hpp"

namespace sbg
{
    struct AssetKey
    {
        InputType type = InputType::Texture;
        std::string name{};
        bool vflip = false;

        bool operator<(const AssetKey& o) const
        {
            return std::tie(type, name, vflip) < std::tie(o.type, o.name, o.vflip);
        }
        bool operator==(const AssetKey&) const = default;
    };

    inline AssetKey asset_key_for(const InputSpec& in)
    {
        // Volumes are never flipped.
        return AssetKey{in.type, in.name, in.type == InputType::Volume ? false : in.vflip};
    }

    struct RegisteredTexture
    {
        TextureHandle handle{};
        TextureDimension dimension = TextureDimension::Texture2D;
        glm::vec3 resolution{0.0f};
        bool mipmaps = false;
        bool placeholder = false;
    };

    class TextureRegistry
    {
    public:
        TextureRegistry(IGpuDevice& device, IAssetProvider* provider)
            : device_(device), provider_(provider)
        {}

        TextureRegistry(const TextureRegistry&) = delete;
        TextureRegistry& operator=(const TextureRegistry&) = delete;

        ~TextureRegistry()
        {
            clear();
        }

        // Loads every asset the graph binds that is not resident yet. A missing or
        // unreadable asset is replaced by a black placeholder with a warning.
        void acquire(const RenderGraph& graph)
        {
            std::map<AssetKey, bool> wanted = wanted_assets(graph);
            for (const auto& [key, mipmaps] : wanted)
            {
                auto it = textures_.find(key);
                if (it != textures_.end() && (it->second.mipmaps || !mipmaps)) continue;
                if (it != textures_.end())
                {
                    device_.destroy_texture(it->second.handle);
                    textures_.erase(it);
                }
                textures_.emplace(key, load(key, mipmaps));
            }
        }

        // Drops textures the graph no longer references.
        void retain_only(const RenderGraph& graph)
        {
            std::map<AssetKey, bool> wanted = wanted_assets(graph);
            for (auto it = textures_.begin(); it != textures_.end();)
            {
                if (wanted.count(it->first) == 0)
                {
                    log_debug("texture '" + it->first.name + "' released");
                    device_.destroy_texture(it->second.handle);
                    it = textures_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

        const RegisteredTexture* find(const InputSpec& in) const
        {
            auto it = textures_.find(asset_key_for(in));
            return it == textures_.end() ? nullptr : &it->second;
        }

        size_t size() const { return textures_.size(); }

        // Created on first use.
        const RegisteredTexture& keyboard()
        {
            if (!keyboard_.handle.valid())
            {
                TextureDesc d{};
                d.dimension = TextureDimension::Texture2D;
                d.width = kKeyboardTextureWidth;
                d.height = kKeyboardTextureHeight;
                d.channels = 1;
                d.label = "keyboard";
                KeyboardTexels zero{};
                Result<TextureHandle> t = device_.create_texture(d, std::span<const uint8_t>(zero.data(), zero.size()));
                if (!t.ok)
                {
                    log_warn("keyboard texture unavailable: " + t.error.describe());
                    return keyboard_;
                }
                keyboard_.handle = t.value;
                keyboard_.resolution = glm::vec3((float)kKeyboardTextureWidth, (float)kKeyboardTextureHeight, 1.0f);
            }
            return keyboard_;
        }

        Status upload_keyboard(const KeyboardTexels& texels)
        {
            const RegisteredTexture& k = keyboard();
            if (!k.handle.valid()) return Status::success();
            return device_.update_texture(k.handle, std::span<const uint8_t>(texels.data(), texels.size()));
        }

        void clear()
        {
            for (auto& [key, tex] : textures_)
            {
                if (tex.handle.valid()) device_.destroy_texture(tex.handle);
            }
            textures_.clear();
            if (keyboard_.handle.valid()) device_.destroy_texture(keyboard_.handle);
            keyboard_ = RegisteredTexture{};
        }

    private:
        static std::map<AssetKey, bool> wanted_assets(const RenderGraph& graph)
        {
            std::map<AssetKey, bool> wanted{};
            for (const GraphPass& p : graph.passes)
            {
                for (const auto& b : p.bindings)
                {
                    if (!b || b->kind != BindingKind::Asset) continue;
                    bool& mip = wanted[asset_key_for(b->input)];
                    mip = mip || b->input.filter == FilterMode::Mipmap;
                }
            }
            return wanted;
        }

        static TextureDimension dimension_for(InputType t)
        {
            if (t == InputType::Cubemap) return TextureDimension::Cubemap;
            if (t == InputType::Volume) return TextureDimension::Volume;
            return TextureDimension::Texture2D;
        }

        RegisteredTexture load(const AssetKey& key, bool mipmaps)
        {
            AssetRequest req{};
            req.type = key.type;
            req.name = key.name;
            req.predefined = find_predefined_asset(key.type, key.name) != nullptr;
            req.location = resolve_asset_location(key.type, key.name);

            ImageData img{};
            if (provider_)
            {
                Result<ImageData> r = provider_->load_image(req);
                if (r.ok)
                {
                    img = std::move(r.value);
                }
                else
                {
                    log_warn("asset '" + key.name + "' not loaded: " + r.error.describe());
                }
            }

            const TextureDimension dim = dimension_for(key.type);
            if (img.valid() && dim != TextureDimension::Texture2D)
            {
                img = split_horizontal_strip(img, dim == TextureDimension::Cubemap ? 6 : 0);
                if (!img.valid()) log_warn("asset '" + key.name + "' does not have the expected strip layout");
            }

            bool placeholder = false;
            if (!img.valid())
            {
                img = make_solid_image(1, 1, 4, 0);
                img.layers = dim == TextureDimension::Cubemap ? 6 : 1;
                img.pixels.assign(img.layer_bytes() * (size_t)img.layers, 0);
                placeholder = true;
            }
            // Files are stored top row first and uploads start at the bottom row,
            // so only vflip inputs come out upright.
            if (key.vflip) flip_rows(img);

            TextureDesc d{};
            d.dimension = dim;
            d.width = img.width;
            d.height = img.height;
            d.layers = img.layers;
            d.channels = img.channels;
            d.mipmaps = mipmaps;
            d.label = key.name;

            RegisteredTexture out{};
            out.dimension = dim;
            out.mipmaps = mipmaps;
            out.placeholder = placeholder;
            Result<TextureHandle> t = device_.create_texture(d, std::span<const uint8_t>(img.pixels.data(), img.pixels.size()));
            if (!t.ok)
            {
                log_warn("texture upload failed for '" + key.name + "': " + t.error.describe());
                return out;
            }
            out.handle = t.value;
            out.resolution = glm::vec3((float)img.width, (float)img.height,
                                       dim == TextureDimension::Volume ? (float)img.layers : 1.0f);
            log_debug("texture '" + key.name + "' resident (" + std::to_string(img.width) + "x" + std::to_string(img.height) + ")");
            return out;
        }

        IGpuDevice& device_;
        IAssetProvider* provider_ = nullptr;
        std::map<AssetKey, RegisteredTexture> textures_{};
        RegisteredTexture keyboard_{};
    };
}
