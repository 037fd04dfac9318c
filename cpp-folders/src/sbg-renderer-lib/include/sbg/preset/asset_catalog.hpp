#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: asset_catalog.hpp
    MODULE: preset
    PURPOSE: Built-in ShaderToy asset names and the files they map to under the assets
            directory. Names not in the table are treated as file paths.
*/


#include <span>
#include <string>
#include <string_view>

#include "sbg/preset/preset.hpp"

namespace sbg
{
    struct PredefinedAsset
    {
        const char* name;
        const char* file;
    };

    inline std::span<const PredefinedAsset> predefined_textures()
    {
        static constexpr PredefinedAsset kTable[] = {
            {"Abstract 1", "textures/abstract_1.jpg"},
            {"Abstract 2", "textures/abstract_2.jpg"},
            {"Abstract 3", "textures/abstract_3.jpg"},
            {"Bayer", "textures/bayer.png"},
            {"Blue Noise", "textures/blue_noise.png"},
            {"Font 1", "textures/font_1.png"},
            {"Gray Noise Medium", "textures/gray_noise_medium.png"},
            {"Gray Noise Small", "textures/gray_noise_small.png"},
            {"Lichen", "textures/lichen.jpg"},
            {"London", "textures/london.jpg"},
            {"Nyancat", "textures/nyancat.png"},
            {"Organic 1", "textures/organic_1.jpg"},
            {"Organic 2", "textures/organic_2.jpg"},
            {"Organic 3", "textures/organic_3.jpg"},
            {"Organic 4", "textures/organic_4.jpg"},
            {"Pebbles", "textures/pebbles.png"},
            {"RGBA Noise Medium", "textures/rgba_noise_medium.png"},
            {"RGBA Noise Small", "textures/rgba_noise_small.png"},
            {"Rock Tiles", "textures/rock_tiles.jpg"},
            {"Rusty Metal", "textures/rusty_metal.jpg"},
            {"Stars", "textures/stars.jpg"},
            {"Wood", "textures/wood.jpg"},
        };
        return kTable;
    }

    // Cubemap files hold the six faces side by side: +X -X +Y -Y +Z -Z.
    inline std::span<const PredefinedAsset> predefined_cubemaps()
    {
        static constexpr PredefinedAsset kTable[] = {
            {"Forest", "cubemaps/forest.png"},
            {"Forest Blurred", "cubemaps/forest_blurred.png"},
            {"St. Peter's Basilica", "cubemaps/st_peters_basilica.png"},
            {"St. Peter's Basilica Blurred", "cubemaps/st_peters_basilica_blurred.png"},
            {"Uffizi Gallery", "cubemaps/uffizi_gallery.png"},
            {"Uffizi Gallery Blurred", "cubemaps/uffizi_gallery_blurred.png"},
        };
        return kTable;
    }

    // Volume files hold square depth slices side by side.
    inline std::span<const PredefinedAsset> predefined_volumes()
    {
        static constexpr PredefinedAsset kTable[] = {
            {"Grey Noise3D", "volumes/grey_noise_3d.png"},
            {"RGBA Noise3D", "volumes/rgba_noise_3d.png"},
        };
        return kTable;
    }

    inline const PredefinedAsset* find_predefined_asset(InputType type, std::string_view name)
    {
        std::span<const PredefinedAsset> table{};
        switch (type)
        {
            case InputType::Texture: table = predefined_textures(); break;
            case InputType::Cubemap: table = predefined_cubemaps(); break;
            case InputType::Volume: table = predefined_volumes(); break;
            default: return nullptr;
        }
        for (const PredefinedAsset& a : table)
        {
            if (name == a.name) return &a;
        }
        return nullptr;
    }

    inline bool looks_like_file_path(std::string_view name)
    {
        if (name.empty()) return false;
        if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) return true;
        const size_t dot = name.rfind('.');
        if (dot == std::string_view::npos) return false;
        std::string ext(name.substr(dot + 1));
        for (char& c : ext)
        {
            if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        }
        return ext == "png" || ext == "jpg" || ext == "jpeg" || ext == "bmp" || ext == "tga"
            || ext == "gif" || ext == "webp" || ext == "tif" || ext == "tiff";
    }

    // Relative path under the assets directory for predefined names, the name itself otherwise.
    inline std::string resolve_asset_location(InputType type, std::string_view name)
    {
        if (const PredefinedAsset* a = find_predefined_asset(type, name)) return a->file;
        return std::string(name);
    }
}
