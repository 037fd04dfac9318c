#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: asset_provider_sdl.hpp
    MODULE: resources
    PURPOSE: SDL2_image backed asset provider. Predefined assets resolve against the
            assets directory, other names are opened as given.
*/


#include <cstring>
#include <string>
#include <utility>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "sbg/resources/asset_provider.hpp"

namespace sbg
{
    inline Result<ImageData> load_image_sdl(const std::string& path)
    {
        SDL_Surface* loaded = IMG_Load(path.c_str());
        if (!loaded)
        {
            return Result<ImageData>::failure(make_error(ErrorKind::Io, ErrorCode::FileRead,
                                                         "cannot load '" + path + "': " + IMG_GetError()));
        }

        SDL_Surface* rgba = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
        SDL_FreeSurface(loaded);
        if (!rgba)
        {
            return Result<ImageData>::failure(make_error(ErrorKind::Io, ErrorCode::FileRead,
                                                         "cannot convert '" + path + "': " + SDL_GetError()));
        }

        ImageData out{};
        out.width = rgba->w;
        out.height = rgba->h;
        out.channels = 4;
        out.source_path = path;
        out.pixels.resize(out.layer_bytes());

        const auto* src = static_cast<const uint8_t*>(rgba->pixels);
        for (int y = 0; y < out.height; ++y)
        {
            std::memcpy(out.pixels.data() + (size_t)y * out.row_bytes(), src + (size_t)y * (size_t)rgba->pitch, out.row_bytes());
        }
        SDL_FreeSurface(rgba);
        return Result<ImageData>::success(std::move(out));
    }

    class SdlImageAssetProvider final : public IAssetProvider
    {
    public:
        explicit SdlImageAssetProvider(std::string assets_dir)
            : assets_dir_(std::move(assets_dir))
        {}

        Result<ImageData> load_image(const AssetRequest& request) override
        {
            std::string path = request.location;
            if (request.predefined && !assets_dir_.empty()) path = assets_dir_ + "/" + request.location;
            return load_image_sdl(path);
        }

        const std::string& assets_dir() const { return assets_dir_; }

    private:
        std::string assets_dir_{};
    };
}
