#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: asset_provider.hpp
    MODULE: resources
    PURPOSE: Source of raw pixel data for texture, cubemap and volume inputs.
*/


#include <string>

#include "sbg/core/result.hpp"
#include "sbg/preset/preset.hpp"
#include "sbg/resources/image_data.hpp"

namespace sbg
{
    struct AssetRequest
    {
        InputType type = InputType::Texture;
        std::string name{};
        // Relative to the assets directory when `predefined`, a file path otherwise.
        std::string location{};
        bool predefined = false;
    };

    class IAssetProvider
    {
    public:
        virtual ~IAssetProvider() = default;

        // Returns the file as stored: top row first, one layer.
        virtual Result<ImageData> load_image(const AssetRequest& request) = 0;
    };
}
