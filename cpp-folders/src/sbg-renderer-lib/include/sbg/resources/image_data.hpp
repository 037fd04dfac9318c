#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: image_data.hpp
    MODULE: resources
    PURPOSE: CPU-side 8-bit pixel buffers and the reshaping needed before upload
            (row flip, strip to face/slice split).
*/


#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace sbg
{
    struct ImageData
    {
        int width = 0;
        int height = 0;
        // Number of stacked layers: 1 for 2D, 6 for cube faces, N for volume slices.
        int layers = 1;
        int channels = 4;
        std::vector<uint8_t> pixels{};
        std::string source_path{};

        bool valid() const
        {
            return width > 0 && height > 0 && layers > 0 && channels > 0
                && pixels.size() == layer_bytes() * (size_t)layers;
        }

        size_t row_bytes() const { return (size_t)width * (size_t)channels; }
        size_t layer_bytes() const { return row_bytes() * (size_t)height; }
    };

    inline ImageData make_solid_image(int width, int height, int channels, uint8_t value)
    {
        ImageData out{};
        out.width = width;
        out.height = height;
        out.channels = channels;
        out.pixels.assign((size_t)width * (size_t)height * (size_t)channels, value);
        return out;
    }

    // Reverses row order inside each layer.
    inline void flip_rows(ImageData& img)
    {
        const size_t row = img.row_bytes();
        std::vector<uint8_t> tmp(row);
        for (int l = 0; l < img.layers; ++l)
        {
            uint8_t* base = img.pixels.data() + img.layer_bytes() * (size_t)l;
            for (int y = 0; y < img.height / 2; ++y)
            {
                uint8_t* a = base + (size_t)y * row;
                uint8_t* b = base + (size_t)(img.height - 1 - y) * row;
                std::memcpy(tmp.data(), a, row);
                std::memcpy(a, b, row);
                std::memcpy(b, tmp.data(), row);
            }
        }
    }

    // Splits an image made of `count` square tiles laid side by side into
    // `count` contiguous layers. With count == 0 the tile count is width / height.
    inline ImageData split_horizontal_strip(const ImageData& strip, int count)
    {
        if (strip.width <= 0 || strip.height <= 0 || strip.layers != 1) return ImageData{};
        const int n = count > 0 ? count : strip.width / strip.height;
        if (n <= 0 || strip.width % n != 0) return ImageData{};
        const int tile_w = strip.width / n;

        ImageData out{};
        out.width = tile_w;
        out.height = strip.height;
        out.layers = n;
        out.channels = strip.channels;
        out.source_path = strip.source_path;
        out.pixels.resize(out.layer_bytes() * (size_t)n);

        const size_t src_row = strip.row_bytes();
        const size_t dst_row = out.row_bytes();
        for (int l = 0; l < n; ++l)
        {
            uint8_t* dst = out.pixels.data() + out.layer_bytes() * (size_t)l;
            for (int y = 0; y < strip.height; ++y)
            {
                const uint8_t* src = strip.pixels.data() + (size_t)y * src_row + (size_t)l * dst_row;
                std::memcpy(dst + (size_t)y * dst_row, src, dst_row);
            }
        }
        return out;
    }
}
