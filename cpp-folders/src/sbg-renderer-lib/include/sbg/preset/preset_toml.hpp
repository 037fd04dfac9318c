#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: preset_toml.hpp
    MODULE: preset
    PURPOSE: TOML preset reading/writing and settings validation.
*/


#include <string>
#include <string_view>
#include <vector>

#include "sbg/core/result.hpp"
#include "sbg/preset/preset.hpp"

namespace sbg
{
    // Range checks for the numeric globals. Returns ConfigError/OutOfRangeValue.
    Status validate_preset_settings(const Preset& preset);

    // Unknown keys are skipped and reported through `warnings` when it is non-null.
    Result<Preset> parse_preset_toml(std::string_view text, std::vector<std::string>* warnings = nullptr);

    Result<Preset> load_preset_toml_file(const std::string& path, std::vector<std::string>* warnings = nullptr);

    std::string preset_to_toml(const Preset& preset);

    Status save_preset_toml_file(const Preset& preset, const std::string& path);
}
