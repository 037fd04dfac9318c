/*
    SBG SHADER BACKGROUND SAN

    FILE: preset_toml.cpp
    MODULE: preset
    PURPOSE: toml++ backed preset reader/writer. toml++ exceptions stop here and
            come out as ConfigError values.
*/

#include "sbg/preset/preset_toml.hpp"

#include <fstream>
#include <optional>
#include <sstream>

#include <toml++/toml.hpp>

#include "sbg/core/log.hpp"

namespace sbg
{
    namespace
    {
        Error config_error(ErrorCode code, std::string message, std::string pass = {})
        {
            return make_error(ErrorKind::Config, code, std::move(message), std::move(pass));
        }

        std::string key_path(std::string_view scope, std::string_view key)
        {
            if (scope.empty()) return std::string(key);
            return std::string(scope) + "." + std::string(key);
        }

        // Reads a string value. Fails with WrongValueType when the node holds something else.
        Result<std::string> read_string(const toml::node& node, std::string_view where)
        {
            std::optional<std::string> v = node.value<std::string>();
            if (!node.is_string() || !v)
            {
                return Result<std::string>::failure(config_error(
                    ErrorCode::WrongValueType, "'" + std::string(where) + "' must be a string"));
            }
            return Result<std::string>::success(std::move(*v));
        }

        Result<double> read_number(const toml::node& node, std::string_view where)
        {
            if (!node.is_number())
            {
                return Result<double>::failure(config_error(
                    ErrorCode::WrongValueType, "'" + std::string(where) + "' must be a number"));
            }
            return Result<double>::success(node.value<double>().value_or(0.0));
        }

        Result<bool> read_bool(const toml::node& node, std::string_view where)
        {
            if (!node.is_boolean())
            {
                return Result<bool>::failure(config_error(
                    ErrorCode::WrongValueType, "'" + std::string(where) + "' must be a boolean"));
            }
            return Result<bool>::success(node.value<bool>().value_or(false));
        }

        template<typename TEnum, typename TParse>
        Result<TEnum> read_enum(const toml::node& node, std::string_view where, TParse parse)
        {
            Result<std::string> s = read_string(node, where);
            if (!s.ok) return Result<TEnum>::failure(std::move(s.error));
            std::optional<TEnum> v = parse(s.value);
            if (!v)
            {
                return Result<TEnum>::failure(config_error(
                    ErrorCode::InvalidEnumValue, "'" + std::string(where) + "' has unknown value '" + s.value + "'"));
            }
            return Result<TEnum>::success(*v);
        }

        Result<Duration> read_duration(const toml::node& node, std::string_view where)
        {
            Result<std::string> s = read_string(node, where);
            if (!s.ok) return Result<Duration>::failure(std::move(s.error));
            Result<Duration> d = parse_duration(s.value);
            if (!d.ok) d.error.message = "'" + std::string(where) + "': " + d.error.message;
            return d;
        }

        // "input_3" -> 3. Returns -1 for keys that are not input slots at all,
        // -2 for keys shaped like a slot but outside the valid range.
        int parse_input_slot_key(std::string_view key)
        {
            constexpr std::string_view prefix = "input_";
            if (key.substr(0, prefix.size()) != prefix) return -1;
            const std::string_view idx = key.substr(prefix.size());
            if (idx.empty()) return -2;
            int v = 0;
            for (char c : idx)
            {
                if (c < '0' || c > '9') return -2;
                v = v * 10 + (c - '0');
                if (v > 1000) return -2;
            }
            return v < kMaxInputSlots ? v : -2;
        }

        Result<InputSpec> parse_input(const toml::table& tbl, const std::string& scope, std::vector<std::string>* warnings)
        {
            InputSpec in{};
            for (auto&& [k, node] : tbl)
            {
                const std::string_view key = k.str();
                const std::string where = key_path(scope, key);
                if (key == "type")
                {
                    Result<InputType> r = read_enum<InputType>(node, where, parse_input_type);
                    if (!r.ok) return Result<InputSpec>::failure(std::move(r.error));
                    in.type = r.value;
                }
                else if (key == "name")
                {
                    Result<std::string> r = read_string(node, where);
                    if (!r.ok) return Result<InputSpec>::failure(std::move(r.error));
                    in.name = std::move(r.value);
                }
                else if (key == "wrap")
                {
                    Result<WrapMode> r = read_enum<WrapMode>(node, where, parse_wrap_mode);
                    if (!r.ok) return Result<InputSpec>::failure(std::move(r.error));
                    in.wrap = r.value;
                }
                else if (key == "filter")
                {
                    Result<FilterMode> r = read_enum<FilterMode>(node, where, parse_filter_mode);
                    if (!r.ok) return Result<InputSpec>::failure(std::move(r.error));
                    in.filter = r.value;
                }
                else if (key == "vflip")
                {
                    Result<bool> r = read_bool(node, where);
                    if (!r.ok) return Result<InputSpec>::failure(std::move(r.error));
                    in.vflip = r.value;
                }
                else if (key == "frame")
                {
                    Result<FrameSelect> r = read_enum<FrameSelect>(node, where, parse_frame_select);
                    if (!r.ok) return Result<InputSpec>::failure(std::move(r.error));
                    in.frame = r.value;
                }
                else if (warnings)
                {
                    warnings->push_back("unknown key '" + where + "' ignored");
                }
            }
            return Result<InputSpec>::success(std::move(in));
        }

        Result<PassSpec> parse_pass(const toml::table& tbl, PassId id, std::vector<std::string>* warnings)
        {
            PassSpec pass{};
            const std::string scope = pass_id_name(id);
            for (auto&& [k, node] : tbl)
            {
                const std::string_view key = k.str();
                const std::string where = key_path(scope, key);
                if (key == "shader")
                {
                    Result<std::string> r = read_string(node, where);
                    if (!r.ok) return Result<PassSpec>::failure(std::move(r.error));
                    pass.shader = std::move(r.value);
                    continue;
                }

                const int slot = parse_input_slot_key(key);
                if (slot == -1)
                {
                    if (warnings) warnings->push_back("unknown key '" + where + "' ignored");
                    continue;
                }
                if (slot == -2)
                {
                    return Result<PassSpec>::failure(config_error(
                        ErrorCode::InvalidInputSlot,
                        "input slot '" + std::string(key) + "' is outside input_0..input_3", scope));
                }
                if (id == PassId::Common)
                {
                    if (warnings) warnings->push_back("'" + where + "' ignored: common pass has no inputs");
                    continue;
                }

                const toml::table* in_tbl = node.as_table();
                if (!in_tbl)
                {
                    return Result<PassSpec>::failure(config_error(
                        ErrorCode::WrongValueType, "'" + where + "' must be a table", scope));
                }
                Result<InputSpec> in = parse_input(*in_tbl, where, warnings);
                if (!in.ok)
                {
                    in.error.pass = scope;
                    return Result<PassSpec>::failure(std::move(in.error));
                }
                pass.inputs[(size_t)slot] = std::move(in.value);
            }
            return Result<PassSpec>::success(std::move(pass));
        }

        Result<Preset> parse_root(const toml::table& root, std::vector<std::string>* warnings)
        {
            Preset preset{};
            for (auto&& [k, node] : root)
            {
                const std::string_view key = k.str();
                const std::string where(key);

                if (std::optional<PassId> pid = parse_pass_id(key))
                {
                    const toml::table* tbl = node.as_table();
                    if (!tbl)
                    {
                        return Result<Preset>::failure(config_error(
                            ErrorCode::WrongValueType, "'" + where + "' must be a table"));
                    }
                    Result<PassSpec> pass = parse_pass(*tbl, *pid, warnings);
                    if (!pass.ok) return Result<Preset>::failure(std::move(pass.error));
                    preset.pass(*pid) = std::move(pass.value);
                    continue;
                }

                if (key == "id" || key == "name" || key == "username" || key == "author" || key == "description")
                {
                    Result<std::string> r = read_string(node, where);
                    if (!r.ok) return Result<Preset>::failure(std::move(r.error));
                    if (key == "id") preset.id = std::move(r.value);
                    else if (key == "name") preset.name = std::move(r.value);
                    else if (key == "description") preset.description = std::move(r.value);
                    else preset.author = std::move(r.value);
                }
                else if (key == "resolution_scale" || key == "crossfade_overlap_ratio" || key == "time_scale")
                {
                    Result<double> r = read_number(node, where);
                    if (!r.ok) return Result<Preset>::failure(std::move(r.error));
                    if (key == "resolution_scale") preset.resolution_scale = r.value;
                    else if (key == "crossfade_overlap_ratio") preset.crossfade_overlap_ratio = r.value;
                    else preset.time_scale = r.value;
                }
                else if (key == "interval_between_frames" || key == "time_offset")
                {
                    Result<Duration> r = read_duration(node, where);
                    if (!r.ok) return Result<Preset>::failure(std::move(r.error));
                    if (key == "time_offset") preset.time_offset = r.value;
                    else preset.interval_between_frames = r.value;
                }
                else if (key == "filter_mode")
                {
                    Result<FilterMode> r = read_enum<FilterMode>(node, where, parse_filter_mode);
                    if (!r.ok) return Result<Preset>::failure(std::move(r.error));
                    preset.filter_mode = r.value;
                }
                else if (key == "layout_mode")
                {
                    Result<LayoutMode> r = read_enum<LayoutMode>(node, where, parse_layout_mode);
                    if (!r.ok) return Result<Preset>::failure(std::move(r.error));
                    preset.layout_mode = r.value;
                }
                else if (key == "screen_bounds_policy")
                {
                    Result<ScreenBoundsPolicy> r = read_enum<ScreenBoundsPolicy>(node, where, parse_screen_bounds_policy);
                    if (!r.ok) return Result<Preset>::failure(std::move(r.error));
                    preset.screen_bounds_policy = r.value;
                }
                else if (key == "monitor_selection")
                {
                    const toml::array* arr = node.as_array();
                    if (!arr)
                    {
                        return Result<Preset>::failure(config_error(
                            ErrorCode::WrongValueType, "'monitor_selection' must be an array of strings"));
                    }
                    preset.monitor_selection.clear();
                    for (const toml::node& el : *arr)
                    {
                        Result<std::string> r = read_string(el, "monitor_selection[]");
                        if (!r.ok) return Result<Preset>::failure(std::move(r.error));
                        preset.monitor_selection.push_back(std::move(r.value));
                    }
                }
                else if (warnings)
                {
                    warnings->push_back("unknown key '" + where + "' ignored");
                }
            }

            Status valid = validate_preset_settings(preset);
            if (!valid.ok) return Result<Preset>::failure(std::move(valid.error));
            return Result<Preset>::success(std::move(preset));
        }

        void write_input(toml::table& out, const InputSpec& in)
        {
            out.insert_or_assign("type", std::string(input_type_name(in.type)));
            out.insert_or_assign("name", in.name);
            out.insert_or_assign("wrap", std::string(wrap_mode_name(in.wrap)));
            out.insert_or_assign("filter", std::string(filter_mode_name(in.filter)));
            out.insert_or_assign("vflip", in.vflip);
            if (in.frame != FrameSelect::Auto)
            {
                out.insert_or_assign("frame", std::string(frame_select_name(in.frame)));
            }
        }
    }

    Status validate_preset_settings(const Preset& preset)
    {
        if (!(preset.resolution_scale > 0.0))
        {
            return Status::failure(config_error(ErrorCode::OutOfRangeValue,
                "resolution_scale must be greater than 0 (got " + std::to_string(preset.resolution_scale) + ")"));
        }
        if (!(preset.time_scale >= 0.0))
        {
            return Status::failure(config_error(ErrorCode::OutOfRangeValue,
                "time_scale must not be negative (got " + std::to_string(preset.time_scale) + ")"));
        }
        if (!(preset.crossfade_overlap_ratio >= 0.0 && preset.crossfade_overlap_ratio <= 1.0))
        {
            return Status::failure(config_error(ErrorCode::OutOfRangeValue,
                "crossfade_overlap_ratio must be within [0, 1] (got " + std::to_string(preset.crossfade_overlap_ratio) + ")"));
        }
        if (preset.interval_between_frames.count() < 0 || preset.time_offset.count() < 0)
        {
            return Status::failure(config_error(ErrorCode::OutOfRangeValue, "durations must not be negative"));
        }
        return Status::success();
    }

    Result<Preset> parse_preset_toml(std::string_view text, std::vector<std::string>* warnings)
    {
        toml::table root{};
        try
        {
            root = toml::parse(text);
        }
        catch (const toml::parse_error& err)
        {
            Error e = config_error(ErrorCode::TomlParse, std::string(err.description()));
            e.line = (int)err.source().begin.line;
            return Result<Preset>::failure(std::move(e));
        }
        return parse_root(root, warnings);
    }

    Result<Preset> load_preset_toml_file(const std::string& path, std::vector<std::string>* warnings)
    {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file)
        {
            return Result<Preset>::failure(make_error(
                ErrorKind::Io, ErrorCode::FileRead, "cannot open preset file '" + path + "'"));
        }
        std::ostringstream ss{};
        ss << file.rdbuf();
        Result<Preset> r = parse_preset_toml(ss.str(), warnings);
        if (!r.ok) r.error.message = path + ": " + r.error.message;
        return r;
    }

    std::string preset_to_toml(const Preset& preset)
    {
        toml::table root{};
        if (!preset.id.empty()) root.insert_or_assign("id", preset.id);
        if (!preset.name.empty()) root.insert_or_assign("name", preset.name);
        if (!preset.author.empty()) root.insert_or_assign("username", preset.author);
        if (!preset.description.empty()) root.insert_or_assign("description", preset.description);

        root.insert_or_assign("resolution_scale", preset.resolution_scale);
        root.insert_or_assign("time_scale", preset.time_scale);
        root.insert_or_assign("time_offset", format_duration(preset.time_offset));
        root.insert_or_assign("interval_between_frames", format_duration(preset.interval_between_frames));
        root.insert_or_assign("crossfade_overlap_ratio", preset.crossfade_overlap_ratio);
        root.insert_or_assign("screen_bounds_policy", std::string(screen_bounds_policy_name(preset.screen_bounds_policy)));
        toml::array selection{};
        for (const std::string& s : preset.monitor_selection) selection.push_back(s);
        root.insert_or_assign("monitor_selection", std::move(selection));
        root.insert_or_assign("layout_mode", std::string(layout_mode_name(preset.layout_mode)));
        root.insert_or_assign("filter_mode", std::string(filter_mode_name(preset.filter_mode)));

        for (PassId id : kPassOrder)
        {
            const PassSpec& spec = preset.pass(id);
            if (!spec.has_shader()) continue;

            toml::table pass_tbl{};
            pass_tbl.insert_or_assign("shader", spec.shader);
            for (int slot = 0; slot < kMaxInputSlots; ++slot)
            {
                const std::optional<InputSpec>& in = spec.inputs[(size_t)slot];
                if (!in) continue;
                toml::table in_tbl{};
                write_input(in_tbl, *in);
                pass_tbl.insert_or_assign("input_" + std::to_string(slot), std::move(in_tbl));
            }
            root.insert_or_assign(pass_id_name(id), std::move(pass_tbl));
        }

        std::ostringstream out{};
        out << root << "\n";
        return out.str();
    }

    Status save_preset_toml_file(const Preset& preset, const std::string& path)
    {
        std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file)
        {
            return Status::failure(make_error(ErrorKind::Io, ErrorCode::FileRead, "cannot write preset file '" + path + "'"));
        }
        file << preset_to_toml(preset);
        if (!file)
        {
            return Status::failure(make_error(ErrorKind::Io, ErrorCode::FileRead, "write failed for '" + path + "'"));
        }
        log_debug("preset written to " + path);
        return Status::success();
    }
}
