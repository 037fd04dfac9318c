#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: wallpaper_runtime.hpp
    MODULE: runtime
    PURPOSE: Entry point of the render core. Owns the loaded graph, its canvases and
            textures, the clock and scheduler, and drives one frame per tick:
            pending reload, render or hold, commit, present per monitor.
*/


#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sbg/core/log.hpp"
#include "sbg/core/result.hpp"
#include "sbg/frame/frame_scheduler.hpp"
#include "sbg/frame/time_source.hpp"
#include "sbg/gfx/render_canvas.hpp"
#include "sbg/input/keyboard_state.hpp"
#include "sbg/input/mouse_state.hpp"
#include "sbg/layout/layout_resolver.hpp"
#include "sbg/pipeline/compiled_graph.hpp"
#include "sbg/pipeline/pass_executor.hpp"
#include "sbg/pipeline/render_graph.hpp"
#include "sbg/preset/preset.hpp"
#include "sbg/preset/preset_toml.hpp"
#include "sbg/resources/asset_provider.hpp"
#include "sbg/resources/texture_registry.hpp"
#include "sbg/rhi/gpu_device.hpp"
#include "sbg/runtime/hot_reload.hpp"
#include "sbg/runtime/overlay.hpp"

namespace sbg
{
    struct RuntimeConfig
    {
        // Consecutive failed frames tolerated before tick() reports failure.
        int max_consecutive_gpu_errors = 30;
        bool overlay_enabled = true;
        // When set, sources of passes that failed to compile are written here as <pass>.frag.
        std::string shader_dump_dir{};
        // Wall clock for iDate.
        std::function<std::chrono::system_clock::time_point()> clock{};
    };

    struct MonitorPresentation
    {
        std::string monitor{};
        size_t canvas = 0;
        IRect dest{};
        FRect source{};
        float blend_weight = 1.0f;
        bool cross_faded = false;
    };

    struct PresentedFrame
    {
        SchedulerState state = SchedulerState::Idle;
        bool rendered = false;
        bool dropped = false;
        // iFrame of the newest completed frame.
        uint64_t frame = 0;
        double time = 0.0;
        float blend_weight = 1.0f;
        std::vector<MonitorPresentation> monitors{};
    };

    class WallpaperRuntime
    {
    public:
        WallpaperRuntime(IGpuDevice& device, IAssetProvider* assets, RuntimeConfig config = {})
            : device_(device),
              config_(std::move(config)),
              textures_(device, assets),
              executor_(device, textures_)
        {
            if (!config_.clock) config_.clock = []() { return std::chrono::system_clock::now(); };
        }

        WallpaperRuntime(const WallpaperRuntime&) = delete;
        WallpaperRuntime& operator=(const WallpaperRuntime&) = delete;

        ~WallpaperRuntime()
        {
            // Slots and programs go before the textures they may sample.
            canvases_.clear();
            compiled_.reset();
        }

        // Builds, compiles and allocates everything for `preset` before touching the
        // running graph, so a failure leaves the previous preset in place.
        Status load(const Preset& preset)
        {
            Status valid = validate_preset_settings(preset);
            if (!valid.ok)
            {
                log_error("preset rejected: " + valid.error.describe());
                return valid;
            }

            Result<RenderGraph> graph = build_render_graph(preset);
            if (!graph.ok)
            {
                log_error("preset rejected: " + graph.error.describe());
                return Status::failure(std::move(graph.error));
            }
            for (const std::string& w : graph.value.warnings) log_warn(w);

            Result<std::unique_ptr<CompiledGraph>> compiled = CompiledGraph::compile(device_, std::move(graph.value));
            if (!compiled.ok)
            {
                log_error("preset rejected: " + compiled.error.describe());
                return Status::failure(std::move(compiled.error));
            }
            dump_failed_sources(*compiled.value);

            const LayoutSettings settings = layout_settings_from(preset);
            const LayoutPlan plan = resolve_layout(monitors_, settings);

            textures_.acquire(compiled.value->graph());

            std::vector<std::unique_ptr<RenderCanvas>> canvases{};
            Status alloc = allocate_canvases(compiled.value->graph(), plan, canvases);
            if (!alloc.ok)
            {
                // Drop what this attempt uploaded; the running graph keeps its own.
                if (compiled_) textures_.retain_only(compiled_->graph());
                else textures_.clear();
                log_error("preset rejected: " + alloc.error.describe());
                return alloc;
            }

            canvases_ = std::move(canvases);
            compiled_ = std::move(compiled.value);
            preset_ = preset;
            loaded_ = true;
            previous_valid_ = false;
            layout_.update(monitors_, settings);
            textures_.retain_only(compiled_->graph());
            uses_keyboard_ = graph_uses_keyboard(compiled_->graph());

            time_.configure(preset.time_scale, preset.time_offset);
            time_.reset();
            scheduler_.configure(preset.interval_between_frames, preset.crossfade_overlap_ratio);
            scheduler_.reset();
            consecutive_gpu_errors_ = 0;
            if (config_.overlay_enabled) overlay_.arm(preset.name, preset.author);

            log_info("preset loaded: '" + (preset.name.empty() ? preset.id : preset.name) + "' ("
                     + std::to_string(compiled_->passes().size()) + " passes, "
                     + std::to_string(canvases_.size()) + " canvases)");
            return Status::success();
        }

        Status load_file(const std::string& path)
        {
            std::vector<std::string> warnings{};
            Result<Preset> p = load_preset_toml_file(path, &warnings);
            for (const std::string& w : warnings) log_warn(path + ": " + w);
            if (!p.ok)
            {
                log_error("preset rejected: " + p.error.describe());
                return Status::failure(std::move(p.error));
            }
            return load(p.value);
        }

        // Any thread.
        void notify_preset_changed(std::string path)
        {
            reload_.notify_preset_changed(std::move(path));
        }

        Status set_monitors(std::vector<MonitorInfo> monitors)
        {
            monitors_ = std::move(monitors);
            if (!loaded_) return Status::success();
            return relayout(layout_settings_from(preset_));
        }

        // Resizes slots in place; graph, programs and the frame counter stay.
        Status set_resolution_scale(double scale)
        {
            if (!(scale > 0.0))
            {
                return Status::failure(make_error(ErrorKind::Config, ErrorCode::OutOfRangeValue,
                                                  "resolution_scale must be greater than 0"));
            }
            const double previous = preset_.resolution_scale;
            preset_.resolution_scale = scale;
            if (!loaded_) return Status::success();
            Status st = relayout(layout_settings_from(preset_));
            if (!st.ok) preset_.resolution_scale = previous;
            return st;
        }

        Result<PresentedFrame> tick(double wall_delta)
        {
            if (wall_delta < 0.0) wall_delta = 0.0;
            reload_.process_pending(loaded_ ? &preset_ : nullptr, [this](const Preset& p) { return load(p); });
            overlay_.advance(wall_delta);

            PresentedFrame out{};
            if (!compiled_ || canvases_.empty())
            {
                return Result<PresentedFrame>::success(std::move(out));
            }

            time_.advance_wall(wall_delta);
            const ScheduleDecision decision = scheduler_.tick(wall_delta);
            out.state = decision.state;
            out.blend_weight = decision.blend_weight;

            bool gpu_error = false;
            if (decision.render)
            {
                Status st = render_frame();
                if (st.ok)
                {
                    out.rendered = true;
                }
                else
                {
                    gpu_error = true;
                    out.dropped = true;
                    previous_valid_ = false;
                    ++dropped_frames_;
                    log_warn("frame dropped: " + st.error.describe());
                }
            }

            out.frame = time_.frames_rendered() > 0 ? time_.frames_rendered() - 1 : 0;
            out.time = time_.state().time;

            Status presented = present(decision, out);
            if (!presented.ok)
            {
                gpu_error = true;
                log_warn("present failed: " + presented.error.describe());
            }

            if (gpu_error)
            {
                ++consecutive_gpu_errors_;
                if (consecutive_gpu_errors_ > config_.max_consecutive_gpu_errors)
                {
                    Error e = make_error(ErrorKind::RuntimeGpu, ErrorCode::GpuErrorThresholdExceeded,
                                         std::to_string(consecutive_gpu_errors_) + " consecutive GPU errors");
                    log_error(e.describe());
                    return Result<PresentedFrame>::failure(std::move(e));
                }
            }
            else
            {
                consecutive_gpu_errors_ = 0;
            }
            return Result<PresentedFrame>::success(std::move(out));
        }

        std::optional<OverlayInfo> overlay() const { return overlay_.current(); }

        KeyboardState& keyboard() { return keyboard_; }
        MouseState& mouse() { return mouse_; }
        HotReloadCoordinator& reload() { return reload_; }

        bool loaded() const { return loaded_; }
        const Preset& preset() const { return preset_; }
        const RenderGraph* graph() const { return compiled_ ? &compiled_->graph() : nullptr; }
        const CompiledGraph* compiled() const { return compiled_.get(); }
        const LayoutPlan& layout() const { return layout_.plan(); }
        const TimeSource& time() const { return time_; }
        const FrameScheduler& scheduler() const { return scheduler_; }
        const TextureRegistry& textures() const { return textures_; }
        size_t canvas_count() const { return canvases_.size(); }
        const RenderCanvas* canvas(size_t i) const { return i < canvases_.size() ? canvases_[i].get() : nullptr; }
        int consecutive_gpu_errors() const { return consecutive_gpu_errors_; }
        uint64_t dropped_frames() const { return dropped_frames_; }

    private:
        static bool graph_uses_keyboard(const RenderGraph& graph)
        {
            for (const GraphPass& p : graph.passes)
            {
                for (const auto& b : p.bindings)
                {
                    if (b && b->kind == BindingKind::Keyboard) return true;
                }
            }
            return false;
        }

        Status allocate_canvases(const RenderGraph& graph, const LayoutPlan& plan,
                                 std::vector<std::unique_ptr<RenderCanvas>>& out)
        {
            out.clear();
            for (size_t i = 0; i < plan.canvases.size(); ++i)
            {
                auto c = std::make_unique<RenderCanvas>("canvas" + std::to_string(i));
                Status st = c->allocate(device_, graph, plan.canvases[i].size);
                if (!st.ok) return st;
                out.push_back(std::move(c));
            }
            return Status::success();
        }

        // On failure the previous plan and canvases stay, and the same change can be retried.
        Status relayout(const LayoutSettings& settings)
        {
            const std::vector<MonitorInfo> prev_monitors = layout_.monitors();
            const LayoutSettings prev_settings = layout_.settings();
            if (!layout_.update(monitors_, settings)) return Status::success();
            log_info("monitor layout changed: " + std::to_string(layout_.plan().canvases.size()) + " canvases, "
                     + std::to_string(layout_.plan().monitors.size()) + " monitors");

            Status st = apply_layout();
            if (st.ok) return st;
            layout_.update(prev_monitors, prev_settings);
            Status back = apply_layout();
            if (!back.ok) log_error("restoring previous canvases failed: " + back.error.describe());
            return st;
        }

        // Same canvas count: resize in place. Otherwise the canvas set is rebuilt.
        Status apply_layout()
        {
            const LayoutPlan& plan = layout_.plan();
            if (plan.canvases.size() == canvases_.size())
            {
                for (size_t i = 0; i < canvases_.size(); ++i)
                {
                    Status st = canvases_[i]->resize(plan.canvases[i].size);
                    if (!st.ok) return st;
                }
                previous_valid_ = false;
                return Status::success();
            }

            // The old canvases stay until the new set is fully allocated.
            std::vector<std::unique_ptr<RenderCanvas>> next{};
            Status st = allocate_canvases(compiled_->graph(), plan, next);
            if (!st.ok)
            {
                log_error("canvas rebuild failed: " + st.error.describe());
                return st;
            }
            canvases_.swap(next);
            previous_valid_ = false;
            return Status::success();
        }

        Status render_frame()
        {
            const TimeState& ts = time_.begin_frame();
            FrameUniforms fu{};
            fu.time = ts.time;
            fu.time_delta = ts.time_delta;
            fu.frame_rate = ts.frame_rate;
            fu.frame = ts.frame;
            fu.date = shadertoy_date(config_.clock());

            const MouseSnapshot mouse = mouse_.take_frame();
            KeyboardTexels keys{};
            if (uses_keyboard_) keys = keyboard_.take_frame();

            Status st = draw_canvases(fu, mouse, keys);
            if (!st.ok)
            {
                // Nothing was committed: the next frame gets this one's time and input pulses.
                time_.abort_frame();
                mouse_.restore_frame(mouse);
                if (uses_keyboard_) keyboard_.restore_frame(keys);
                return st;
            }

            for (auto& c : canvases_) c->commit_all();
            time_.end_frame();
            previous_valid_ = true;
            return Status::success();
        }

        Status draw_canvases(const FrameUniforms& fu, const MouseSnapshot& mouse, const KeyboardTexels& keys)
        {
            if (uses_keyboard_)
            {
                Status kb = textures_.upload_keyboard(keys);
                if (!kb.ok) return kb;
            }

            const LayoutPlan& plan = layout_.plan();
            for (size_t i = 0; i < canvases_.size(); ++i)
            {
                const bool planned = i < plan.canvases.size();
                const IRect bounds = planned ? plan.canvases[i].bounds : IRect{};
                const glm::vec2 offset = planned ? glm::vec2(plan.canvases[i].gl_offset) : glm::vec2(0.0f);
                const glm::vec4 m = shadertoy_mouse(mouse, bounds, canvases_[i]->size());
                Status st = executor_.execute(*compiled_, *canvases_[i], fu, m, offset);
                if (!st.ok) return st;
            }
            return Status::success();
        }

        Status present(const ScheduleDecision& decision, PresentedFrame& out)
        {
            const LayoutPlan& plan = layout_.plan();
            // The output surface covers every monitor, presented or not.
            const IRect surface = monitors_union(monitors_);

            device_.begin_present(surface);
            Status result = Status::success();
            for (const MonitorLayout& ml : plan.monitors)
            {
                if (ml.canvas >= canvases_.size()) continue;
                const ResourceSlot& image = canvases_[ml.canvas]->slot(PassId::Image);

                PresentRequest req{};
                req.monitor = ml.monitor;
                req.surface = surface;
                req.viewport = ml.geometry;
                req.dest = ml.dest;
                req.source = ml.source;
                req.image_size = canvases_[ml.canvas]->size();
                req.newest = image.current();
                // After a dropped frame the back target holds uncommitted writes until the next commit.
                const bool fade = scheduler_.crossfading() && previous_valid_ && decision.blend_weight < 1.0f;
                req.previous = fade ? image.write_target() : TargetHandle{};
                req.blend_weight = fade ? decision.blend_weight : 1.0f;
                req.wrap = ml.wrap;
                req.filter = preset_.filter_mode;

                Status st = device_.present(req);
                if (!st.ok && result.ok) result = st;

                MonitorPresentation mp{};
                mp.monitor = ml.monitor;
                mp.canvas = ml.canvas;
                mp.dest = ml.dest;
                mp.source = ml.source;
                mp.blend_weight = req.blend_weight;
                mp.cross_faded = fade;
                out.monitors.push_back(std::move(mp));
            }
            Status end = device_.end_present();
            if (!end.ok && result.ok) result = end;
            return result;
        }

        void dump_failed_sources(const CompiledGraph& compiled) const
        {
            if (config_.shader_dump_dir.empty()) return;
            for (const Error& e : compiled.compile_errors())
            {
                std::optional<PassId> id = parse_pass_id(e.pass);
                if (!id) continue;
                const GraphPass* gp = compiled.graph().find(*id);
                if (!gp) continue;
                const std::string path = config_.shader_dump_dir + "/" + e.pass + ".frag";
                std::ofstream f(path, std::ios::out | std::ios::trunc);
                if (!f)
                {
                    log_warn("cannot write shader dump '" + path + "'");
                    continue;
                }
                f << assemble_fragment_source(compiled.graph(), *gp);
                log_info("failed shader source written to " + path);
            }
        }

        IGpuDevice& device_;
        RuntimeConfig config_{};
        TextureRegistry textures_;
        PassExecutor executor_;
        HotReloadCoordinator reload_{};
        LayoutResolver layout_{};
        TimeSource time_{};
        FrameScheduler scheduler_{};
        OverlayTimer overlay_{};
        KeyboardState keyboard_{};
        MouseState mouse_{};

        std::vector<MonitorInfo> monitors_{};
        Preset preset_{};
        bool loaded_ = false;
        bool uses_keyboard_ = false;
        // The Image back target holds the frame presented before the newest one.
        bool previous_valid_ = false;
        std::unique_ptr<CompiledGraph> compiled_{};
        std::vector<std::unique_ptr<RenderCanvas>> canvases_{};

        int consecutive_gpu_errors_ = 0;
        uint64_t dropped_frames_ = 0;
    };
}
