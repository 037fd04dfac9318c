#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "sbg/preset/preset.hpp"
#include "sbg/runtime/hot_reload.hpp"
#include "sbg/runtime/overlay.hpp"
#include "sbg/runtime/preset_watcher.hpp"
#include "sbg/runtime/wallpaper_runtime.hpp"

#include "fake_gpu_device.hpp"

namespace
{
    using namespace std::chrono_literals;

    const char* kPassCode = "void mainImage(out vec4 c, in vec2 f) { c = vec4(1.0); }";
    const char* kCubeCode = "void mainCubemap(out vec4 c, in vec2 f, in vec3 o, in vec3 d) { c = vec4(d, 1.0); }";

    bool approx_eq(double a, double b, double eps = 1e-4)
    {
        return std::abs(a - b) <= eps;
    }

    sbg::InputSpec buffer_input(const char* name)
    {
        sbg::InputSpec in{};
        in.type = sbg::InputType::Misc;
        in.name = name;
        return in;
    }

    std::vector<sbg::MonitorInfo> one_monitor()
    {
        return {sbg::MonitorInfo{"DP-1", sbg::IRect{0, 0, 100, 50}}};
    }

    std::vector<sbg::MonitorInfo> two_monitors()
    {
        return {
            sbg::MonitorInfo{"DP-1", sbg::IRect{0, 0, 100, 50}},
            sbg::MonitorInfo{"HDMI-1", sbg::IRect{100, 0, 60, 40}},
        };
    }

    // Buffer A feeds back into itself and is shown by Image.
    sbg::Preset feedback_preset()
    {
        sbg::Preset p{};
        p.name = "Feedback";
        p.author = "tester";
        p.pass(sbg::PassId::BufferA).shader = kPassCode;
        p.pass(sbg::PassId::BufferA).inputs[0] = buffer_input("Buffer A");
        p.pass(sbg::PassId::Image).shader = kPassCode;
        p.pass(sbg::PassId::Image).inputs[0] = buffer_input("Buffer A");
        return p;
    }

    std::filesystem::path temp_path(const char* name)
    {
        return std::filesystem::temp_directory_path() / name;
    }

    bool write_text(const std::filesystem::path& path, const std::string& text)
    {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f) return false;
        f << text;
        return (bool)f;
    }

    bool test_idle_until_loaded()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        if (!rt.set_monitors(one_monitor()).ok) return false;
        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
        if (!r.ok || r.value.rendered || r.value.state != sbg::SchedulerState::Idle) return false;
        return dev.draws.empty() && dev.presents.empty() && !rt.loaded();
    }

    bool test_frames_draw_in_order_and_ping_pong()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        if (!rt.load(feedback_preset()).ok) return false;
        if (dev.programs.size() != 2 || dev.targets.size() != 4) return false;

        for (int i = 0; i < 3; ++i)
        {
            sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
            if (!r.ok || !r.value.rendered || r.value.frame != (uint64_t)i) return false;
            if (r.value.monitors.size() != 1 || r.value.monitors[0].cross_faded) return false;
        }

        const std::vector<std::string> expect{"buffer_a", "image", "buffer_a", "image", "buffer_a", "image"};
        if (dev.draw_labels() != expect) return false;
        for (size_t i = 0; i < dev.draws.size(); ++i)
        {
            if (dev.draws[i].uniforms.frame != (int)(i / 2)) return false;
            if (dev.draws[i].uniforms.resolution != glm::vec3(100.0f, 50.0f, 1.0f)) return false;
            for (float t : dev.draws[i].uniforms.channel_time)
            {
                if (t != 0.0f) return false;
            }
        }
        if (!(dev.draws.back().uniforms.time > 0.0f)) return false;

        // Feedback reads the previous frame; Image reads what Buffer A wrote this frame.
        const sbg::DrawPassRequest& a0 = dev.draws[0];
        const sbg::DrawPassRequest& img0 = dev.draws[1];
        const sbg::DrawPassRequest& a1 = dev.draws[2];
        if (a0.channels[0].source != sbg::ChannelSource::Target) return false;
        if (a0.channels[0].target == a0.target) return false;
        if (img0.channels[0].target != a0.target) return false;
        if (a1.channels[0].target != a0.target || a1.target == a0.target) return false;

        if (dev.presents.size() != 3 || dev.surfaces.size() != 3) return false;
        if (dev.surfaces[0] != (sbg::IRect{0, 0, 100, 50})) return false;
        const sbg::PresentRequest& p0 = dev.presents[0];
        return p0.newest == img0.target && !p0.previous.valid() && p0.blend_weight == 1.0f
            && p0.image_size == glm::ivec2(100, 50);
    }

    bool test_cloned_canvases_render_independently()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(two_monitors());
        sbg::Preset p = feedback_preset();
        p.screen_bounds_policy = sbg::ScreenBoundsPolicy::Cloned;
        if (!rt.load(p).ok) return false;
        if (rt.canvas_count() != 2) return false;
        if (rt.canvas(1)->size() != glm::ivec2(60, 40)) return false;

        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
        if (!r.ok || r.value.monitors.size() != 2) return false;
        if (dev.draws.size() != 4 || dev.presents.size() != 2) return false;
        // Same clock for both canvases.
        if (dev.draws[0].uniforms.frame != 0 || dev.draws[2].uniforms.frame != 0) return false;
        if (dev.draws[3].uniforms.resolution != glm::vec3(60.0f, 40.0f, 1.0f)) return false;
        if (dev.draws[0].target == dev.draws[2].target) return false;
        // Each canvas knows where it sits on the desktop; HDMI-1 is 40 tall on a 50 tall desktop.
        if (dev.draws[1].uniforms.resolution_offset != glm::vec2(0.0f, 0.0f)) return false;
        if (dev.draws[3].uniforms.resolution_offset != glm::vec2(100.0f, 10.0f)) return false;
        return dev.presents[1].monitor == "HDMI-1" && dev.presents[1].newest == dev.draws[3].target;
    }

    bool test_resolution_scale_resizes_in_place()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        sbg::Preset p = feedback_preset();
        p.pass(sbg::PassId::CubeA).shader = kCubeCode;
        if (!rt.load(p).ok) return false;
        rt.tick(0.016);
        rt.tick(0.016);

        const sbg::CompiledGraph* graph_before = rt.compiled();
        const sbg::RenderCanvas* c = rt.canvas(0);
        const uint64_t gen_a = c->slot(sbg::PassId::BufferA).generation();
        const uint64_t gen_cube = c->slot(sbg::PassId::CubeA).generation();
        const glm::ivec2 before = c->size();

        if (!rt.set_resolution_scale(2.0).ok) return false;
        c = rt.canvas(0);
        const glm::ivec2 after = c->size();
        if ((long long)after.x * after.y != 4LL * before.x * before.y) return false;
        if (c->slot(sbg::PassId::BufferA).generation() != gen_a + 1) return false;
        if (c->slot(sbg::PassId::CubeA).generation() != gen_cube) return false;
        if (c->slot(sbg::PassId::CubeA).desc().width != sbg::kCubemapFaceResolution) return false;
        if (rt.compiled() != graph_before) return false;

        dev.draws.clear();
        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
        if (!r.ok || !r.value.rendered) return false;
        // The frame counter carries on across a resize.
        if (dev.draws.empty() || dev.draws[0].uniforms.frame != 2) return false;
        if (dev.draws[0].uniforms.resolution != glm::vec3(200.0f, 100.0f, 1.0f)) return false;

        sbg::Status bad = rt.set_resolution_scale(0.0);
        return !bad.ok && bad.error.kind == sbg::ErrorKind::Config && rt.canvas(0)->size() == after;
    }

    bool test_gpu_errors_drop_frames_then_escalate()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        if (!rt.load(feedback_preset()).ok) return false;

        dev.fail_draws = 2;
        for (int i = 0; i < 2; ++i)
        {
            sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
            if (!r.ok || !r.value.dropped || r.value.rendered) return false;
        }
        if (rt.consecutive_gpu_errors() != 2 || rt.dropped_frames() != 2) return false;
        // Dropped frames still present the last good image, without blending.
        if (dev.presents.size() != 2 || dev.presents[1].previous.valid() || dev.presents[1].blend_weight != 1.0f) return false;

        sbg::Result<sbg::PresentedFrame> ok = rt.tick(0.016);
        if (!ok.ok || !ok.value.rendered || rt.consecutive_gpu_errors() != 0) return false;
        // Failed frames were never committed, so the first good one is still frame 0.
        if (dev.draws.empty() || dev.draws[0].uniforms.frame != 0) return false;

        dev.fail_draws = 1000;
        for (int i = 0; i < 30; ++i)
        {
            if (!rt.tick(0.016).ok) return false;
        }
        sbg::Result<sbg::PresentedFrame> fatal = rt.tick(0.016);
        return !fatal.ok && fatal.error.kind == sbg::ErrorKind::RuntimeGpu
            && fatal.error.code == sbg::ErrorCode::GpuErrorThresholdExceeded;
    }

    bool test_compile_failure_uses_substitute()
    {
        const std::filesystem::path dump_dir = temp_path("sbg_runtime_tests_dump");
        std::error_code ec{};
        std::filesystem::create_directories(dump_dir, ec);
        if (ec) return false;

        sbg_test::FakeGpuDevice dev{};
        dev.fail_marker = "BROKEN";
        sbg::RuntimeConfig cfg{};
        cfg.shader_dump_dir = dump_dir.string();
        sbg::WallpaperRuntime rt(dev, nullptr, cfg);
        rt.set_monitors(one_monitor());

        sbg::Preset p = feedback_preset();
        p.pass(sbg::PassId::BufferA).shader = "void mainImage(out vec4 c, in vec2 f) { BROKEN }";
        if (!rt.load(p).ok) return false;

        const sbg::CompiledGraph* cg = rt.compiled();
        if (!cg || cg->compile_errors().size() != 1) return false;
        const sbg::Error& e = cg->compile_errors()[0];
        if (e.kind != sbg::ErrorKind::Compile || e.pass != "buffer_a" || e.line != 3) return false;
        if (!cg->passes()[0].fallback || cg->passes()[1].fallback) return false;
        if (!rt.tick(0.016).ok) return false;

        std::ifstream f(dump_dir / "buffer_a.frag");
        const std::string dumped((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        std::filesystem::remove_all(dump_dir, ec);
        return dumped.find("BROKEN") != std::string::npos;
    }

    bool test_failed_load_keeps_running_graph()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        if (!rt.load(feedback_preset()).ok) return false;
        const sbg::CompiledGraph* before = rt.compiled();

        sbg::Preset cyclic{};
        cyclic.name = "Cyclic";
        cyclic.pass(sbg::PassId::BufferA).shader = kPassCode;
        cyclic.pass(sbg::PassId::BufferB).shader = kPassCode;
        sbg::InputSpec a_cur = buffer_input("Buffer B");
        a_cur.frame = sbg::FrameSelect::Current;
        sbg::InputSpec b_cur = buffer_input("Buffer A");
        b_cur.frame = sbg::FrameSelect::Current;
        cyclic.pass(sbg::PassId::BufferA).inputs[0] = a_cur;
        cyclic.pass(sbg::PassId::BufferB).inputs[0] = b_cur;
        sbg::Status st = rt.load(cyclic);
        if (st.ok || st.error.kind != sbg::ErrorKind::Build) return false;
        if (rt.compiled() != before || rt.preset().name != "Feedback") return false;

        dev.fail_target_allocation = true;
        sbg::Preset other = feedback_preset();
        other.name = "Other";
        st = rt.load(other);
        if (st.ok || st.error.kind != sbg::ErrorKind::RuntimeGpu) return false;
        dev.fail_target_allocation = false;
        if (rt.compiled() != before || rt.preset().name != "Feedback") return false;

        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
        return r.ok && r.value.rendered;
    }

    bool test_crossfade_presents_previous_image()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        sbg::Preset p = feedback_preset();
        p.interval_between_frames = std::chrono::duration_cast<sbg::Duration>(2s);
        p.crossfade_overlap_ratio = 0.5;
        if (!rt.load(p).ok) return false;

        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.0);
        if (!r.ok || !r.value.rendered) return false;

        r = rt.tick(1.25);
        if (!r.ok || r.value.rendered || r.value.state != sbg::SchedulerState::Holding) return false;
        if (!approx_eq(r.value.blend_weight, 0.25)) return false;
        const sbg::PresentRequest& held = dev.presents.back();
        const sbg::ResourceSlot& image = rt.canvas(0)->slot(sbg::PassId::Image);
        if (held.newest != image.current() || held.previous != image.write_target()) return false;
        if (!approx_eq(held.blend_weight, 0.25) || !r.value.monitors[0].cross_faded) return false;
        if (dev.draws.size() != 2) return false;

        r = rt.tick(0.75);
        if (!r.ok || !r.value.rendered || r.value.frame != 1) return false;
        return dev.draws.size() == 4 && approx_eq(dev.presents.back().blend_weight, 0.0);
    }

    bool test_keyboard_texture_uploaded_when_bound()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        sbg::Preset p{};
        p.pass(sbg::PassId::Image).shader = kPassCode;
        sbg::InputSpec kb{};
        kb.type = sbg::InputType::Keyboard;
        p.pass(sbg::PassId::Image).inputs[1] = kb;
        if (!rt.load(p).ok) return false;

        rt.keyboard().key_down(65);
        if (!rt.tick(0.016).ok) return false;

        const sbg::ChannelBinding& ch = dev.draws.back().channels[1];
        if (ch.source != sbg::ChannelSource::Texture || ch.filter != sbg::FilterMode::Nearest) return false;
        auto it = dev.textures.find(ch.texture.id);
        if (it == dev.textures.end()) return false;
        const sbg_test::FakeGpuDevice::TextureRecord& tex = it->second;
        if (tex.desc.width != 256 || tex.desc.height != 3 || tex.desc.channels != 1) return false;
        if (tex.updates != 1 || tex.pixels.size() != 768) return false;
        return tex.pixels[65] == 255 && tex.pixels[256 + 65] == 255 && tex.pixels[66] == 0;
    }

    bool test_textures_flip_and_placeholder()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg_test::FakeAssetProvider assets{};
        assets.missing.insert("missing-file.png");
        sbg::WallpaperRuntime rt(dev, &assets);
        rt.set_monitors(one_monitor());

        sbg::Preset p{};
        p.pass(sbg::PassId::Image).shader = kPassCode;
        sbg::InputSpec flipped{};
        flipped.type = sbg::InputType::Texture;
        flipped.name = "Abstract 1";
        flipped.vflip = true;
        sbg::InputSpec missing{};
        missing.type = sbg::InputType::Texture;
        missing.name = "missing-file.png";
        p.pass(sbg::PassId::Image).inputs[0] = flipped;
        p.pass(sbg::PassId::Image).inputs[1] = missing;
        if (!rt.load(p).ok) return false;

        if (rt.textures().size() != 2 || dev.textures.size() != 2) return false;
        if (assets.requests.size() != 2) return false;
        for (const sbg::AssetRequest& req : assets.requests)
        {
            if (req.name == "Abstract 1" && !req.predefined) return false;
            if (req.name == "missing-file.png" && (req.predefined || req.location != "missing-file.png")) return false;
        }

        const sbg::RegisteredTexture* a = rt.textures().find(flipped);
        const sbg::RegisteredTexture* m = rt.textures().find(missing);
        if (!a || !m || a->placeholder || !m->placeholder) return false;
        // The file's bottom row comes first after the flip.
        if (dev.textures[a->handle.id].pixels[0] != 0x55) return false;
        if (m->resolution != glm::vec3(1.0f, 1.0f, 1.0f)) return false;

        // Same textures are reused; unreferenced ones are released.
        if (!rt.load(p).ok || assets.requests.size() != 2) return false;
        sbg::Preset plain{};
        plain.pass(sbg::PassId::Image).shader = kPassCode;
        if (!rt.load(plain).ok) return false;
        return rt.textures().size() == 0 && dev.textures.empty();
    }

    bool test_monitor_hotplug_rebuilds_canvases()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        sbg::Preset p = feedback_preset();
        p.screen_bounds_policy = sbg::ScreenBoundsPolicy::Cloned;
        if (!rt.load(p).ok || rt.canvas_count() != 1) return false;
        rt.tick(0.016);

        if (!rt.set_monitors(two_monitors()).ok) return false;
        if (rt.canvas_count() != 2 || rt.layout().monitors.size() != 2) return false;

        // Geometry change with the same monitor count resizes in place.
        std::vector<sbg::MonitorInfo> moved = two_monitors();
        moved[1].geometry = sbg::IRect{100, 0, 80, 40};
        if (!rt.set_monitors(moved).ok) return false;
        if (rt.canvas_count() != 2 || rt.canvas(1)->size() != glm::ivec2(80, 40)) return false;

        // An unchanged layout leaves the canvases alone.
        const int created = dev.targets_created;
        if (!rt.set_monitors(moved).ok || dev.targets_created != created) return false;

        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
        return r.ok && r.value.monitors.size() == 2 && dev.surfaces.back() == (sbg::IRect{0, 0, 180, 50});
    }

    bool test_selected_monitor_presents_in_place()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(two_monitors());
        sbg::Preset p = feedback_preset();
        p.screen_bounds_policy = sbg::ScreenBoundsPolicy::SelectionMonitors;
        p.monitor_selection = {"HDMI-1"};
        if (!rt.load(p).ok || rt.canvas_count() != 1) return false;
        if (rt.canvas(0)->size() != glm::ivec2(60, 40)) return false;

        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
        if (!r.ok || !r.value.rendered || r.value.monitors.size() != 1) return false;

        // The surface spans both monitors, so HDMI-1 lands right of DP-1, not at the origin.
        if (dev.surfaces.size() != 1 || dev.surfaces[0] != (sbg::IRect{0, 0, 160, 50})) return false;
        if (dev.presents.size() != 1) return false;
        const sbg::PresentRequest& pr = dev.presents[0];
        if (pr.monitor != "HDMI-1" || pr.surface != (sbg::IRect{0, 0, 160, 50})) return false;
        if (pr.viewport != (sbg::IRect{100, 0, 60, 40}) || pr.dest != (sbg::IRect{100, 0, 60, 40})) return false;
        if (pr.source != (sbg::FRect{0.0, 0.0, 60.0, 40.0})) return false;

        if (dev.draws.size() != 2) return false;
        for (const sbg::DrawPassRequest& d : dev.draws)
        {
            if (d.uniforms.resolution_offset != glm::vec2(100.0f, 10.0f)) return false;
        }
        return true;
    }

    bool test_dropped_frame_mid_crossfade()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(two_monitors());
        sbg::Preset p = feedback_preset();
        p.screen_bounds_policy = sbg::ScreenBoundsPolicy::Cloned;
        p.interval_between_frames = std::chrono::duration_cast<sbg::Duration>(2s);
        p.crossfade_overlap_ratio = 0.5;
        if (!rt.load(p).ok) return false;

        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.0);
        if (!r.ok || !r.value.rendered || dev.draws.size() != 4) return false;
        const sbg::TargetHandle committed = dev.draws[1].target;
        r = rt.tick(1.25);
        if (!r.ok || r.value.rendered || !r.value.monitors[0].cross_faded) return false;

        // Canvas 0 draws both passes into its back targets, then canvas 1 fails.
        rt.mouse().move_to(10.0, 10.0);
        rt.mouse().set_button(true);
        dev.fail_draws = 1;
        dev.fail_after_draws = 2;
        r = rt.tick(0.75);
        if (!r.ok || !r.value.dropped || r.value.rendered || dev.draws.size() != 6) return false;
        const sbg::TargetHandle scribbled = dev.draws[5].target;
        if (r.value.frame != 0) return false;

        // Until the next commit nothing blends with the half written back target.
        const size_t presents_before = dev.presents.size();
        r = rt.tick(1.25);
        if (!r.ok || r.value.rendered || r.value.state != sbg::SchedulerState::Holding) return false;
        for (size_t i = presents_before - 2; i < dev.presents.size(); ++i)
        {
            const sbg::PresentRequest& pr = dev.presents[i];
            if (pr.previous.valid() || pr.blend_weight != 1.0f) return false;
        }
        if (dev.presents[presents_before].newest != committed) return false;
        if (dev.presents[presents_before].newest == scribbled) return false;
        if (r.value.monitors[0].cross_faded) return false;

        // The next good frame is frame 1, covers the dropped frame's time and still sees the click.
        r = rt.tick(0.75);
        if (!r.ok || !r.value.rendered || r.value.frame != 1) return false;
        if (dev.draws.size() != 10) return false;
        const sbg::DrawPassRequest& next = dev.draws[6];
        if (next.uniforms.frame != 1 || !approx_eq(next.uniforms.time_delta, 4.0)) return false;
        if (!(next.uniforms.mouse.w > 0.0f)) return false;
        const sbg::PresentRequest& faded = dev.presents.back();
        return faded.previous.valid() && approx_eq(faded.blend_weight, 0.0);
    }

    bool test_failed_relayout_keeps_canvases()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        sbg::Preset p = feedback_preset();
        p.screen_bounds_policy = sbg::ScreenBoundsPolicy::Cloned;
        if (!rt.load(p).ok || rt.canvas_count() != 1) return false;
        if (!rt.tick(0.016).ok) return false;

        dev.fail_target_allocation = true;
        sbg::Status st = rt.set_monitors(two_monitors());
        if (st.ok || st.error.kind != sbg::ErrorKind::RuntimeGpu) return false;
        if (rt.canvas_count() != 1 || rt.layout().canvases.size() != 1) return false;

        const size_t draws_before = dev.draws.size();
        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
        if (!r.ok || !r.value.rendered || r.value.monitors.size() != 1) return false;
        if (dev.draws.size() != draws_before + 2) return false;

        // The same monitor set applies once allocation works again.
        dev.fail_target_allocation = false;
        if (!rt.set_monitors(two_monitors()).ok) return false;
        if (rt.canvas_count() != 2 || rt.layout().monitors.size() != 2) return false;

        // A failed rescale keeps the old size and scale.
        dev.fail_target_allocation = true;
        if (rt.set_resolution_scale(0.5).ok) return false;
        dev.fail_target_allocation = false;
        return rt.preset().resolution_scale == 1.0 && rt.canvas(0)->size() == glm::ivec2(100, 50);
    }

    bool test_failed_load_releases_its_textures()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg_test::FakeAssetProvider assets{};
        sbg::WallpaperRuntime rt(dev, &assets);
        rt.set_monitors(one_monitor());

        sbg::Preset p{};
        p.pass(sbg::PassId::Image).shader = kPassCode;
        sbg::InputSpec tex{};
        tex.type = sbg::InputType::Texture;
        tex.name = "Abstract 1";
        p.pass(sbg::PassId::Image).inputs[0] = tex;

        dev.fail_target_allocation = true;
        sbg::Status st = rt.load(p);
        if (st.ok || rt.loaded()) return false;
        if (rt.textures().size() != 0 || !dev.textures.empty()) return false;

        dev.fail_target_allocation = false;
        if (!rt.load(p).ok || rt.textures().size() != 1) return false;

        // A failed reload releases only what it added.
        sbg::Preset other = p;
        sbg::InputSpec tex2 = tex;
        tex2.name = "Abstract 2";
        other.pass(sbg::PassId::Image).inputs[1] = tex2;
        dev.fail_target_allocation = true;
        if (rt.load(other).ok) return false;
        dev.fail_target_allocation = false;
        return rt.textures().size() == 1 && rt.textures().find(tex) && !rt.textures().find(tex2)
            && dev.textures.size() == 1;
    }

    bool test_runtime_loads_default_preset_file()
    {
        const std::filesystem::path path = temp_path("sbg_runtime_tests_defaults.toml");
        if (!write_text(path, "")) return false;

        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        rt.notify_preset_changed(path.string());
        sbg::Result<sbg::PresentedFrame> r = rt.tick(0.016);
        std::error_code ec{};
        std::filesystem::remove(path, ec);

        // A file that matches the defaults is still the first preset.
        if (!r.ok || !rt.loaded() || !(rt.preset() == sbg::Preset{})) return false;
        return r.value.rendered && dev.draws.size() == 1;
    }

    bool test_reload_coordinator()
    {
        std::vector<std::string> loaded_paths{};
        sbg::HotReloadCoordinator reload([&](const std::string& path) -> sbg::Result<sbg::Preset>
        {
            loaded_paths.push_back(path);
            if (path == "broken.toml")
            {
                return sbg::Result<sbg::Preset>::failure(sbg::make_error(
                    sbg::ErrorKind::Config, sbg::ErrorCode::TomlParse, "expected value", "", 2));
            }
            sbg::Preset p{};
            p.name = path;
            return sbg::Result<sbg::Preset>::success(p);
        });

        int applied = 0;
        std::string applied_name{};
        auto apply = [&](const sbg::Preset& p)
        {
            ++applied;
            applied_name = p.name;
            return sbg::Status::success();
        };

        sbg::Preset current{};
        current.name = "same.toml";
        if (reload.process_pending(&current, apply) != sbg::ReloadOutcome::NothingPending) return false;

        // Only the newest pending path is loaded.
        reload.notify_preset_changed("first.toml");
        reload.notify_preset_changed("second.toml");
        if (reload.superseded_count() != 1 || !reload.has_pending()) return false;
        if (reload.process_pending(&current, apply) != sbg::ReloadOutcome::Applied) return false;
        if (applied != 1 || applied_name != "second.toml") return false;
        if (loaded_paths != std::vector<std::string>{"second.toml"}) return false;
        if (reload.has_pending()) return false;

        reload.notify_preset_changed("same.toml");
        if (reload.process_pending(&current, apply) != sbg::ReloadOutcome::Unchanged || applied != 1) return false;

        reload.notify_preset_changed("broken.toml");
        if (reload.process_pending(&current, apply) != sbg::ReloadOutcome::Failed || applied != 1) return false;
        if (!reload.last_error() || reload.last_error()->code != sbg::ErrorCode::TomlParse) return false;

        auto reject = [](const sbg::Preset&)
        {
            return sbg::Status::failure(sbg::make_error(sbg::ErrorKind::Build, sbg::ErrorCode::CyclicCurrentFrameDependency, "cycle"));
        };
        reload.notify_preset_changed("third.toml");
        if (reload.process_pending(&current, reject) != sbg::ReloadOutcome::Failed) return false;
        if (!reload.last_error() || reload.last_error()->kind != sbg::ErrorKind::Build) return false;

        // With nothing loaded yet, even a preset equal to the current one is applied.
        reload.notify_preset_changed("same.toml");
        if (reload.process_pending(nullptr, apply) != sbg::ReloadOutcome::Applied) return false;
        return applied == 2 && applied_name == "same.toml";
    }

    bool test_runtime_reloads_preset_file()
    {
        const std::filesystem::path path = temp_path("sbg_runtime_tests_reload.toml");
        const std::string first =
            "name = \"First\"\n"
            "[image]\n"
            "shader = \"void mainImage(out vec4 c, in vec2 f) { c = vec4(1.0); }\"\n";
        const std::string second =
            "name = \"Second\"\n"
            "[buffer_a]\n"
            "shader = \"void mainImage(out vec4 c, in vec2 f) { c = vec4(0.5); }\"\n"
            "[image]\n"
            "shader = \"void mainImage(out vec4 c, in vec2 f) { c = texture(iChannel0, f); }\"\n"
            "[image.input_0]\n"
            "type = \"misc\"\n"
            "name = \"Buffer A\"\n";
        const std::string broken = "name = \"Broken\"\nresolution_scale = -1.0\n";

        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        if (!write_text(path, first) || !rt.load_file(path.string()).ok) return false;
        if (rt.preset().name != "First" || rt.compiled()->passes().size() != 1) return false;
        rt.tick(0.016);
        rt.tick(0.016);

        if (!write_text(path, second)) return false;
        rt.notify_preset_changed(path.string());
        dev.draws.clear();
        if (!rt.tick(0.016).ok) return false;
        if (rt.preset().name != "Second" || rt.compiled()->passes().size() != 2) return false;
        // A new graph starts again at frame 0.
        if (dev.draws.empty() || dev.draws[0].uniforms.frame != 0) return false;

        if (!write_text(path, broken)) return false;
        rt.notify_preset_changed(path.string());
        if (!rt.tick(0.016).ok) return false;
        std::error_code ec{};
        std::filesystem::remove(path, ec);
        if (rt.preset().name != "Second") return false;
        return rt.reload().last_error() && rt.reload().last_error()->kind == sbg::ErrorKind::Config;
    }

    bool test_watcher_detects_modification()
    {
        const std::filesystem::path path = temp_path("sbg_runtime_tests_watch.toml");
        if (!write_text(path, "name = \"w\"\n")) return false;

        std::vector<std::string> seen{};
        sbg::PresetWatcher watcher(path.string(), [&](const std::string& p) { seen.push_back(p); });
        if (watcher.poll_once() || !seen.empty()) return false;

        std::error_code ec{};
        const auto t = std::filesystem::last_write_time(path, ec);
        if (ec) return false;
        std::filesystem::last_write_time(path, t + 5s, ec);
        if (ec) return false;
        if (!watcher.poll_once() || seen.size() != 1 || seen[0] != path.string()) return false;
        if (watcher.poll_once() || seen.size() != 1) return false;

        std::filesystem::remove(path, ec);
        sbg::PresetWatcher missing(path.string(), [&](const std::string& p) { seen.push_back(p); });
        return !missing.poll_once() && seen.size() == 1;
    }

    bool test_watcher_reports_each_change_once()
    {
        const std::filesystem::path path = temp_path("sbg_runtime_tests_watch_shared.toml");
        if (!write_text(path, "name = \"w\"\n")) return false;

        std::atomic<int> reported{0};
        sbg::PresetWatcher watcher(path.string(), [&](const std::string&) { ++reported; }, std::chrono::milliseconds(1));
        watcher.start();

        std::error_code ec{};
        const auto t = std::filesystem::last_write_time(path, ec);
        if (ec) return false;
        std::filesystem::last_write_time(path, t + 5s, ec);
        if (ec) return false;

        // Polled from this thread and the worker at once.
        int reported_here = 0;
        for (int i = 0; i < 50; ++i)
        {
            if (watcher.poll_once()) ++reported_here;
            std::this_thread::sleep_for(1ms);
        }
        watcher.stop();
        std::filesystem::remove(path, ec);
        return reported.load() == 1 && reported_here <= 1;
    }

    bool test_overlay_fades_after_load()
    {
        sbg::OverlayTimer t{};
        if (t.current()) return false;
        t.arm("Plasma", "someone");
        if (!t.current() || t.current()->opacity != 1.0f) return false;
        t.advance(10.0);
        if (!t.current() || t.current()->opacity != 1.0f) return false;
        t.advance(1.0);
        if (!t.current() || !approx_eq(t.current()->opacity, 0.5)) return false;
        t.advance(1.0);
        if (t.current()) return false;
        t.arm("", "");
        if (t.current()) return false;

        sbg_test::FakeGpuDevice dev{};
        sbg::WallpaperRuntime rt(dev, nullptr);
        rt.set_monitors(one_monitor());
        if (!rt.load(feedback_preset()).ok) return false;
        const std::optional<sbg::OverlayInfo> o = rt.overlay();
        if (!o || o->name != "Feedback" || o->author != "tester") return false;

        sbg::RuntimeConfig quiet{};
        quiet.overlay_enabled = false;
        sbg::WallpaperRuntime rt2(dev, nullptr, quiet);
        rt2.set_monitors(one_monitor());
        return rt2.load(feedback_preset()).ok && !rt2.overlay();
    }
}

int main()
{
    const bool ok_idle = test_idle_until_loaded();
    const bool ok_order = test_frames_draw_in_order_and_ping_pong();
    const bool ok_cloned = test_cloned_canvases_render_independently();
    const bool ok_scale = test_resolution_scale_resizes_in_place();
    const bool ok_gpu = test_gpu_errors_drop_frames_then_escalate();
    const bool ok_compile = test_compile_failure_uses_substitute();
    const bool ok_failed_load = test_failed_load_keeps_running_graph();
    const bool ok_fade = test_crossfade_presents_previous_image();
    const bool ok_keyboard = test_keyboard_texture_uploaded_when_bound();
    const bool ok_textures = test_textures_flip_and_placeholder();
    const bool ok_hotplug = test_monitor_hotplug_rebuilds_canvases();
    const bool ok_reload = test_reload_coordinator();
    const bool ok_reload_file = test_runtime_reloads_preset_file();
    const bool ok_watcher = test_watcher_detects_modification();
    const bool ok_overlay = test_overlay_fades_after_load();
    const bool ok_selected = test_selected_monitor_presents_in_place();
    const bool ok_dropped_fade = test_dropped_frame_mid_crossfade();
    const bool ok_relayout = test_failed_relayout_keeps_canvases();
    const bool ok_load_textures = test_failed_load_releases_its_textures();
    const bool ok_default_file = test_runtime_loads_default_preset_file();
    const bool ok_watcher_shared = test_watcher_reports_each_change_once();

    if (!ok_idle) std::fprintf(stderr, "[runtime-tests] idle before load failed\n");
    if (!ok_order) std::fprintf(stderr, "[runtime-tests] pass order/ping-pong failed\n");
    if (!ok_cloned) std::fprintf(stderr, "[runtime-tests] cloned canvases failed\n");
    if (!ok_scale) std::fprintf(stderr, "[runtime-tests] resolution scale resize failed\n");
    if (!ok_gpu) std::fprintf(stderr, "[runtime-tests] GPU error handling failed\n");
    if (!ok_compile) std::fprintf(stderr, "[runtime-tests] compile substitute failed\n");
    if (!ok_failed_load) std::fprintf(stderr, "[runtime-tests] failed load rollback failed\n");
    if (!ok_fade) std::fprintf(stderr, "[runtime-tests] crossfade present failed\n");
    if (!ok_keyboard) std::fprintf(stderr, "[runtime-tests] keyboard texture failed\n");
    if (!ok_textures) std::fprintf(stderr, "[runtime-tests] texture registry failed\n");
    if (!ok_hotplug) std::fprintf(stderr, "[runtime-tests] monitor hotplug failed\n");
    if (!ok_reload) std::fprintf(stderr, "[runtime-tests] reload coordinator failed\n");
    if (!ok_reload_file) std::fprintf(stderr, "[runtime-tests] preset file reload failed\n");
    if (!ok_watcher) std::fprintf(stderr, "[runtime-tests] preset watcher failed\n");
    if (!ok_overlay) std::fprintf(stderr, "[runtime-tests] overlay timer failed\n");
    if (!ok_selected) std::fprintf(stderr, "[runtime-tests] selected monitor present failed\n");
    if (!ok_dropped_fade) std::fprintf(stderr, "[runtime-tests] dropped frame during crossfade failed\n");
    if (!ok_relayout) std::fprintf(stderr, "[runtime-tests] failed relayout rollback failed\n");
    if (!ok_load_textures) std::fprintf(stderr, "[runtime-tests] failed load texture release failed\n");
    if (!ok_default_file) std::fprintf(stderr, "[runtime-tests] default preset file load failed\n");
    if (!ok_watcher_shared) std::fprintf(stderr, "[runtime-tests] shared watcher polling failed\n");

    if (!(ok_idle && ok_order && ok_cloned && ok_scale && ok_gpu && ok_compile && ok_failed_load && ok_fade
          && ok_keyboard && ok_textures && ok_hotplug && ok_reload && ok_reload_file && ok_watcher && ok_overlay
          && ok_selected && ok_dropped_fade && ok_relayout && ok_load_textures && ok_default_file && ok_watcher_shared)) return 1;
    std::fprintf(stderr, "[runtime-tests] all tests passed\n");
    return 0;
}
