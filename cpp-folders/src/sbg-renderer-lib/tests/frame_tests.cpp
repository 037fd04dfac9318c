#include <chrono>
#include <cmath>
#include <cstdio>

#include "sbg/frame/frame_scheduler.hpp"
#include "sbg/frame/time_source.hpp"
#include "sbg/gfx/resource_slot.hpp"
#include "sbg/input/keyboard_state.hpp"
#include "sbg/input/mouse_state.hpp"

#include "fake_gpu_device.hpp"

namespace
{
    using namespace std::chrono_literals;

    bool approx_eq(double a, double b, double eps = 1e-4)
    {
        return std::abs(a - b) <= eps;
    }

    bool test_frame_counter_starts_at_zero_once()
    {
        sbg::TimeSource ts{};
        ts.configure(1.0, sbg::Duration::zero());
        ts.reset();

        for (uint64_t expect = 0; expect < 5; ++expect)
        {
            ts.advance_wall(0.016);
            const sbg::TimeState& s = ts.begin_frame();
            if (s.frame != expect) return false;
            ts.end_frame();
        }

        // A frame that is started but not committed does not advance iFrame.
        ts.advance_wall(0.016);
        if (ts.begin_frame().frame != 5) return false;
        ts.advance_wall(0.016);
        if (ts.begin_frame().frame != 5) return false;
        ts.end_frame();

        ts.reset();
        ts.advance_wall(0.016);
        return ts.begin_frame().frame == 0;
    }

    bool test_time_scale_and_offset()
    {
        sbg::TimeSource ts{};
        ts.configure(2.0, std::chrono::duration_cast<sbg::Duration>(10s));
        ts.reset();
        if (!approx_eq(ts.state().time, 10.0)) return false;

        ts.advance_wall(0.5);
        const sbg::TimeState& s1 = ts.begin_frame();
        if (!approx_eq(s1.time, 11.0) || !approx_eq(s1.time_delta, 1.0)) return false;
        ts.end_frame();

        // Held ticks accumulate into the next rendered frame's delta.
        ts.advance_wall(0.25);
        ts.advance_wall(0.25);
        const sbg::TimeState& s2 = ts.begin_frame();
        if (!approx_eq(s2.time, 12.0) || !approx_eq(s2.time_delta, 1.0)) return false;
        ts.end_frame();

        sbg::TimeSource frozen{};
        frozen.configure(0.0, sbg::Duration::zero());
        frozen.reset();
        frozen.advance_wall(3.0);
        return approx_eq(frozen.begin_frame().time, 0.0);
    }

    bool test_frame_rate_smoothing()
    {
        sbg::TimeSource ts{};
        ts.configure(1.0, sbg::Duration::zero());
        ts.reset();
        for (int i = 0; i < 30; ++i)
        {
            ts.advance_wall(0.1);
            ts.begin_frame();
            ts.end_frame();
        }
        ts.advance_wall(0.1);
        return approx_eq(ts.begin_frame().frame_rate, 10.0, 0.05);
    }

    bool test_zero_interval_always_renders()
    {
        sbg::FrameScheduler s{};
        s.configure(sbg::Duration::zero(), 0.5);
        s.reset();
        for (int i = 0; i < 100; ++i)
        {
            const sbg::ScheduleDecision d = s.tick(i % 3 == 0 ? 0.0 : 0.016);
            if (!d.render || d.state != sbg::SchedulerState::Rendering) return false;
            if (d.blend_weight != 1.0f) return false;
        }
        return !s.crossfading();
    }

    bool test_interval_crossfade_window()
    {
        sbg::FrameScheduler s{};
        s.configure(std::chrono::duration_cast<sbg::Duration>(2s), 0.5);
        s.reset();
        if (s.state() != sbg::SchedulerState::Idle) return false;

        sbg::ScheduleDecision d = s.tick(0.0);
        if (!d.render || !approx_eq(d.blend_weight, 0.0)) return false;

        // First half of the interval: held, previous frame fully shown.
        const double holds[] = {0.25, 0.25, 0.25, 0.25};
        for (double dt : holds)
        {
            d = s.tick(dt);
            if (d.render || d.state != sbg::SchedulerState::Holding) return false;
            if (!approx_eq(d.blend_weight, 0.0)) return false;
        }

        // Final second: linear ramp.
        d = s.tick(0.25);
        if (d.render || !approx_eq(d.blend_weight, 0.25)) return false;
        d = s.tick(0.25);
        if (!approx_eq(d.blend_weight, 0.5)) return false;
        d = s.tick(0.25);
        if (!approx_eq(d.blend_weight, 0.75)) return false;

        // Interval end: next frame is rendered and the fade restarts.
        d = s.tick(0.25);
        if (!d.render || d.state != sbg::SchedulerState::Rendering) return false;
        if (!approx_eq(d.blend_weight, 0.0)) return false;

        if (!approx_eq(sbg::crossfade_weight(2.0, 2.0, 0.5), 1.0)) return false;
        if (!approx_eq(sbg::crossfade_weight(1.0, 2.0, 0.5), 0.0)) return false;
        if (!approx_eq(sbg::crossfade_weight(0.0, 2.0, 0.5), 0.0)) return false;
        return approx_eq(sbg::crossfade_weight(1.0, 2.0, 0.0), 1.0);
    }

    bool test_stall_restarts_phase()
    {
        sbg::FrameScheduler s{};
        s.configure(std::chrono::duration_cast<sbg::Duration>(1s), 0.0);
        s.reset();
        s.tick(0.0);
        const sbg::ScheduleDecision d = s.tick(5.0);
        if (!d.render) return false;
        if (!approx_eq(s.elapsed_in_interval(), 0.0)) return false;
        return s.tick(0.5).state == sbg::SchedulerState::Holding;
    }

    bool test_resource_slot_ping_pong()
    {
        sbg_test::FakeGpuDevice dev{};
        sbg::ResourceSlot slot{};
        sbg::RenderTargetDesc d{};
        d.width = 64;
        d.height = 32;
        d.format = sbg::TargetFormat::RGBA32F;
        d.label = "buffer_a";
        if (!slot.allocate(dev, d).ok) return false;
        if (dev.targets.size() != 2) return false;
        for (const auto& [id, t] : dev.targets)
        {
            if (t.clears != 1) return false;
        }

        const sbg::TargetHandle front = slot.current();
        const sbg::TargetHandle back = slot.write_target();
        if (front == back) return false;
        slot.commit();
        if (slot.current() != back || slot.write_target() != front) return false;

        const uint64_t gen = slot.generation();
        if (!slot.resize(64, 32).ok || slot.generation() != gen) return false;
        if (!slot.resize(128, 64).ok || slot.generation() != gen + 1) return false;
        if (dev.targets.size() != 2 || dev.targets_created != 4) return false;
        if (slot.resolution() != glm::vec3(128.0f, 64.0f, 1.0f)) return false;

        sbg::ResourceSlot moved = std::move(slot);
        if (slot.allocated() || !moved.allocated()) return false;
        moved.release();
        return dev.targets.empty();
    }

    bool test_slot_allocation_failure()
    {
        sbg_test::FakeGpuDevice dev{};
        dev.fail_target_allocation = true;
        sbg::ResourceSlot slot{};
        sbg::Status st = slot.allocate(dev, sbg::RenderTargetDesc{});
        return !st.ok && st.error.kind == sbg::ErrorKind::RuntimeGpu
            && st.error.code == sbg::ErrorCode::ResourceAllocationFailed && !slot.allocated();
    }

    bool test_keyboard_texture_rows()
    {
        sbg::KeyboardState kb{};
        kb.key_down(65);
        kb.key_down(65);
        sbg::KeyboardTexels t = kb.take_frame();
        if (t[65] != 255 || t[256 + 65] != 255 || t[512 + 65] != 255) return false;

        t = kb.take_frame();
        if (t[65] != 255 || t[256 + 65] != 0 || t[512 + 65] != 255) return false;

        kb.key_up(65);
        t = kb.snapshot();
        if (t[65] != 0 || t[512 + 65] != 255) return false;

        kb.key_down(65);
        kb.key_down(32);
        kb.release_all();
        t = kb.snapshot();
        if (t[65] != 0 || t[32] != 0) return false;
        if (t[512 + 65] != 0 || t[512 + 32] != 255) return false;

        kb.key_down(0);
        kb.key_down(300);
        return true;
    }

    bool test_mouse_uniform()
    {
        const sbg::IRect bounds{0, 0, 200, 100};
        const glm::ivec2 size(200, 100);
        sbg::MouseState m{};
        m.move_to(100.0, 50.0);
        if (sbg::shadertoy_mouse(m.snapshot(), bounds, size) != glm::vec4(0.0f)) return false;

        m.move_to(100.0, 25.0);
        m.set_button(true);
        glm::vec4 u = sbg::shadertoy_mouse(m.take_frame(), bounds, size);
        if (u != glm::vec4(100.0f, 75.0f, 100.0f, 75.0f)) return false;

        m.move_to(150.0, 25.0);
        u = sbg::shadertoy_mouse(m.take_frame(), bounds, size);
        if (u != glm::vec4(150.0f, 75.0f, 100.0f, -75.0f)) return false;

        m.set_button(false);
        m.move_to(10.0, 10.0);
        u = sbg::shadertoy_mouse(m.take_frame(), bounds, size);
        if (u != glm::vec4(150.0f, 75.0f, -100.0f, -75.0f)) return false;

        // Half-resolution canvas over an offset desktop.
        const glm::vec2 p = sbg::desktop_to_canvas(glm::dvec2(1920.0 + 960.0, 540.0), sbg::IRect{1920, 0, 1920, 1080}, glm::ivec2(960, 540));
        return p == glm::vec2(480.0f, 270.0f);
    }
}

int main()
{
    const bool ok_frame = test_frame_counter_starts_at_zero_once();
    const bool ok_time = test_time_scale_and_offset();
    const bool ok_rate = test_frame_rate_smoothing();
    const bool ok_zero = test_zero_interval_always_renders();
    const bool ok_fade = test_interval_crossfade_window();
    const bool ok_stall = test_stall_restarts_phase();
    const bool ok_slot = test_resource_slot_ping_pong();
    const bool ok_slot_fail = test_slot_allocation_failure();
    const bool ok_keyboard = test_keyboard_texture_rows();
    const bool ok_mouse = test_mouse_uniform();

    if (!ok_frame) std::fprintf(stderr, "[frame-tests] iFrame sequence failed\n");
    if (!ok_time) std::fprintf(stderr, "[frame-tests] time scale/offset failed\n");
    if (!ok_rate) std::fprintf(stderr, "[frame-tests] frame rate smoothing failed\n");
    if (!ok_zero) std::fprintf(stderr, "[frame-tests] zero interval scheduling failed\n");
    if (!ok_fade) std::fprintf(stderr, "[frame-tests] crossfade window failed\n");
    if (!ok_stall) std::fprintf(stderr, "[frame-tests] stalled interval failed\n");
    if (!ok_slot) std::fprintf(stderr, "[frame-tests] resource slot ping-pong failed\n");
    if (!ok_slot_fail) std::fprintf(stderr, "[frame-tests] slot allocation failure failed\n");
    if (!ok_keyboard) std::fprintf(stderr, "[frame-tests] keyboard texture failed\n");
    if (!ok_mouse) std::fprintf(stderr, "[frame-tests] mouse uniform failed\n");

    if (!(ok_frame && ok_time && ok_rate && ok_zero && ok_fade && ok_stall && ok_slot && ok_slot_fail
          && ok_keyboard && ok_mouse)) return 1;
    std::fprintf(stderr, "[frame-tests] all tests passed\n");
    return 0;
}
