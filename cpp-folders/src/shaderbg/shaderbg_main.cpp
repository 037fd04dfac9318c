#define SDL_MAIN_HANDLED

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>

#include <sbg/core/log.hpp>
#include <sbg/core/time.hpp>
#include <sbg/platform/sdl/sdl_gl_runtime.hpp>
#include <sbg/resources/loaders/asset_provider_sdl.hpp>
#include <sbg/rhi/drivers/opengl/gl_device.hpp>
#include <sbg/runtime/preset_watcher.hpp>
#include <sbg/runtime/wallpaper_runtime.hpp>

namespace
{
constexpr const char* kWindowTitle = "shaderbg";
constexpr const char* kDefaultAssetsDir = "assets";

struct AppOptions
{
    std::string preset_path{};
    std::string assets_dir = kDefaultAssetsDir;
    std::string shader_dump_dir{};
    bool overlay = true;
};

void print_usage()
{
    std::fprintf(stderr,
                 "usage: shaderbg <preset.toml> [--assets <dir>] [--shader-dump <dir>] [--no-overlay]\n"
                 "       SBG_LOG_LEVEL=debug|info|warn|error|off\n");
}

AppOptions parse_options(int argc, char** argv)
{
    AppOptions o{};
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "--assets" && i + 1 < argc) o.assets_dir = argv[++i];
        else if (a == "--shader-dump" && i + 1 < argc) o.shader_dump_dir = argv[++i];
        else if (a == "--no-overlay") o.overlay = false;
        else if (a == "-h" || a == "--help")
        {
            print_usage();
            std::exit(0);
        }
        else if (!a.empty() && a[0] != '-' && o.preset_path.empty()) o.preset_path = a;
        else throw std::runtime_error("unknown argument '" + a + "'");
    }
    if (o.preset_path.empty()) throw std::runtime_error("no preset file given");
    return o;
}

sbg::IRect desktop_of(const std::vector<sbg::MonitorInfo>& monitors)
{
    sbg::IRect r{};
    for (const sbg::MonitorInfo& m : monitors) r = sbg::rect_union(r, m.geometry);
    return r;
}

class ShaderBgApp
{
public:
    explicit ShaderBgApp(AppOptions opts)
        : opts_(std::move(opts))
    {}

    void run()
    {
        sbg::WindowDesc win{};
        win.title = kWindowTitle;
        sbg::SdlGlRuntime platform(win);
        if (!platform.valid()) throw std::runtime_error("SDL/OpenGL init failed");

        sbg::OpenGLGpuDevice device{};
        if (!device.valid()) throw std::runtime_error("OpenGL device init failed: " + device.init_error());

        sbg::SdlImageAssetProvider assets(opts_.assets_dir);
        sbg::RuntimeConfig cfg{};
        cfg.overlay_enabled = opts_.overlay;
        cfg.shader_dump_dir = opts_.shader_dump_dir;
        sbg::WallpaperRuntime runtime(device, &assets, cfg);

        std::vector<sbg::MonitorInfo> monitors = platform.monitors();
        check(runtime.set_monitors(monitors));

        sbg::Status loaded = runtime.load_file(opts_.preset_path);
        if (!loaded.ok)
        {
            sbg::log_warn("starting with the built-in shader until the preset is fixed");
            check(runtime.load(sbg::Preset{}));
        }

        sbg::PresetWatcher watcher(opts_.preset_path, [&runtime](const std::string& path) {
            runtime.notify_preset_changed(path);
        });
        watcher.start();

        sbg::FrameClock clock{};
        clock.tick_hz = (double)SDL_GetPerformanceFrequency();
        std::string last_title{};

        bool running = true;
        while (running)
        {
            sbg::PlatformInputState in{};
            running = platform.pump_input(in, runtime.keyboard(), runtime.mouse());
            if (!running) break;

            if (in.displays_changed)
            {
                monitors = platform.monitors();
                platform.cover(desktop_of(monitors));
                check(runtime.set_monitors(monitors));
            }
            if (in.reload_requested) runtime.notify_preset_changed(opts_.preset_path);

            const double dt = clock.begin_frame(SDL_GetPerformanceCounter());
            sbg::Result<sbg::PresentedFrame> frame = runtime.tick(dt);
            if (!frame.ok) throw std::runtime_error(frame.error.describe());

            const std::string title = overlay_title(runtime);
            if (title != last_title)
            {
                platform.set_title(title);
                last_title = title;
            }
            platform.present();
        }
        watcher.stop();
    }

private:
    static void check(const sbg::Status& st)
    {
        if (!st.ok) throw std::runtime_error(st.error.describe());
    }

    static std::string overlay_title(const sbg::WallpaperRuntime& runtime)
    {
        const std::optional<sbg::OverlayInfo> o = runtime.overlay();
        if (!o) return kWindowTitle;
        std::string t = std::string(kWindowTitle) + " - " + o->name;
        if (!o->author.empty()) t += " by " + o->author;
        return t;
    }

    AppOptions opts_{};
};
}

int main(int argc, char** argv)
{
    if (const char* lvl = std::getenv("SBG_LOG_LEVEL")) sbg::set_log_level(sbg::parse_log_level(lvl));

    try
    {
        ShaderBgApp app(parse_options(argc, argv));
        app.run();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
}
