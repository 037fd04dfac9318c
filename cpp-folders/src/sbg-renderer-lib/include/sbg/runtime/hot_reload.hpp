#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: hot_reload.hpp
    MODULE: runtime
    PURPOSE: Single pending-reload slot between the file watcher and the render thread.
            Watchers only record the path; the render thread re-parses and applies it
            at a frame boundary.
*/


#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "sbg/core/log.hpp"
#include "sbg/core/result.hpp"
#include "sbg/preset/preset.hpp"
#include "sbg/preset/preset_toml.hpp"

namespace sbg
{
    enum class ReloadOutcome : uint8_t
    {
        NothingPending = 0,
        Unchanged,
        Applied,
        Failed
    };

    inline const char* reload_outcome_name(ReloadOutcome o)
    {
        switch (o)
        {
            case ReloadOutcome::NothingPending: return "nothing_pending";
            case ReloadOutcome::Unchanged: return "unchanged";
            case ReloadOutcome::Applied: return "applied";
            case ReloadOutcome::Failed: return "failed";
        }
        return "unknown";
    }

    class HotReloadCoordinator
    {
    public:
        using PresetLoader = std::function<Result<Preset>(const std::string& path)>;
        using PresetApplier = std::function<Status(const Preset& preset)>;

        HotReloadCoordinator()
            : loader_([](const std::string& path) { return load_preset_toml_file(path); })
        {}

        explicit HotReloadCoordinator(PresetLoader loader)
            : loader_(std::move(loader))
        {}

        // Any thread. A newer path replaces one not yet applied.
        void notify_preset_changed(std::string path)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (pending_) ++superseded_;
            pending_ = std::move(path);
        }

        bool has_pending() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return pending_.has_value();
        }

        // Render thread, between frames. `apply` must leave the current graph
        // untouched when it fails.
        ReloadOutcome process_pending(const Preset* current, const PresetApplier& apply)
        {
            std::optional<std::string> path{};
            {
                std::lock_guard<std::mutex> lock(mtx_);
                path.swap(pending_);
            }
            if (!path) return ReloadOutcome::NothingPending;

            Result<Preset> loaded = loader_(*path);
            if (!loaded.ok)
            {
                last_error_ = loaded.error;
                log_error("reload of '" + *path + "' rejected, keeping current preset: " + loaded.error.describe());
                return ReloadOutcome::Failed;
            }
            if (current && loaded.value == *current)
            {
                log_info("preset unchanged after reload: " + *path);
                return ReloadOutcome::Unchanged;
            }

            Status st = apply(loaded.value);
            if (!st.ok)
            {
                last_error_ = st.error;
                log_error("reload of '" + *path + "' failed, keeping current preset: " + st.error.describe());
                return ReloadOutcome::Failed;
            }
            last_error_.reset();
            log_info("preset reloaded: " + *path);
            return ReloadOutcome::Applied;
        }

        const std::optional<Error>& last_error() const { return last_error_; }

        uint64_t superseded_count() const
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return superseded_;
        }

    private:
        PresetLoader loader_{};
        mutable std::mutex mtx_{};
        std::optional<std::string> pending_{};
        uint64_t superseded_ = 0;
        std::optional<Error> last_error_{};
    };
}
