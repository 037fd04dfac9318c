#pragma once

/*
    SBG SHADER BACKGROUND SAN

    FILE: preset_watcher.hpp
    MODULE: runtime
    PURPOSE: Background thread polling a preset file's modification time and reporting
            changes through a callback (normally HotReloadCoordinator::notify_preset_changed).
*/


#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "sbg/core/log.hpp"

namespace sbg
{
    class PresetWatcher
    {
    public:
        using ChangeCallback = std::function<void(const std::string& path)>;

        PresetWatcher(std::string path, ChangeCallback on_change,
                      std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500))
            : path_(std::move(path)), on_change_(std::move(on_change)), poll_interval_(poll_interval)
        {
            last_seen_ = modification_time();
        }

        ~PresetWatcher()
        {
            stop();
        }

        PresetWatcher(const PresetWatcher&) = delete;
        PresetWatcher& operator=(const PresetWatcher&) = delete;

        void start()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (worker_.joinable()) return;
            stop_ = false;
            worker_ = std::thread([this]() { watch_loop(); });
        }

        void stop()
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                stop_ = true;
            }
            cv_.notify_all();
            if (worker_.joinable()) worker_.join();
        }

        // Checks once on the calling thread; safe while the worker runs. Returns true
        // when a change was reported, and each change is reported once.
        bool poll_once()
        {
            const std::optional<std::filesystem::file_time_type> now = modification_time();
            if (!now) return false;
            {
                std::lock_guard<std::mutex> lock(seen_mtx_);
                if (last_seen_ && *now == *last_seen_) return false;
                last_seen_ = now;
            }
            log_debug("preset file changed: " + path_);
            if (on_change_) on_change_(path_);
            return true;
        }

        const std::string& path() const { return path_; }

    private:
        std::optional<std::filesystem::file_time_type> modification_time() const
        {
            std::error_code ec{};
            const auto t = std::filesystem::last_write_time(path_, ec);
            if (ec) return std::nullopt;
            return t;
        }

        void watch_loop()
        {
            while (true)
            {
                {
                    std::unique_lock<std::mutex> lock(mtx_);
                    cv_.wait_for(lock, poll_interval_, [this]() { return stop_; });
                    if (stop_) return;
                }
                poll_once();
            }
        }

        std::string path_{};
        ChangeCallback on_change_{};
        std::chrono::milliseconds poll_interval_{500};
        std::mutex seen_mtx_{};
        std::optional<std::filesystem::file_time_type> last_seen_{};

        std::thread worker_{};
        std::mutex mtx_{};
        std::condition_variable cv_{};
        bool stop_ = false;
    };
}
