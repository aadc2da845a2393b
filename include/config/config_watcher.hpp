#pragma once

#include "config/config_loader.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace errorengine {

/**
 * @brief Hot reload of the engine configuration.
 *
 * Watches the main file and every file it includes. When any of their
 * modification times moves, the whole set is re-loaded and a valid config
 * is handed to the callback on the watcher thread. A config that fails to
 * parse or validate is logged and dropped; the engine keeps running on
 * the last good one and the broken revision is not retried until a file
 * changes again.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const EngineConfig& new_config)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::seconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    void start();
    void stop();

    /**
     * @brief Check once for a change and reload if needed
     * @return true if a new config was loaded and delivered
     */
    bool poll_once();

    /// Files currently watched (main file first until a load resolves includes)
    [[nodiscard]] std::vector<std::string> watched_files() const;

    [[nodiscard]] bool is_running() const { return running_.load(); }
    [[nodiscard]] uint64_t reload_count() const { return reloads_.load(); }
    [[nodiscard]] uint64_t rejected_count() const { return rejected_.load(); }

private:
    using Snapshot = std::map<std::string, std::filesystem::file_time_type>;

    void watch_loop(std::stop_token stop);
    [[nodiscard]] static Snapshot snapshot(const std::vector<std::string>& files);

    std::string config_path_;
    std::chrono::seconds poll_interval_;
    ReloadCallback callback_;

    Snapshot watched_;
    mutable std::mutex mutex_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> rejected_{0};
    std::jthread watch_thread_;
};

} // namespace errorengine
