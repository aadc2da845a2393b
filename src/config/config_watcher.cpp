#include "config/config_watcher.hpp"
#include "core/utils.hpp"

#include <format>

namespace errorengine {

ConfigWatcher::ConfigWatcher(std::string config_path, std::chrono::seconds poll_interval)
    : config_path_(std::move(config_path)),
      poll_interval_(poll_interval) {
    // Includes are unknown until the first load through the watcher; until
    // then only the main file is tracked
    watched_ = snapshot({config_path_});
    if (!watched_.contains(config_path_)) {
        utils::log::warn(std::format("Config watcher: cannot stat {}", config_path_));
    }
}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

void ConfigWatcher::set_callback(ReloadCallback callback) {
    callback_ = std::move(callback);
}

void ConfigWatcher::start() {
    if (running_.exchange(true)) return;
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(std::move(stop));
    });
    utils::log::info(std::format("Config watcher: polling {} every {}s",
                                 config_path_, poll_interval_.count()));
}

void ConfigWatcher::stop() {
    if (!running_.exchange(false)) return;
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
    utils::log::info("Config watcher stopped");
}

ConfigWatcher::Snapshot ConfigWatcher::snapshot(const std::vector<std::string>& files) {
    Snapshot snap;
    for (const auto& file : files) {
        std::error_code ec;
        const auto mtime = std::filesystem::last_write_time(file, ec);
        if (!ec) snap.emplace(file, mtime);
    }
    return snap;
}

std::vector<std::string> ConfigWatcher::watched_files() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> files;
    files.reserve(watched_.size());
    for (const auto& [path, mtime] : watched_) files.push_back(path);
    return files;
}

bool ConfigWatcher::poll_once() {
    std::vector<std::string> files;
    Snapshot previous;
    {
        std::lock_guard lock(mutex_);
        previous = watched_;
        for (const auto& [path, mtime] : watched_) files.push_back(path);
    }
    if (files.empty()) files.push_back(config_path_);

    const auto current = snapshot(files);
    if (current == previous) return false;

    utils::log::info(std::format("Config change detected ({} file(s) watched)", files.size()));

    auto result = ConfigLoader::load_from_file(config_path_);
    if (!result.success) {
        // Remember the broken revision so it is not re-parsed every poll
        {
            std::lock_guard lock(mutex_);
            watched_ = current;
        }
        rejected_.fetch_add(1);
        utils::log::error(std::format("Config reload rejected, keeping current config: {}",
                                      result.error_message));
        return false;
    }

    {
        std::lock_guard lock(mutex_);
        watched_ = snapshot(result.source_files);
    }

    if (callback_) {
        try {
            callback_(result.config);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Config reload callback failed: {}", e.what()));
            return false;
        }
    }
    reloads_.fetch_add(1);
    utils::log::info(std::format("Config reloaded: {} sources, {} channels, {} queries",
        result.config.sources.size(), result.config.channels.size(), result.config.queries.size()));
    return true;
}

void ConfigWatcher::watch_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        for (int i = 0; i < poll_interval_.count() * 10 && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        if (stop.stop_requested()) break;

        poll_once();
    }
}

} // namespace errorengine
