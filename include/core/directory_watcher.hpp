#pragma once

#include "core/service_config.hpp"
#include "logging/event_sink.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * @brief A file seen for the first time under one of the watched roots
 */
struct DiscoveredFile
{
    std::string path; // lexically normal absolute path
    uint64_t size = 0;
    std::chrono::system_clock::time_point first_seen;
    std::string watch_root;
};

/**
 * @brief Startup enumeration plus inotify events, merged into one stream.
 *
 * Every absolute path is reported at most once until forget() is called
 * for it, no matter whether it was found by a scan or by a live event.
 * Callbacks run on the watcher thread.
 */
class DirectoryWatcher
{
public:
    using DiscoveryCallback = std::function<void(const DiscoveredFile &)>;

    DirectoryWatcher(std::vector<WatchedPath> watch_paths, std::string output_dir,
                     std::chrono::milliseconds rescan_interval, EventSink &events);
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher &) = delete;
    DirectoryWatcher &operator=(const DirectoryWatcher &) = delete;

    /**
     * @brief Arm watches, enumerate every enabled root, then follow live events
     * @return false if inotify could not be initialized
     */
    bool start(DiscoveryCallback callback);

    void stop();

    // Allow a later event or scan to report the path again
    void forget(const std::string &path);

    // Mark a path as seen so it is never reported (used for conversion outputs)
    void ignore(const std::string &path);

    bool isKnown(const std::string &path) const;
    size_t discoveredCount() const;
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Directory that must never be reported for a given root
     * @return Empty when conversions are written next to their sources
     */
    static std::string resolveOutputDir(const std::string &output_dir, const std::string &root);

private:
    struct WatchEntry
    {
        std::string dir;
        size_t root_index;
    };

    void run();
    void rescan();
    void scanRoot(size_t root_index);
    bool armRoot(size_t root_index);
    void addWatchTree(const std::string &dir, size_t root_index);
    void processEvents();
    void consider(const std::string &path, size_t root_index);

    std::vector<WatchedPath> watch_paths_;
    std::vector<std::string> excluded_dirs_; // per root
    std::vector<bool> root_armed_;
    const std::chrono::milliseconds rescan_interval_;
    EventSink &events_;

    DiscoveryCallback callback_;
    int inotify_fd_{-1};
    std::unordered_map<int, WatchEntry> watches_;

    mutable std::mutex discovered_mutex_;
    std::unordered_set<std::string> discovered_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};
