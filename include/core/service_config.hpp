#pragma once

#include <chrono>
#include <string>
#include <vector>

/**
 * @brief One monitored directory, already normalized by the config loader
 */
struct WatchedPath
{
    std::string root;
    bool recursive = true;
    bool enabled = true;
    std::vector<std::string> file_patterns;
};

enum class RetryBackoff
{
    FIXED,
    EXPONENTIAL
};

/**
 * @brief Canonical, validated configuration consumed by the conversion engine.
 *
 * Durations are kept as milliseconds so tests can run the engine with
 * sub-second timings; the YAML file expresses them in seconds.
 */
struct ServiceConfig
{
    // service
    std::string log_level = "INFO";
    int max_workers = 2;
    std::chrono::milliseconds conversion_timeout{std::chrono::hours(1)};
    std::chrono::milliseconds shutdown_grace_period{std::chrono::seconds(30)};

    // directories
    std::vector<WatchedPath> watch_paths;
    std::string output_dir;
    std::chrono::milliseconds rescan_interval{0};

    // logging
    std::string log_dir = "/var/log/videoconverter";
    size_t log_rotation_size = 10485760;
    size_t log_retention_days = 14;

    // file_handling
    bool delete_original = true;
    bool preserve_permissions = true;
    bool preserve_timestamps = true;

    // error_handling
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{std::chrono::seconds(60)};
    RetryBackoff retry_backoff = RetryBackoff::FIXED;
    std::chrono::milliseconds retry_delay_max{std::chrono::hours(1)};

    // conversion
    std::string ffmpeg_path = "ffmpeg";
    std::string encoder = "auto";
    std::string codec = "hevc";
    int quality = 23;
    std::string audio_codec = "aac";
    std::string audio_bitrate = "192k";
    std::string container = "mkv";
    std::string vaapi_device = "/dev/dri/renderD128";
    std::chrono::milliseconds probe_timeout{std::chrono::seconds(10)};

    // advanced
    std::string lockfile = "/var/run/videoconverter/videoconverter.lock";
    std::chrono::milliseconds lock_stale_after{std::chrono::hours(24)};
    std::chrono::milliseconds lock_refresh_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds stability_check_interval{std::chrono::seconds(2)};
    std::chrono::milliseconds stability_check_duration{std::chrono::seconds(5)};
    int stability_required_samples = 2;
    int stability_check_threads = 4;
    std::string state_db = "/var/lib/videoconverter/state.db";
};
