#include "core/config_loader.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <filesystem>

namespace
{
    template <typename T>
    T valueOr(const YAML::Node &section, const std::string &key, const T &def)
    {
        if (!section || !section.IsMap() || !section[key] || section[key].IsNull())
        {
            return def;
        }
        try
        {
            return section[key].as<T>();
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError("Invalid value for '" + key + "': " + e.what());
        }
    }

    // Durations are written in (possibly fractional) seconds
    std::chrono::milliseconds secondsOr(const YAML::Node &section, const std::string &key,
                                        std::chrono::milliseconds def)
    {
        double seconds = valueOr<double>(section, key, def.count() / 1000.0);
        if (seconds < 0)
        {
            throw ConfigError("'" + key + "' must not be negative");
        }
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }

    std::vector<std::string> patternsOr(const YAML::Node &node, const std::vector<std::string> &def)
    {
        if (!node || node.IsNull())
        {
            return def;
        }
        std::vector<std::string> patterns;
        if (node.IsScalar())
        {
            patterns.push_back(node.as<std::string>());
        }
        else if (node.IsSequence())
        {
            for (const auto &item : node)
            {
                patterns.push_back(item.as<std::string>());
            }
        }
        else
        {
            throw ConfigError("file_patterns must be a string or a list of strings");
        }
        return patterns;
    }
}

ServiceConfig ConfigLoader::loadFile(const std::string &file_path)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(file_path);
    }
    catch (const YAML::BadFile &)
    {
        throw ConfigError("Cannot read configuration file: " + file_path);
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError("Malformed configuration file " + file_path + ": " + e.what());
    }
    Logger::info("Configuration loaded from: " + file_path);
    return fromNode(root);
}

ServiceConfig ConfigLoader::loadString(const std::string &yaml_text)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }
    return fromNode(root);
}

std::string ConfigLoader::resolveConfigPath(const std::string &explicit_path)
{
    if (!explicit_path.empty())
    {
        return explicit_path;
    }
    const char *env = std::getenv("CONFIG_PATH");
    if (env && *env)
    {
        return env;
    }
    return DEFAULT_CONFIG_PATH;
}

void ConfigLoader::applyEnvironment(ServiceConfig &config)
{
    const char *log_path = std::getenv("LOG_PATH");
    if (log_path && *log_path)
    {
        config.log_dir = log_path;
    }
    const char *lock_path = std::getenv("LOCK_PATH");
    if (lock_path && *lock_path)
    {
        config.lockfile = lock_path;
    }
}

ServiceConfig ConfigLoader::fromNode(const YAML::Node &root)
{
    if (root && !root.IsNull() && !root.IsMap())
    {
        throw ConfigError("Configuration root must be a mapping");
    }

    ServiceConfig config;

    const YAML::Node service = root ? root["service"] : YAML::Node();
    config.log_level = valueOr<std::string>(service, "log_level", config.log_level);
    config.max_workers = valueOr<int>(service, "max_workers", config.max_workers);
    config.conversion_timeout = secondsOr(service, "conversion_timeout", config.conversion_timeout);
    config.shutdown_grace_period = secondsOr(service, "shutdown_grace_period", config.shutdown_grace_period);

    const YAML::Node directories = root ? root["directories"] : YAML::Node();
    config.watch_paths = normalizeWatchPaths(directories);
    config.output_dir = valueOr<std::string>(directories, "output_dir", config.output_dir);
    config.rescan_interval = secondsOr(directories, "rescan_interval", config.rescan_interval);

    const YAML::Node logging = root ? root["logging"] : YAML::Node();
    config.log_dir = valueOr<std::string>(logging, "log_dir", config.log_dir);
    config.log_rotation_size = valueOr<size_t>(logging, "rotation_size", config.log_rotation_size);
    config.log_retention_days = valueOr<size_t>(logging, "retention_days", config.log_retention_days);

    const YAML::Node file_handling = root ? root["file_handling"] : YAML::Node();
    config.delete_original = valueOr<bool>(file_handling, "delete_original", config.delete_original);
    config.preserve_permissions = valueOr<bool>(file_handling, "preserve_permissions", config.preserve_permissions);
    config.preserve_timestamps = valueOr<bool>(file_handling, "preserve_timestamps", config.preserve_timestamps);

    const YAML::Node error_handling = root ? root["error_handling"] : YAML::Node();
    config.max_retries = valueOr<int>(error_handling, "max_retries", config.max_retries);
    config.retry_delay = secondsOr(error_handling, "retry_delay", config.retry_delay);
    config.retry_delay_max = secondsOr(error_handling, "retry_delay_max", config.retry_delay_max);
    std::string backoff = valueOr<std::string>(error_handling, "retry_backoff", "fixed");
    if (backoff == "fixed")
    {
        config.retry_backoff = RetryBackoff::FIXED;
    }
    else if (backoff == "exponential")
    {
        config.retry_backoff = RetryBackoff::EXPONENTIAL;
    }
    else
    {
        throw ConfigError("Invalid retry_backoff: " + backoff + " (expected fixed or exponential)");
    }

    const YAML::Node conversion = root ? root["conversion"] : YAML::Node();
    config.ffmpeg_path = valueOr<std::string>(conversion, "ffmpeg_path", config.ffmpeg_path);
    config.encoder = valueOr<std::string>(conversion, "encoder", config.encoder);
    config.codec = valueOr<std::string>(conversion, "codec", config.codec);
    config.quality = valueOr<int>(conversion, "quality", config.quality);
    config.audio_codec = valueOr<std::string>(conversion, "audio_codec", config.audio_codec);
    config.audio_bitrate = valueOr<std::string>(conversion, "audio_bitrate", config.audio_bitrate);
    config.container = valueOr<std::string>(conversion, "container", config.container);
    config.vaapi_device = valueOr<std::string>(conversion, "vaapi_device", config.vaapi_device);
    config.probe_timeout = secondsOr(conversion, "probe_timeout", config.probe_timeout);

    const YAML::Node advanced = root ? root["advanced"] : YAML::Node();
    config.lockfile = valueOr<std::string>(advanced, "lockfile", config.lockfile);
    config.lock_stale_after = secondsOr(advanced, "lock_stale_after", config.lock_stale_after);
    config.lock_refresh_interval = secondsOr(advanced, "lock_refresh_interval", config.lock_refresh_interval);
    config.stability_check_interval = secondsOr(advanced, "stability_check_interval", config.stability_check_interval);
    config.stability_check_duration = secondsOr(advanced, "stability_check_duration", config.stability_check_duration);
    config.stability_required_samples = valueOr<int>(advanced, "stability_required_samples", config.stability_required_samples);
    config.stability_check_threads = valueOr<int>(advanced, "stability_check_threads", config.stability_check_threads);
    config.state_db = valueOr<std::string>(advanced, "state_db", config.state_db);

    auto problems = validate(config);
    if (!problems.empty())
    {
        std::string message = "Invalid configuration:";
        for (const auto &problem : problems)
        {
            message += "\n  - " + problem;
        }
        throw ConfigError(message);
    }
    return config;
}

std::vector<WatchedPath> ConfigLoader::normalizeWatchPaths(const YAML::Node &directories)
{
    std::vector<WatchedPath> result;
    if (!directories || !directories.IsMap())
    {
        return result;
    }

    const bool default_recursive = valueOr<bool>(directories, "recursive", true);
    const std::vector<std::string> default_patterns =
        patternsOr(directories["file_patterns"], {"*.mkv", "*.mp4", "*.avi"});

    const YAML::Node paths = directories["watch_paths"];
    if (!paths || paths.IsNull())
    {
        return result;
    }
    if (!paths.IsSequence())
    {
        throw ConfigError("directories.watch_paths must be a list");
    }

    for (const auto &entry : paths)
    {
        WatchedPath watched;
        watched.recursive = default_recursive;
        watched.file_patterns = default_patterns;

        if (entry.IsScalar())
        {
            watched.root = entry.as<std::string>();
        }
        else if (entry.IsMap())
        {
            watched.root = valueOr<std::string>(entry, "path", "");
            watched.recursive = valueOr<bool>(entry, "recursive", default_recursive);
            watched.enabled = valueOr<bool>(entry, "enabled", true);
            watched.file_patterns = patternsOr(entry["file_patterns"], default_patterns);
        }
        else
        {
            throw ConfigError("Each watch_paths entry must be a path or a mapping with a 'path' key");
        }

        if (watched.root.empty())
        {
            throw ConfigError("watch_paths entry without a path");
        }
        watched.root = std::filesystem::path(watched.root).lexically_normal().string();
        if (watched.root.size() > 1 && watched.root.back() == '/')
        {
            watched.root.pop_back();
        }
        result.push_back(std::move(watched));
    }
    return result;
}

std::vector<std::string> ConfigLoader::validate(const ServiceConfig &config)
{
    std::vector<std::string> problems;

    if (!Logger::isValidLevel(config.log_level))
        problems.push_back("Invalid log_level: " + config.log_level);
    if (config.max_workers <= 0)
        problems.push_back("max_workers must be positive");
    if (config.conversion_timeout.count() <= 0)
        problems.push_back("conversion_timeout must be positive");
    if (config.max_retries <= 0)
        problems.push_back("max_retries must be at least 1");
    if (config.encoder != "auto" && config.encoder != "nvenc" && config.encoder != "qsv" &&
        config.encoder != "vaapi" && config.encoder != "software")
        problems.push_back("Invalid encoder: " + config.encoder);
    if (config.codec != "hevc" && config.codec != "h264")
        problems.push_back("Invalid codec: " + config.codec + " (expected hevc or h264)");
    if (config.container.empty())
        problems.push_back("container must not be empty");
    if (config.ffmpeg_path.empty())
        problems.push_back("ffmpeg_path must not be empty");
    if (config.lockfile.empty())
        problems.push_back("lockfile must not be empty");
    if (config.stability_check_interval.count() <= 0)
        problems.push_back("stability_check_interval must be positive");
    if (config.stability_check_duration < config.stability_check_interval)
        problems.push_back("stability_check_duration must be at least stability_check_interval");
    if (config.stability_required_samples < 2)
        problems.push_back("stability_required_samples must be at least 2");
    if (config.stability_check_threads <= 0)
        problems.push_back("stability_check_threads must be positive");

    bool any_enabled = false;
    for (const auto &watched : config.watch_paths)
    {
        if (!watched.enabled)
            continue;
        any_enabled = true;
        if (watched.file_patterns.empty())
            problems.push_back("Watch path " + watched.root + " has no file patterns");
        if (!std::filesystem::path(watched.root).is_absolute())
            problems.push_back("Watch path must be absolute: " + watched.root);
    }
    if (!any_enabled)
        problems.push_back("No enabled watch path configured");

    return problems;
}
