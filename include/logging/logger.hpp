#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

class Logger
{
public:
    enum class Level
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void init(const std::string &log_level = "INFO")
    {
        getLogger()->set_level(toSpdlogLevel(log_level));
    }

    // Upper bound on rotated files; age-based retention is enforced by pruneExpired()
    static constexpr size_t MAX_ROTATED_FILES = 100;

    /**
     * @brief Attach a size-rotated file sink under log_dir
     * @param log_dir Directory that receives videoconverter.log
     * @param max_size Rotation size in bytes
     * @return false if the directory cannot be created or opened
     */
    static bool addRotatingFile(const std::string &log_dir, size_t max_size)
    {
        try
        {
            std::filesystem::create_directories(log_dir);
            auto path = (std::filesystem::path(log_dir) / "videoconverter.log").string();
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, max_size, MAX_ROTATED_FILES);
            getLogger()->sinks().push_back(sink);
            info("Logging to file: " + path);
            return true;
        }
        catch (const std::exception &e)
        {
            warn("Could not open log file in " + log_dir + ": " + e.what());
            return false;
        }
    }

    /**
     * @brief Remove rotated files (videoconverter.N.log) last written more than retention_days ago
     * @param retention_days 0 keeps every file
     * @return Number of files removed
     */
    static size_t pruneExpired(const std::string &log_dir, size_t retention_days)
    {
        namespace fs = std::filesystem;
        if (retention_days == 0)
        {
            return 0;
        }
        auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24 * retention_days);
        size_t removed = 0;
        std::error_code ec;
        for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec))
        {
            const std::string name = it->path().filename().string();
            bool rotated = name != "videoconverter.log" && name.rfind("videoconverter.", 0) == 0 &&
                           name.size() > 4 && name.compare(name.size() - 4, 4, ".log") == 0;
            std::error_code file_ec;
            if (!rotated || !it->is_regular_file(file_ec))
            {
                continue;
            }
            auto written = fs::last_write_time(it->path(), file_ec);
            if (!file_ec && written < cutoff && fs::remove(it->path(), file_ec))
            {
                removed++;
            }
        }
        if (removed > 0)
        {
            info("Removed " + std::to_string(removed) + " expired log file(s) from " + log_dir);
        }
        return removed;
    }

    static bool isValidLevel(const std::string &log_level)
    {
        return log_level == "TRACE" || log_level == "DEBUG" || log_level == "INFO" ||
               log_level == "WARN" || log_level == "WARNING" || log_level == "ERROR" ||
               log_level == "CRITICAL";
    }

    static void trace(const std::string &message)
    {
        log(Level::TRACE, message);
    }

    static void debug(const std::string &message)
    {
        log(Level::DEBUG, message);
    }

    static void info(const std::string &message)
    {
        log(Level::INFO, message);
    }

    static void warn(const std::string &message)
    {
        log(Level::WARN, message);
    }

    static void error(const std::string &message)
    {
        log(Level::ERROR, message);
    }

    static void log(Level level, const std::string &message)
    {
        auto logger = getLogger();
        switch (level)
        {
        case Level::TRACE:
            logger->trace(message);
            break;
        case Level::DEBUG:
            logger->debug(message);
            break;
        case Level::INFO:
            logger->info(message);
            break;
        case Level::WARN:
            logger->warn(message);
            break;
        case Level::ERROR:
            logger->error(message);
            break;
        }
    }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("videoconverter");
        return logger;
    }

    // WARNING and CRITICAL are the spellings used by the installer's sample config
    static spdlog::level::level_enum toSpdlogLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "INFO")
            return spdlog::level::info;
        if (log_level == "WARN" || log_level == "WARNING")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;
        if (log_level == "CRITICAL")
            return spdlog::level::critical;
        return spdlog::level::info;
    }
};
