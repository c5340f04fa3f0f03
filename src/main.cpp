#include "core/config_loader.hpp"
#include "core/conversion_orchestrator.hpp"
#include "core/encoder_detector.hpp"
#include "core/process_runner.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/event_sink.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <string>
#include <unistd.h>

#ifndef VIDEOCONVERTER_VERSION
#define VIDEOCONVERTER_VERSION "0.0.0"
#endif

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "videoconverter - watches directories and converts new videos with ffmpeg" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c PATH   Configuration file (default: $CONFIG_PATH or "
                  << ConfigLoader::DEFAULT_CONFIG_PATH << ")" << std::endl;
        std::cout << "  --check-config      Validate the configuration and exit" << std::endl;
        std::cout << "  --detect-encoder    Probe hardware encoders, print the selection and exit" << std::endl;
        std::cout << "  --version, -v       Print the version and exit" << std::endl;
        std::cout << "  --help, -h          Show this help message" << std::endl;
    }

    ConversionSettings settingsFrom(const ServiceConfig &config)
    {
        ConversionSettings settings;
        settings.codec = config.codec;
        settings.quality = config.quality;
        settings.audio_codec = config.audio_codec;
        settings.audio_bitrate = config.audio_bitrate;
        settings.vaapi_device = config.vaapi_device;
        return settings;
    }
}

int main(int argc, char *argv[])
{
    std::string explicit_config;
    bool check_config = false;
    bool detect_encoder = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a path" << std::endl;
                return static_cast<int>(ExitCode::CONFIG_ERROR);
            }
            explicit_config = argv[++i];
        }
        else if (arg == "--check-config")
        {
            check_config = true;
        }
        else if (arg == "--detect-encoder")
        {
            detect_encoder = true;
        }
        else if (arg == "--version" || arg == "-v")
        {
            std::cout << "videoconverter " << VIDEOCONVERTER_VERSION << std::endl;
            return 0;
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return static_cast<int>(ExitCode::CONFIG_ERROR);
        }
    }

    std::string config_path = ConfigLoader::resolveConfigPath(explicit_config);
    ServiceConfig config;
    try
    {
        config = ConfigLoader::loadFile(config_path);
        ConfigLoader::applyEnvironment(config);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return static_cast<int>(ExitCode::CONFIG_ERROR);
    }

    Logger::init(config.log_level);

    if (check_config)
    {
        std::cout << "Configuration OK: " << config_path << std::endl;
        for (const auto &watched : config.watch_paths)
        {
            std::cout << "  watch " << watched.root << (watched.enabled ? "" : " (disabled)")
                      << (watched.recursive ? " recursive" : "") << std::endl;
        }
        std::cout << "  output_dir " << (config.output_dir.empty() ? "(next to source)" : config.output_dir) << std::endl;
        std::cout << "  workers " << config.max_workers << ", encoder " << config.encoder << "/" << config.codec
                  << ", container " << config.container << std::endl;
        return 0;
    }

    SpdlogEventSink events;

    if (detect_encoder)
    {
        PosixProcessRunner runner;
        EncoderDetector detector(runner, events, config.ffmpeg_path, config.encoder, settingsFrom(config),
                                 config.probe_timeout);
        EncoderProfile profile = detector.detect();
        std::cout << profile.name << " (" << profile.ffmpeg_encoder << ")" << std::endl;
        return 0;
    }

    Logger::addRotatingFile(config.log_dir, config.log_rotation_size);
    Logger::pruneExpired(config.log_dir, config.log_retention_days);
    Logger::info("Starting videoconverter " + std::string(VIDEOCONVERTER_VERSION) +
                 " (PID: " + std::to_string(getpid()) + "), config " + config_path);

    ShutdownManager shutdown;
    shutdown.installSignalHandlers();

    ExitCode code;
    {
        ConversionOrchestrator orchestrator(config, events, shutdown);
        code = orchestrator.run();
    }

    Logger::info("videoconverter exiting with code " + std::to_string(static_cast<int>(code)));
    return static_cast<int>(code);
}
