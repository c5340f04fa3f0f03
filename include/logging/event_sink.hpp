#pragma once

#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Structured log event emitted by the conversion engine
 */
struct LogEvent
{
    std::string component;
    Logger::Level level = Logger::Level::INFO;
    std::string message;
    nlohmann::json context = nlohmann::json::object();
};

/**
 * @brief Destination for structured events.
 *
 * Every component receives a sink by reference; none of them talks to
 * spdlog directly so tests can capture what was emitted.
 */
class EventSink
{
public:
    virtual ~EventSink() = default;
    virtual void emit(const LogEvent &event) = 0;

    void debug(const std::string &component, const std::string &message,
               nlohmann::json context = nlohmann::json::object())
    {
        emit(LogEvent{component, Logger::Level::DEBUG, message, std::move(context)});
    }

    void info(const std::string &component, const std::string &message,
              nlohmann::json context = nlohmann::json::object())
    {
        emit(LogEvent{component, Logger::Level::INFO, message, std::move(context)});
    }

    void warn(const std::string &component, const std::string &message,
              nlohmann::json context = nlohmann::json::object())
    {
        emit(LogEvent{component, Logger::Level::WARN, message, std::move(context)});
    }

    void error(const std::string &component, const std::string &message,
               nlohmann::json context = nlohmann::json::object())
    {
        emit(LogEvent{component, Logger::Level::ERROR, message, std::move(context)});
    }
};

/**
 * @brief Production sink: "[component] message {context}" through Logger
 */
class SpdlogEventSink : public EventSink
{
public:
    void emit(const LogEvent &event) override
    {
        std::string line = "[" + event.component + "] " + event.message;
        if (!event.context.empty())
        {
            line += " " + event.context.dump();
        }
        Logger::log(event.level, line);
    }
};

/**
 * @brief Sink that keeps every event in memory (used by tests and --check-config)
 */
class RecordingEventSink : public EventSink
{
public:
    void emit(const LogEvent &event) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<LogEvent> events() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(const std::string &component, const std::string &message_prefix) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto &event : events_)
        {
            if (event.component == component && event.message.rfind(message_prefix, 0) == 0)
            {
                n++;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogEvent> events_;
};
