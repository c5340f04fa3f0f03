#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

enum class JobStatus
{
    PENDING,
    STABILIZING,
    QUEUED,
    RUNNING,
    SUCCEEDED,
    FAILED,
    ABANDONED
};

/**
 * @brief Closed set of error categories carried in result values
 */
enum class ErrorKind
{
    FATAL,
    RETRYABLE,
    PATH_LEVEL,
    STARTUP_FATAL
};

using JobId = uint64_t;

/**
 * @brief One source file's conversion, from discovery to a terminal status
 */
struct ConversionJob
{
    JobId id = 0;
    std::string source_path;
    std::string destination_path;
    std::string watch_root;
    JobStatus status = JobStatus::PENDING;
    int attempt_count = 0;
    std::optional<ErrorKind> last_error_kind;
    std::string last_error_message;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    uint64_t source_size = 0;
    std::time_t source_mtime = 0;

    bool isTerminal() const;
};

namespace JobStatuses
{
    std::string toString(JobStatus status);
    std::optional<JobStatus> fromString(const std::string &name);
    bool isTerminal(JobStatus status);
}

namespace ErrorKinds
{
    std::string toString(ErrorKind kind);
    std::optional<ErrorKind> fromString(const std::string &name);
}

void to_json(nlohmann::json &j, const ConversionJob &job);
