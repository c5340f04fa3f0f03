#include "core/conversion_job.hpp"

bool ConversionJob::isTerminal() const
{
    return JobStatuses::isTerminal(status);
}

namespace JobStatuses
{
    std::string toString(JobStatus status)
    {
        switch (status)
        {
        case JobStatus::PENDING:
            return "PENDING";
        case JobStatus::STABILIZING:
            return "STABILIZING";
        case JobStatus::QUEUED:
            return "QUEUED";
        case JobStatus::RUNNING:
            return "RUNNING";
        case JobStatus::SUCCEEDED:
            return "SUCCEEDED";
        case JobStatus::FAILED:
            return "FAILED";
        case JobStatus::ABANDONED:
            return "ABANDONED";
        }
        return "UNKNOWN";
    }

    std::optional<JobStatus> fromString(const std::string &name)
    {
        if (name == "PENDING")
            return JobStatus::PENDING;
        if (name == "STABILIZING")
            return JobStatus::STABILIZING;
        if (name == "QUEUED")
            return JobStatus::QUEUED;
        if (name == "RUNNING")
            return JobStatus::RUNNING;
        if (name == "SUCCEEDED")
            return JobStatus::SUCCEEDED;
        if (name == "FAILED")
            return JobStatus::FAILED;
        if (name == "ABANDONED")
            return JobStatus::ABANDONED;
        return std::nullopt;
    }

    bool isTerminal(JobStatus status)
    {
        return status == JobStatus::SUCCEEDED || status == JobStatus::FAILED ||
               status == JobStatus::ABANDONED;
    }
}

namespace ErrorKinds
{
    std::string toString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::FATAL:
            return "FATAL";
        case ErrorKind::RETRYABLE:
            return "RETRYABLE";
        case ErrorKind::PATH_LEVEL:
            return "PATH_LEVEL";
        case ErrorKind::STARTUP_FATAL:
            return "STARTUP_FATAL";
        }
        return "UNKNOWN";
    }

    std::optional<ErrorKind> fromString(const std::string &name)
    {
        if (name == "FATAL")
            return ErrorKind::FATAL;
        if (name == "RETRYABLE")
            return ErrorKind::RETRYABLE;
        if (name == "PATH_LEVEL")
            return ErrorKind::PATH_LEVEL;
        if (name == "STARTUP_FATAL")
            return ErrorKind::STARTUP_FATAL;
        return std::nullopt;
    }
}

void to_json(nlohmann::json &j, const ConversionJob &job)
{
    j = nlohmann::json{
        {"id", job.id},
        {"source", job.source_path},
        {"destination", job.destination_path},
        {"status", JobStatuses::toString(job.status)},
        {"attempts", job.attempt_count}};
    if (job.last_error_kind)
    {
        j["error_kind"] = ErrorKinds::toString(*job.last_error_kind);
        j["error"] = job.last_error_message;
    }
}
