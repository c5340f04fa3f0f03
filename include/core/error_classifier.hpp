#pragma once

#include "core/conversion_job.hpp"
#include "core/process_runner.hpp"
#include <string>
#include <vector>

struct Classification
{
    ErrorKind kind = ErrorKind::RETRYABLE;
    std::string reason;
};

/**
 * @brief Maps a failed ffmpeg run to Fatal or Retryable.
 *
 * Transient conditions (memory, busy devices, I/O) are matched first,
 * then input and codec/container problems that cannot succeed as
 * configured. Anything unmatched is Retryable.
 */
class ErrorClassifier
{
public:
    static Classification classify(const ProcessResult &result);

    static const std::vector<std::string> &fatalPatterns();
    static const std::vector<std::string> &retryablePatterns();

private:
    static std::string lastLines(const std::string &output, size_t count);
};
