#include "core/error_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <sstream>

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

const std::vector<std::string> &ErrorClassifier::fatalPatterns()
{
    static const std::vector<std::string> patterns{
        "invalid data found when processing input",
        "moov atom not found",
        "could not find codec parameters",
        "does not contain any stream",
        "unknown encoder",
        "encoder not found",
        "decoder not found",
        "unsupported codec",
        "codec not currently supported in container",
        "could not write header for output file",
        "incorrect codec parameters",
        "invalid frame dimensions",
        "no such file or directory",
    };
    return patterns;
}

const std::vector<std::string> &ErrorClassifier::retryablePatterns()
{
    static const std::vector<std::string> patterns{
        "cannot allocate memory",
        "out of memory",
        "cuda_error_out_of_memory",
        "device or resource busy",
        "resource temporarily unavailable",
        "openencodesessionex failed",
        "device creation failed",
        "input/output error",
        "no space left on device",
        "broken pipe",
        "connection reset",
    };
    return patterns;
}

Classification ErrorClassifier::classify(const ProcessResult &result)
{
    if (result.spawn_failed)
    {
        return {ErrorKind::RETRYABLE, result.error_message.empty() ? "could not start ffmpeg" : result.error_message};
    }
    if (result.timed_out)
    {
        return {ErrorKind::RETRYABLE, "conversion timed out"};
    }
    if (result.cancelled)
    {
        return {ErrorKind::RETRYABLE, "conversion cancelled"};
    }
    if (result.term_signal != 0)
    {
        return {ErrorKind::RETRYABLE, "ffmpeg killed by signal " + std::to_string(result.term_signal)};
    }

    const std::string output = toLower(result.output);
    for (const auto &pattern : retryablePatterns())
    {
        if (output.find(pattern) != std::string::npos)
        {
            return {ErrorKind::RETRYABLE, pattern};
        }
    }
    for (const auto &pattern : fatalPatterns())
    {
        if (output.find(pattern) != std::string::npos)
        {
            return {ErrorKind::FATAL, pattern};
        }
    }

    std::string tail = lastLines(result.output, 3);
    return {ErrorKind::RETRYABLE, "ffmpeg exited with " + std::to_string(result.exit_code) +
                                      (tail.empty() ? "" : ": " + tail)};
}

std::string ErrorClassifier::lastLines(const std::string &output, size_t count)
{
    std::deque<std::string> tail;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos)
        {
            continue;
        }
        tail.push_back(line);
        if (tail.size() > count)
        {
            tail.pop_front();
        }
    }

    std::string joined;
    for (const auto &entry : tail)
    {
        if (!joined.empty())
        {
            joined += " | ";
        }
        joined += entry;
    }
    return joined;
}
