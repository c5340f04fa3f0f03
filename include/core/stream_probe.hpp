#pragma once

#include <optional>
#include <string>
#include <vector>

struct StreamInfo
{
    int index = 0;
    std::string type; // video, audio, subtitle, data, attachment, unknown
    std::string codec;
    bool attached_picture = false;
};

/**
 * @brief Streams found in an input container
 */
struct ProbeReport
{
    bool readable = false;
    std::string error;
    int error_code = 0; // AVERROR value of the failing libavformat call
    double duration_seconds = 0.0;
    std::vector<StreamInfo> streams;

    // First video stream that is not cover art
    std::optional<int> primaryVideoIndex() const;

    // I/O, busy and out-of-memory failures; corrupt or unknown formats are not transient
    bool isTransientFailure() const;
};

class StreamProbe
{
public:
    virtual ~StreamProbe() = default;
    virtual ProbeReport probe(const std::string &path) = 0;
};

/**
 * @brief StreamProbe backed by libavformat (no decoding, headers only)
 */
class LibavStreamProbe : public StreamProbe
{
public:
    LibavStreamProbe();
    ProbeReport probe(const std::string &path) override;
};
