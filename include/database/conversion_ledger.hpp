#pragma once

#include "core/conversion_job.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief One row of the conversions table
 */
struct LedgerEntry
{
    std::string source_path;
    std::string destination_path;
    JobStatus status = JobStatus::SUCCEEDED;
    int attempts = 0;
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    uint64_t source_size = 0;
    std::time_t source_mtime = 0;
    int64_t updated_at = 0;
};

/**
 * @brief SQLite record of finished conversions.
 *
 * Consulted at discovery so that a restart does not convert a file again
 * when its outcome is already known and the file is unchanged.
 */
class ConversionLedger
{
public:
    ConversionLedger() = default;
    ~ConversionLedger();

    ConversionLedger(const ConversionLedger &) = delete;
    ConversionLedger &operator=(const ConversionLedger &) = delete;

    DBOpResult open(const std::string &db_path);
    void close();
    bool isOpen() const;

    /**
     * @brief Store a Succeeded or Failed job; other statuses are ignored
     */
    DBOpResult record(const ConversionJob &job);

    std::optional<LedgerEntry> lookup(const std::string &source_path) const;

    // True if the file has a finished outcome and has not changed since
    bool isSettled(const std::string &source_path, uint64_t size, std::time_t mtime) const;

    // True if path was written by a successful conversion
    bool isKnownOutput(const std::string &path) const;

    size_t count() const;

private:
    DBOpResult execute(const char *sql);

    sqlite3 *db_{nullptr};
    mutable std::mutex mutex_;
};
