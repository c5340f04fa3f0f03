#include "database/conversion_ledger.hpp"
#include "database/sql_scripts.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>

namespace
{
    std::string columnText(sqlite3_stmt *stmt, int column)
    {
        if (sqlite3_column_type(stmt, column) == SQLITE_NULL)
        {
            return "";
        }
        return reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
    }
}

ConversionLedger::~ConversionLedger()
{
    close();
}

DBOpResult ConversionLedger::open(const std::string &db_path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_)
    {
        return DBOpResult(true);
    }

    std::error_code ec;
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        std::string msg = "Cannot open ledger " + db_path + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        Logger::error(msg);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return DBOpResult(false, msg);
    }
    sqlite3_busy_timeout(db_, 5000);

    for (const char *sql : {"PRAGMA journal_mode=WAL", DatabaseScripts::CREATE_CONVERSIONS_TABLE,
                            DatabaseScripts::CREATE_CONVERSIONS_INDEXES})
    {
        DBOpResult result = execute(sql);
        if (!result.success)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            return result;
        }
    }
    Logger::info("Conversion ledger opened: " + db_path);
    return DBOpResult(true);
}

DBOpResult ConversionLedger::execute(const char *sql)
{
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string msg = "SQL error: " + std::string(err_msg ? err_msg : sqlite3_errmsg(db_));
        sqlite3_free(err_msg);
        Logger::error(msg);
        return DBOpResult(false, msg);
    }
    return DBOpResult(true);
}

void ConversionLedger::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool ConversionLedger::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

DBOpResult ConversionLedger::record(const ConversionJob &job)
{
    if (job.status != JobStatus::SUCCEEDED && job.status != JobStatus::FAILED)
    {
        return DBOpResult(true);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
    {
        return DBOpResult(false, "Ledger is not open");
    }

    sqlite3_stmt *stmt;
    int rc = sqlite3_prepare_v2(db_, DatabaseScripts::UPSERT_CONVERSION, -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string msg = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    const std::string status = JobStatuses::toString(job.status);
    const std::string kind = job.last_error_kind ? ErrorKinds::toString(*job.last_error_kind) : "";
    auto updated_at = std::chrono::duration_cast<std::chrono::seconds>(job.updated_at.time_since_epoch()).count();

    sqlite3_bind_text(stmt, 1, job.source_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, job.destination_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, job.attempt_count);
    if (kind.empty())
    {
        sqlite3_bind_null(stmt, 5);
    }
    else
    {
        sqlite3_bind_text(stmt, 5, kind.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (job.last_error_message.empty())
    {
        sqlite3_bind_null(stmt, 6);
    }
    else
    {
        sqlite3_bind_text(stmt, 6, job.last_error_message.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(job.source_size));
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(job.source_mtime));
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(updated_at));

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        std::string msg = "Failed to record conversion: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return DBOpResult(false, msg);
    }
    return DBOpResult(true);
}

std::optional<LedgerEntry> ConversionLedger::lookup(const std::string &source_path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
    {
        return std::nullopt;
    }

    sqlite3_stmt *stmt;
    if (sqlite3_prepare_v2(db_, DatabaseScripts::SELECT_CONVERSION, -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, source_path.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<LedgerEntry> entry;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        LedgerEntry row;
        row.source_path = columnText(stmt, 0);
        row.destination_path = columnText(stmt, 1);
        row.status = JobStatuses::fromString(columnText(stmt, 2)).value_or(JobStatus::FAILED);
        row.attempts = sqlite3_column_int(stmt, 3);
        row.error_kind = ErrorKinds::fromString(columnText(stmt, 4));
        row.error_message = columnText(stmt, 5);
        row.source_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
        row.source_mtime = static_cast<std::time_t>(sqlite3_column_int64(stmt, 7));
        row.updated_at = sqlite3_column_int64(stmt, 8);
        entry = row;
    }
    sqlite3_finalize(stmt);
    return entry;
}

bool ConversionLedger::isSettled(const std::string &source_path, uint64_t size, std::time_t mtime) const
{
    auto entry = lookup(source_path);
    return entry && entry->source_size == size && entry->source_mtime == mtime;
}

bool ConversionLedger::isKnownOutput(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
    {
        return false;
    }

    sqlite3_stmt *stmt;
    if (sqlite3_prepare_v2(db_, DatabaseScripts::SELECT_SUCCEEDED_OUTPUT, -1, &stmt, nullptr) != SQLITE_OK)
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return false;
    }
    sqlite3_bind_text(stmt, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

size_t ConversionLedger::count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
    {
        return 0;
    }

    sqlite3_stmt *stmt;
    if (sqlite3_prepare_v2(db_, DatabaseScripts::COUNT_CONVERSIONS, -1, &stmt, nullptr) != SQLITE_OK)
    {
        return 0;
    }
    size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}
