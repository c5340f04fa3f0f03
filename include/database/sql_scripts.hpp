#pragma once

namespace DatabaseScripts
{
    const char *const CREATE_CONVERSIONS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS conversions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source_path TEXT NOT NULL UNIQUE,
            destination_path TEXT,
            status TEXT NOT NULL,
            attempts INTEGER NOT NULL DEFAULT 0,
            error_kind TEXT,
            error_message TEXT,
            source_size INTEGER NOT NULL DEFAULT 0,
            source_mtime INTEGER NOT NULL DEFAULT 0,
            updated_at INTEGER NOT NULL
        )
    )";

    const char *const CREATE_CONVERSIONS_INDEXES = R"(
        CREATE INDEX IF NOT EXISTS idx_conversions_destination ON conversions(destination_path);
        CREATE INDEX IF NOT EXISTS idx_conversions_status ON conversions(status);
    )";

    const char *const UPSERT_CONVERSION = R"(
        INSERT INTO conversions
        (source_path, destination_path, status, attempts, error_kind, error_message,
         source_size, source_mtime, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(source_path) DO UPDATE SET
            destination_path = excluded.destination_path,
            status = excluded.status,
            attempts = excluded.attempts,
            error_kind = excluded.error_kind,
            error_message = excluded.error_message,
            source_size = excluded.source_size,
            source_mtime = excluded.source_mtime,
            updated_at = excluded.updated_at
    )";

    const char *const SELECT_CONVERSION = R"(
        SELECT source_path, destination_path, status, attempts, error_kind, error_message,
               source_size, source_mtime, updated_at
        FROM conversions WHERE source_path = ?
    )";

    const char *const SELECT_SUCCEEDED_OUTPUT = R"(
        SELECT 1 FROM conversions WHERE destination_path = ? AND status = 'SUCCEEDED' LIMIT 1
    )";

    const char *const COUNT_CONVERSIONS = "SELECT COUNT(*) FROM conversions";
}
