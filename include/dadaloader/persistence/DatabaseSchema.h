/**
 * @file DatabaseSchema.h
 * @brief SQLite schema definitions
 *
 * @copyright Copyright (c) 2024 DadaLoader Project
 * @license GPL-3.0-or-later
 */

#ifndef DADALOADER_DATABASESCHEMA_H
#define DADALOADER_DATABASESCHEMA_H

namespace DadaLoader {
namespace DatabaseSchema {

// ═══════════════════════════════════════════════════════════════════════════════
// Downloads Table
// ═══════════════════════════════════════════════════════════════════════════════

constexpr const char* CREATE_DOWNLOADS_TABLE = R"(
    CREATE TABLE IF NOT EXISTS downloads (
        id          INTEGER PRIMARY KEY AUTOINCREMENT,
        url         TEXT NOT NULL,
        save_path   TEXT NOT NULL,
        file_size   INTEGER DEFAULT 0,
        status      TEXT,
        progress    REAL,
        downloaded  INTEGER DEFAULT 0,
        is_paused   INTEGER DEFAULT 0
    )
)";

constexpr const char* CREATE_DOWNLOADS_STATUS_INDEX = R"(
    CREATE INDEX IF NOT EXISTS idx_downloads_status ON downloads (status)
)";

// ═══════════════════════════════════════════════════════════════════════════════
// Settings Table
// ═══════════════════════════════════════════════════════════════════════════════

constexpr const char* CREATE_SETTINGS_TABLE = R"(
    CREATE TABLE IF NOT EXISTS settings (
        key   TEXT PRIMARY KEY NOT NULL,
        value TEXT
    )
)";

// ═══════════════════════════════════════════════════════════════════════════════
// Pragmas
// ═══════════════════════════════════════════════════════════════════════════════

// synchronous = FULL: a committed update survives a crash right after it
constexpr const char* PRAGMAS[] = {
    "PRAGMA journal_mode = WAL",
    "PRAGMA synchronous = FULL",
    "PRAGMA foreign_keys = ON",
};

constexpr int CURRENT_SCHEMA_VERSION = 1;

constexpr const char* SCHEMA_VERSION_KEY = "schema_version";

} // namespace DatabaseSchema
} // namespace DadaLoader

#endif // DADALOADER_DATABASESCHEMA_H
