// src/core/store/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "core/record/VaultError.hpp"

namespace vault {

static void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreUnavailable("SQLite exec failed: " + msg);
    }
}

bool initDatabase(const std::string& dbUri, const std::string& schemaPath) {
    // Plain filenames get their parent directory created; URIs are left to SQLite.
    if (dbUri.rfind("file:", 0) != 0 && dbUri != ":memory:") {
        const auto parent = std::filesystem::path(dbUri).parent_path();
        std::error_code ec;
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        if (ec) throw StoreUnavailable("Cannot create directory " + parent.string() + ": " + ec.message());
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
        dbUri.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        throw StoreUnavailable("Failed to open DB: " + msg);
    }

    try {
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=NORMAL;");
        execAll(db, "PRAGMA busy_timeout=5000;");

        // CREATE ... IF NOT EXISTS only, safe to re-run
        std::ifstream in(schemaPath);
        if (!in) throw StoreUnavailable("Cannot open schema file: " + schemaPath);
        std::ostringstream buf; buf << in.rdbuf();
        execAll(db, buf.str());

        execAll(db, "PRAGMA user_version=1;");

        sqlite3_close(db);
        spdlog::info("Schema {} applied to {}", schemaPath, dbUri);
        return true;
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
}

} // namespace vault
