#include "beamdrop/storage/blob_index.hpp"
#include "beamdrop/core/logger.hpp"
#include <sqlite3.h>
#include <chrono>

namespace beamdrop::storage {

namespace {

BlobEntry read_entry(sqlite3_stmt* stmt) {
    BlobEntry entry;
    entry.hash_hex = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    entry.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
    entry.external = sqlite3_column_int(stmt, 2) != 0;
    if (auto text = sqlite3_column_text(stmt, 3)) {
        entry.external_path = reinterpret_cast<const char*>(text);
    }
    entry.created_at = sqlite3_column_int64(stmt, 4);
    return entry;
}

}

BlobIndex::BlobIndex(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

BlobIndex::~BlobIndex() {
    close();
}

bool BlobIndex::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open blob index {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    return create_tables();
}

bool BlobIndex::create_tables() {
    const char* create_blobs_table = R"(
        CREATE TABLE IF NOT EXISTS blobs (
            hash TEXT PRIMARY KEY,
            size INTEGER NOT NULL,
            external INTEGER NOT NULL DEFAULT 0,
            external_path TEXT,
            created_at INTEGER NOT NULL
        );
    )";
    
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, create_blobs_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create blob table: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    
    return true;
}

bool BlobIndex::put(const BlobEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    
    const char* insert_sql = R"(
        INSERT OR REPLACE INTO blobs (hash, size, external, external_path, created_at)
        VALUES (?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return false;
    }
    
    auto created_at = entry.created_at != 0
        ? entry.created_at
        : std::chrono::duration_cast<std::chrono::seconds>(
              std::chrono::system_clock::now().time_since_epoch()).count();
    auto external_path = entry.external_path.string();
    
    sqlite3_bind_text(stmt, 1, entry.hash_hex.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(entry.size));
    sqlite3_bind_int(stmt, 3, entry.external ? 1 : 0);
    if (entry.external) {
        sqlite3_bind_text(stmt, 4, external_path.c_str(), -1, SQLITE_STATIC);
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    sqlite3_bind_int64(stmt, 5, created_at);
    
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    return result == SQLITE_DONE;
}

bool BlobIndex::remove(const std::string& hash_hex) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    
    const char* delete_sql = "DELETE FROM blobs WHERE hash = ?;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, hash_hex.c_str(), -1, SQLITE_STATIC);
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    return result == SQLITE_DONE;
}

std::optional<BlobEntry> BlobIndex::get(const std::string& hash_hex) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    
    const char* select_sql =
        "SELECT hash, size, external, external_path, created_at FROM blobs WHERE hash = ?;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return std::nullopt;
    }
    
    sqlite3_bind_text(stmt, 1, hash_hex.c_str(), -1, SQLITE_STATIC);
    result = sqlite3_step(stmt);
    
    std::optional<BlobEntry> entry;
    if (result == SQLITE_ROW) {
        entry = read_entry(stmt);
    }
    sqlite3_finalize(stmt);
    
    return entry;
}

bool BlobIndex::contains(const std::string& hash_hex) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    
    const char* exists_sql = "SELECT 1 FROM blobs WHERE hash = ? LIMIT 1;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, exists_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, hash_hex.c_str(), -1, SQLITE_STATIC);
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    return result == SQLITE_ROW;
}

std::vector<BlobEntry> BlobIndex::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BlobEntry> entries;
    if (!db_) {
        return entries;
    }
    
    const char* select_sql =
        "SELECT hash, size, external, external_path, created_at FROM blobs ORDER BY created_at;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return entries;
    }
    
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(read_entry(stmt));
    }
    
    sqlite3_finalize(stmt);
    return entries;
}

size_t BlobIndex::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }
    
    const char* count_sql = "SELECT COUNT(*) FROM blobs;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, count_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return 0;
    }
    
    result = sqlite3_step(stmt);
    size_t count = (result == SQLITE_ROW) ? sqlite3_column_int64(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    
    return count;
}

std::uint64_t BlobIndex::total_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }
    
    const char* size_sql = "SELECT COALESCE(SUM(size), 0) FROM blobs;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, size_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return 0;
    }
    
    result = sqlite3_step(stmt);
    std::uint64_t total = (result == SQLITE_ROW) ? sqlite3_column_int64(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    
    return total;
}

void BlobIndex::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool BlobIndex::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

}
