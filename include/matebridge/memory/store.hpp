/*
 * MateBridge C++11 - Memory SQLite Store
 * 
 * Durable per-owner record store. Uses FTS5 for full-text search (BM25
 * ranking) and falls back to LIKE matching when FTS5 is not compiled in.
 * Every query is scoped to a single owner.
 */
#ifndef MATEBRIDGE_MEMORY_STORE_HPP
#define MATEBRIDGE_MEMORY_STORE_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

namespace matebridge {

class MemoryStore {
public:
    MemoryStore();
    ~MemoryStore();
    
    // Initialize database at path (WAL journal)
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;
    
    // Schema management
    bool ensure_schema();
    bool fts_available() const { return fts_available_; }
    
    // Insert or replace a record. Empty content is rejected. now_ms == 0
    // uses the wall clock.
    bool add(const std::string& owner,
             const std::string& content,
             const MemoryMetadata& metadata,
             MemoryKind kind,
             int64_t now_ms = 0,
             std::string* id_out = NULL);
    
    std::vector<MemoryRecord> search(const std::string& owner, const std::string& query, int limit);
    std::vector<MemoryRecord> get_recent(const std::string& owner, int limit);
    std::vector<MemoryRecord> get_by_kind(const std::string& owner, MemoryKind kind, int limit);
    
    // False when no record with that id exists for the owner
    bool remove(const std::string& owner, const std::string& id);
    
    // Number of records removed
    int delete_by_query(const std::string& owner, const std::string& query);
    
    bool clear_all(const std::string& owner);
    
    MemoryStats stats(const std::string& owner);
    
    // Header, blank line, then one bullet per record while the running
    // length (in code points) stays within max_chars
    static std::string format_for_injection(const std::vector<MemoryRecord>& records,
                                            size_t max_chars);
    
    // FTS5 MATCH expression, empty when no token survives
    static std::string build_match_query(const std::string& query);
    static std::vector<std::string> query_tokens(const std::string& query);
    
    std::string last_error() const;
    
private:
    sqlite3* db_;
    std::string last_error_;
    bool fts_available_;
    mutable std::mutex mutex_;
    
    bool exec(const std::string& sql);
    bool exec(const std::string& sql, std::string& error);
    void set_error(const std::string& error);
    void set_error_from_db();
    
    bool ensure_fts_table();
    int64_t newest_created_at(const std::string& owner);
    // Rows removed, -1 on error
    int delete_record(const std::string& owner, const std::string& id);
    std::vector<MemoryRecord> search_fts(const std::string& owner, const std::string& match, int limit);
    std::vector<MemoryRecord> search_like(const std::string& owner,
                                          const std::vector<std::string>& tokens, int limit);
    static MemoryRecord read_record(sqlite3_stmt* stmt);

    MemoryStore(const MemoryStore&);
    MemoryStore& operator=(const MemoryStore&);
};

} // namespace matebridge

#endif // MATEBRIDGE_MEMORY_STORE_HPP
