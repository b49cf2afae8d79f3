/*
 * MateBridge C++11 - Memory SQLite Store Implementation
 */
#include <matebridge/memory/store.hpp>
#include <matebridge/core/json.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>
#include <cctype>
#include <sstream>

namespace matebridge {

namespace {

const char* RECORD_COLUMNS = "m.id, m.owner, m.content, m.created_at, m.seq, m.metadata, m.kind";

std::string metadata_to_json(const MemoryMetadata& metadata) {
    Json obj = Json::object();
    for (MemoryMetadata::const_iterator it = metadata.begin(); it != metadata.end(); ++it) {
        obj.set(it->first, Json(it->second));
    }
    return obj.dump();
}

MemoryMetadata metadata_from_json(const char* text) {
    MemoryMetadata out;
    if (!text || !text[0]) return out;
    try {
        Json obj = Json::parse(text);
        const std::map<std::string, Json>& fields = obj.as_object();
        for (std::map<std::string, Json>::const_iterator it = fields.begin(); it != fields.end(); ++it) {
            out[it->first] = it->second.is_string() ? it->second.as_string() : it->second.dump();
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("[Memory] Ignoring unreadable metadata: %s", e.what());
    }
    return out;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return txt ? std::string(txt) : std::string();
}

// Escape LIKE wildcards; the statement declares ESCAPE '\'
std::string like_escape(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' || s[i] == '_' || s[i] == '\\') out += '\\';
        out += s[i];
    }
    return out;
}

// RAII wrapper around BEGIN/COMMIT; rolls back unless committed
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db), active_(false) {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
    }
    ~Transaction() {
        if (active_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    bool active() const { return active_; }
    bool commit() {
        if (!active_) return false;
        active_ = false;
        return sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
    }
private:
    sqlite3* db_;
    bool active_;
};

} // namespace

MemoryStore::MemoryStore()
    : db_(nullptr)
    , fts_available_(false)
{
}

MemoryStore::~MemoryStore() {
    close();
}

bool MemoryStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    std::string dir = dirname(db_path);
    if (db_path != ":memory:" && !is_directory(dir) && !mkdir_p(dir)) {
        set_error("Cannot create directory: " + dir);
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");

    return true;
}

void MemoryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool MemoryStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool MemoryStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    if (!exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  id TEXT NOT NULL UNIQUE,"
        "  owner TEXT NOT NULL,"
        "  content TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  metadata TEXT,"
        "  kind TEXT NOT NULL DEFAULT 'conversation'"
        ")"
    )) return false;

    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_owner_time "
              "ON memories(owner, created_at, seq)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_owner_kind "
              "ON memories(owner, kind)")) return false;

    fts_available_ = ensure_fts_table();
    if (!fts_available_) {
        LOG_WARN("[Memory] FTS5 unavailable (%s), using LIKE search", last_error_.c_str());
    }

    return true;
}

bool MemoryStore::ensure_fts_table() {
    std::string error;
    return exec(
        "CREATE VIRTUAL TABLE IF NOT EXISTS memories_fts USING fts5("
        "  content,"
        "  owner UNINDEXED,"
        "  record_id UNINDEXED"
        ")",
        error
    );
}

int64_t MemoryStore::newest_created_at(const std::string& owner) {
    const char* sql = "SELECT MAX(created_at) FROM memories WHERE owner = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) return 0;
    sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);

    int64_t newest = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        newest = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return newest;
}

bool MemoryStore::add(const std::string& owner,
                      const std::string& content,
                      const MemoryMetadata& metadata,
                      MemoryKind kind,
                      int64_t now_ms,
                      std::string* id_out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    std::string text = trim(content);
    if (text.empty()) {
        set_error("Empty content");
        return false;
    }
    text = truncate_chars(text, MEMORY_MAX_CONTENT_CHARS);

    Transaction tx(db_);
    if (!tx.active()) {
        set_error_from_db();
        return false;
    }

    // Keep created_at monotonic within the owner
    int64_t created_at = now_ms > 0 ? now_ms : current_timestamp_ms();
    int64_t newest = newest_created_at(owner);
    if (created_at < newest) created_at = newest;

    std::ostringstream fp;
    fp << owner << ":" << text << ":" << (created_at / 1000);
    std::string id = sha256_hex(fp.str());

    // Same fingerprint replaces the earlier row
    if (delete_record(owner, id) < 0) {
        return false;
    }

    const char* sql =
        "INSERT INTO memories (id, owner, content, created_at, metadata, kind) "
        "VALUES (?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    std::string meta_json = metadata_to_json(metadata);
    std::string kind_str = memory_kind_to_string(kind);
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, created_at);
    sqlite3_bind_text(stmt, 5, meta_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, kind_str.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }

    if (fts_available_) {
        const char* fts_sql = "INSERT INTO memories_fts (content, owner, record_id) VALUES (?, ?, ?)";
        if (sqlite3_prepare_v2(db_, fts_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            set_error_from_db();
            return false;
        }
        sqlite3_bind_text(stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }

    if (!tx.commit()) {
        set_error_from_db();
        return false;
    }

    if (id_out) *id_out = id;
    return true;
}

int MemoryStore::delete_record(const std::string& owner, const std::string& id) {
    const char* sql = "DELETE FROM memories WHERE id = ? AND owner = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return -1;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return -1;
    }
    int removed = sqlite3_changes(db_);

    if (removed > 0 && fts_available_) {
        const char* fts_sql = "DELETE FROM memories_fts WHERE record_id = ? AND owner = ?";
        if (sqlite3_prepare_v2(db_, fts_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            set_error_from_db();
            return -1;
        }
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            set_error_from_db();
            return -1;
        }
    }
    return removed;
}

bool MemoryStore::remove(const std::string& owner, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    Transaction tx(db_);
    if (!tx.active()) {
        set_error_from_db();
        return false;
    }
    int removed = delete_record(owner, id);
    if (removed <= 0) {
        if (removed == 0) set_error("No such record: " + id);
        return false;
    }
    if (!tx.commit()) {
        set_error_from_db();
        return false;
    }
    return true;
}

int MemoryStore::delete_by_query(const std::string& owner, const std::string& query) {
    std::vector<MemoryRecord> matches = search(owner, query, 100);
    int deleted = 0;
    for (size_t i = 0; i < matches.size(); ++i) {
        if (remove(owner, matches[i].id)) {
            deleted++;
        } else {
            LOG_WARN("[Memory] Failed to delete %s: %s", matches[i].id.c_str(), last_error().c_str());
        }
    }
    return deleted;
}

bool MemoryStore::clear_all(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    Transaction tx(db_);
    if (!tx.active()) {
        set_error_from_db();
        return false;
    }

    const char* statements[] = {
        "DELETE FROM memories WHERE owner = ?",
        "DELETE FROM memories_fts WHERE owner = ?"
    };
    int count = fts_available_ ? 2 : 1;
    for (int i = 0; i < count; ++i) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, statements[i], -1, &stmt, nullptr) != SQLITE_OK) {
            set_error_from_db();
            return false;
        }
        sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }

    if (!tx.commit()) {
        set_error_from_db();
        return false;
    }
    return true;
}

std::vector<std::string> MemoryStore::query_tokens(const std::string& query) {
    // Punctuation other than - _ . becomes whitespace; non-ASCII bytes are
    // word characters
    std::string cleaned;
    for (size_t i = 0; i < query.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(query[i]);
        if (c >= 0x80 || std::isalnum(c) || std::isspace(c) || c == '-' || c == '_' || c == '.') {
            cleaned += static_cast<char>(c);
        } else {
            cleaned += ' ';
        }
    }

    std::vector<std::string> tokens;
    std::istringstream iss(cleaned);
    std::string word;
    while (iss >> word) {
        if (utf8_length(word) >= 2) tokens.push_back(word);
    }
    return tokens;
}

std::string MemoryStore::build_match_query(const std::string& query) {
    std::vector<std::string> tokens = query_tokens(query);
    std::vector<std::string> terms;
    for (size_t i = 0; i < tokens.size(); ++i) {
        terms.push_back("\"" + tokens[i] + "\"*");
    }
    return join(terms, " AND ");
}

MemoryRecord MemoryStore::read_record(sqlite3_stmt* stmt) {
    MemoryRecord r;
    r.id = column_text(stmt, 0);
    r.owner = column_text(stmt, 1);
    r.content = column_text(stmt, 2);
    r.created_at = sqlite3_column_int64(stmt, 3);
    r.seq = sqlite3_column_int64(stmt, 4);
    r.metadata = metadata_from_json(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5)));
    if (!parse_memory_kind(column_text(stmt, 6), r.kind)) {
        r.kind = MemoryKind::CONVERSATION;
    }
    return r;
}

std::vector<MemoryRecord> MemoryStore::search(const std::string& owner, const std::string& query, int limit) {
    std::vector<MemoryRecord> results;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || limit <= 0) return results;

    std::vector<std::string> tokens = query_tokens(query);
    if (tokens.empty()) return results;

    if (fts_available_) {
        return search_fts(owner, build_match_query(query), limit);
    }
    return search_like(owner, tokens, limit);
}

std::vector<MemoryRecord> MemoryStore::search_fts(const std::string& owner, const std::string& match, int limit) {
    std::vector<MemoryRecord> results;
    std::string sql = std::string("SELECT ") + RECORD_COLUMNS +
        " FROM memories_fts f JOIN memories m ON m.id = f.record_id"
        " WHERE memories_fts MATCH ? AND f.owner = ? AND m.owner = ?"
        " ORDER BY bm25(memories_fts), m.created_at DESC, m.seq DESC"
        " LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return results;
    }
    sqlite3_bind_text(stmt, 1, match.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, limit);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        results.push_back(read_record(stmt));
    }
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        LOG_WARN("[Memory] FTS search failed: %s", last_error_.c_str());
    }
    sqlite3_finalize(stmt);
    return results;
}

std::vector<MemoryRecord> MemoryStore::search_like(const std::string& owner,
                                                   const std::vector<std::string>& tokens, int limit) {
    std::vector<MemoryRecord> results;
    std::string sql = std::string("SELECT ") + RECORD_COLUMNS + " FROM memories m WHERE m.owner = ?";
    for (size_t i = 0; i < tokens.size(); ++i) {
        sql += " AND m.content LIKE ? ESCAPE '\\'";
    }
    sql += " ORDER BY m.created_at DESC, m.seq DESC LIMIT ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return results;
    }

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, owner.c_str(), -1, SQLITE_TRANSIENT);
    for (size_t i = 0; i < tokens.size(); ++i) {
        std::string pattern = "%" + like_escape(tokens[i]) + "%";
        sqlite3_bind_text(stmt, idx++, pattern.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int(stmt, idx, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_record(stmt));
    }
    sqlite3_finalize(stmt);
    return results;
}

std::vector<MemoryRecord> MemoryStore::get_recent(const std::string& owner, int limit) {
    std::vector<MemoryRecord> results;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || limit <= 0) return results;

    std::string sql = std::string("SELECT ") + RECORD_COLUMNS +
        " FROM memories m WHERE m.owner = ?"
        " ORDER BY m.created_at DESC, m.seq DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return results;
    }
    sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_record(stmt));
    }
    sqlite3_finalize(stmt);
    return results;
}

std::vector<MemoryRecord> MemoryStore::get_by_kind(const std::string& owner, MemoryKind kind, int limit) {
    std::vector<MemoryRecord> results;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || limit <= 0) return results;

    std::string sql = std::string("SELECT ") + RECORD_COLUMNS +
        " FROM memories m WHERE m.owner = ? AND m.kind = ?"
        " ORDER BY m.created_at DESC, m.seq DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return results;
    }
    std::string kind_str = memory_kind_to_string(kind);
    sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, kind_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, limit);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_record(stmt));
    }
    sqlite3_finalize(stmt);
    return results;
}

MemoryStats MemoryStore::stats(const std::string& owner) {
    MemoryStats st;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return st;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT COUNT(*), MAX(created_at), MIN(created_at) FROM memories WHERE owner = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            st.count = sqlite3_column_int64(stmt, 0);
            st.newest = sqlite3_column_int64(stmt, 1);
            st.oldest = sqlite3_column_int64(stmt, 2);
        }
        sqlite3_finalize(stmt);
    } else {
        set_error_from_db();
    }

    sql = "SELECT kind, COUNT(*) FROM memories WHERE owner = ? GROUP BY kind";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            st.by_kind[column_text(stmt, 0)] = sqlite3_column_int64(stmt, 1);
        }
        sqlite3_finalize(stmt);
    } else {
        set_error_from_db();
    }
    return st;
}

std::string MemoryStore::format_for_injection(const std::vector<MemoryRecord>& records,
                                              size_t max_chars) {
    if (records.empty()) return "";

    const std::string header = "【历史记忆】";
    std::vector<std::string> lines;
    lines.push_back(header);
    lines.push_back("");
    size_t current_len = utf8_length(header) + 2;

    for (size_t i = 0; i < records.size(); ++i) {
        std::string line = "• " + replace_all(records[i].content, "\n", " ");
        size_t line_len = utf8_length(line);
        if (current_len + line_len + 1 > max_chars) break;
        lines.push_back(line);
        current_len += line_len + 1;
    }
    return join(lines, "\n");
}

std::string MemoryStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool MemoryStore::exec(const std::string& sql) {
    std::string error;
    return exec(sql, error);
}

bool MemoryStore::exec(const std::string& sql, std::string& error) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        if (err_msg) {
            error = err_msg;
            last_error_ = err_msg;
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

void MemoryStore::set_error(const std::string& error) {
    last_error_ = error;
}

void MemoryStore::set_error_from_db() {
    if (db_) {
        last_error_ = sqlite3_errmsg(db_);
    }
}

} // namespace matebridge
