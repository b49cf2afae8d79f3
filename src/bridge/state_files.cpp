#include <matebridge/bridge/state_files.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>
#include <cstdlib>
#include <sstream>

namespace matebridge {

StateFiles::StateFiles(const std::string& state_dir) : dir_(state_dir) {}

std::string StateFiles::cursor_path() const {
    return join_path(dir_, "telegram_offset");
}

std::string StateFiles::active_chat_path() const {
    return join_path(dir_, "telegram_chat_id");
}

bool StateFiles::read_int(const std::string& path, int64_t& out) {
    std::string content;
    if (!read_file(path, content)) return false;
    
    std::string value = trim(content);
    if (value.empty()) return false;
    
    char* end = NULL;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (!end || *end != '\0') {
        LOG_WARN("[State] Ignoring corrupt value in %s", path.c_str());
        return false;
    }
    out = static_cast<int64_t>(parsed);
    return true;
}

bool StateFiles::write_int(const std::string& path, int64_t value) {
    std::ostringstream oss;
    oss << value;
    if (!write_file_atomic(path, oss.str())) {
        LOG_ERROR("[State] Failed to write %s", path.c_str());
        return false;
    }
    return true;
}

int64_t StateFiles::load_cursor() const {
    int64_t cursor = 0;
    if (!read_int(cursor_path(), cursor)) {
        LOG_INFO("[State] No update cursor, starting from 0");
        return 0;
    }
    return cursor;
}

bool StateFiles::save_cursor(int64_t cursor) const {
    return write_int(cursor_path(), cursor);
}

bool StateFiles::load_active_chat(int64_t& chat_id) const {
    return read_int(active_chat_path(), chat_id);
}

bool StateFiles::save_active_chat(int64_t chat_id) const {
    return write_int(active_chat_path(), chat_id);
}

} // namespace matebridge
