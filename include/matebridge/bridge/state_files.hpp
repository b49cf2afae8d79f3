#ifndef MATEBRIDGE_BRIDGE_STATE_FILES_HPP
#define MATEBRIDGE_BRIDGE_STATE_FILES_HPP

#include <string>
#include <cstdint>

namespace matebridge {

// Single-value files under the state directory. Missing or unreadable
// files fall back to defaults; writes go through a temp file and rename.
class StateFiles {
public:
    explicit StateFiles(const std::string& state_dir);
    
    // Telegram update offset, 0 when absent
    int64_t load_cursor() const;
    bool save_cursor(int64_t cursor) const;
    
    bool load_active_chat(int64_t& chat_id) const;
    bool save_active_chat(int64_t chat_id) const;
    
    const std::string& dir() const { return dir_; }
    std::string cursor_path() const;
    std::string active_chat_path() const;
    
    static bool read_int(const std::string& path, int64_t& out);
    static bool write_int(const std::string& path, int64_t value);

private:
    std::string dir_;
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_STATE_FILES_HPP
