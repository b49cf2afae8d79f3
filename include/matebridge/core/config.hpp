#ifndef MATEBRIDGE_CORE_CONFIG_HPP
#define MATEBRIDGE_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <fstream>
#include <cstdlib>

namespace matebridge {

// Bridge configuration. Keys use dot notation ("telegram.bot_token"); when a
// key is absent from the file, the matching environment variable
// (TELEGRAM_BOT_TOKEN) is consulted before the default.
class Config {
public:
    Config();
    
    // Load from JSON file
    bool load_file(const std::string& path);
    
    // Load from JSON string
    bool load_string(const std::string& json_str);
    
    std::string get_string(const std::string& key, const std::string& def = "") const;
    
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    
    bool get_bool(const std::string& key, bool def = false) const;
    
    // Path value with ~ expanded
    std::string get_path(const std::string& key, const std::string& def = "") const;
    
    // Get nested object
    const Json& get_section(const std::string& key) const;
    
    const Json& data() const;
    const std::string& last_error() const { return last_error_; }

    // "telegram.bot_token" -> "TELEGRAM_BOT_TOKEN"
    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    std::string last_error_;
    
    const Json& lookup(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
};

} // namespace matebridge

#endif // MATEBRIDGE_CORE_CONFIG_HPP
