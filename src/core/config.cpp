#include <matebridge/core/config.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>
#include <cctype>

namespace matebridge {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        last_error_ = "Cannot open config file: " + path;
        return false;
    }
    
    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            last_error_ = "Config root must be a JSON object";
            return false;
        }
        data_ = parsed;
        last_error_.clear();
        return true;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
}

const Json& Config::lookup(const std::string& key) const {
    static Json null_json;
    // Walk nested sections (e.g., "bridge.tail_state_file")
    std::vector<std::string> parts = split(key, '.');
    const Json* node = &data_;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->has(parts[i])) return null_json;
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::env_value(const std::string& key, std::string& out) {
    const char* val = std::getenv(to_env_key(key).c_str());
    if (!val || !val[0]) return false;
    out = val;
    return true;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json& v = lookup(key);
    if (v.is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_string();
    }
    std::string env;
    if (env_value(key, env)) {
        LOG_DEBUG("Config: key '%s' taken from %s", key.c_str(), to_env_key(key).c_str());
        return env;
    }
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json& v = lookup(key);
    if (v.is_number()) return v.as_int();
    
    std::string env;
    if (env_value(key, env)) {
        char* end = NULL;
        long long parsed = std::strtoll(env.c_str(), &end, 10);
        if (end && *end == '\0') return static_cast<int64_t>(parsed);
        LOG_WARN("Config: %s is not an integer: '%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json& v = lookup(key);
    if (v.is_bool()) return v.as_bool();
    
    std::string env;
    if (env_value(key, env)) {
        std::string lower = to_lower(trim(env));
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
        LOG_WARN("Config: %s is not a boolean: '%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

std::string Config::get_path(const std::string& key, const std::string& def) const {
    return resolve_user_path(get_string(key, def));
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

const Json& Config::data() const { return data_; }

std::string Config::to_env_key(const std::string& key) {
    std::string result;
    for (size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        if (c == '.' || c == '-') {
            result += '_';
        } else {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

} // namespace matebridge
