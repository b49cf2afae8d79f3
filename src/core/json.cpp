#include <matebridge/core/json.hpp>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace matebridge {

namespace {
const int MAX_DEPTH = 256;

std::runtime_error parse_error(const std::string& what, size_t pos) {
    return std::runtime_error("JSON parse error: " + what + " at position " + std::to_string(pos));
}
} // namespace

bool Json::as_bool(bool def) const {
    return type_ == BOOL ? bool_ : def;
}

double Json::as_number(double def) const {
    return type_ == NUMBER ? number_ : def;
}

int64_t Json::as_int(int64_t def) const {
    return type_ == NUMBER ? static_cast<int64_t>(number_) : def;
}

std::string Json::as_string(const std::string& def) const {
    return type_ == STRING ? string_ : def;
}

const std::vector<Json>& Json::as_array() const {
    static std::vector<Json> empty;
    return type_ == ARRAY ? array_ : empty;
}

const std::map<std::string, Json>& Json::as_object() const {
    static std::map<std::string, Json> empty;
    return type_ == OBJECT ? object_ : empty;
}

const Json& Json::operator[](const std::string& key) const {
    static Json null_json;
    if (type_ != OBJECT) return null_json;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_json;
}

const Json& Json::operator[](size_t idx) const {
    static Json null_json;
    if (type_ != ARRAY || idx >= array_.size()) return null_json;
    return array_[idx];
}

bool Json::has(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

void Json::set(const std::string& key, const Json& value) {
    if (type_ != OBJECT) {
        type_ = OBJECT;
        object_.clear();
    }
    object_[key] = value;
}

void Json::push(const Json& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_.clear();
    }
    array_.push_back(value);
}

std::string Json::get_string(const std::string& key, const std::string& def) const {
    const Json& v = (*this)[key];
    return v.is_string() ? v.string_ : def;
}

int64_t Json::get_int(const std::string& key, int64_t def) const {
    const Json& v = (*this)[key];
    if (v.is_number()) return static_cast<int64_t>(v.number_);
    // Telegram ids and persisted cursors sometimes arrive quoted
    if (v.is_string() && !v.string_.empty()) {
        char* end = NULL;
        long long parsed = std::strtoll(v.string_.c_str(), &end, 10);
        if (end && *end == '\0') return static_cast<int64_t>(parsed);
    }
    return def;
}

bool Json::get_bool(const std::string& key, bool def) const {
    const Json& v = (*this)[key];
    return v.is_bool() ? v.bool_ : def;
}

Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

std::string Json::dump(int indent) const {
    std::ostringstream ss;
    dump_impl(ss, indent, 0);
    return ss.str();
}

Json Json::parse(const std::string& str) {
    size_t pos = 0;
    Json value = parse_value(str, pos, 0);
    skip_ws(str, pos);
    if (pos != str.size()) {
        throw parse_error("trailing characters", pos);
    }
    return value;
}

void Json::dump_impl(std::ostringstream& ss, int indent, int depth) const {
    const bool pretty = indent >= 0;
    std::string pad_inner = pretty ? std::string(static_cast<size_t>(indent * (depth + 1)), ' ') : "";
    std::string pad_outer = pretty ? std::string(static_cast<size_t>(indent * depth), ' ') : "";

    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case NUMBER: {
            int64_t i = static_cast<int64_t>(number_);
            if (number_ == static_cast<double>(i)) {
                ss << i;
            } else {
                ss << number_;
            }
            break;
        }
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            if (array_.empty()) {
                ss << "[]";
                break;
            }
            ss << '[';
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',';
                if (pretty) ss << '\n' << pad_inner;
                array_[i].dump_impl(ss, indent, depth + 1);
            }
            if (pretty) ss << '\n' << pad_outer;
            ss << ']';
            break;
        case OBJECT: {
            if (object_.empty()) {
                ss << "{}";
                break;
            }
            ss << '{';
            bool first = true;
            for (std::map<std::string, Json>::const_iterator it = object_.begin();
                 it != object_.end(); ++it) {
                if (!first) ss << ',';
                first = false;
                if (pretty) ss << '\n' << pad_inner;
                ss << '"';
                escape_string(ss, it->first);
                ss << (pretty ? "\": " : "\":");
                it->second.dump_impl(ss, indent, depth + 1);
            }
            if (pretty) ss << '\n' << pad_outer;
            ss << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
}

void Json::append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void Json::skip_ws(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
}

Json Json::parse_value(const std::string& s, size_t& pos, int depth) {
    if (depth > MAX_DEPTH) throw parse_error("nesting too deep", pos);

    skip_ws(s, pos);
    if (pos >= s.size()) throw parse_error("unexpected end of input", pos);

    char c = s[pos];
    if (c == 'n' || c == 't' || c == 'f') return parse_literal(s, pos);
    if (c == '"') return Json(parse_string(s, pos));
    if (c == '[') return parse_array(s, pos, depth);
    if (c == '{') return parse_object(s, pos, depth);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number(s, pos);

    throw parse_error(std::string("unexpected character '") + c + "'", pos);
}

Json Json::parse_literal(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "null") == 0) {
        pos += 4;
        return Json();
    }
    if (s.compare(pos, 4, "true") == 0) {
        pos += 4;
        return Json(true);
    }
    if (s.compare(pos, 5, "false") == 0) {
        pos += 5;
        return Json(false);
    }
    throw parse_error("invalid literal", pos);
}

Json Json::parse_number(const std::string& s, size_t& pos) {
    size_t start = pos;
    if (s[pos] == '-') pos++;

    size_t digits_start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    if (pos == digits_start) throw parse_error("expected digit", pos);

    if (pos < s.size() && s[pos] == '.') {
        pos++;
        size_t frac_start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
        if (pos == frac_start) throw parse_error("expected fraction digits", pos);
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        size_t exp_start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
        if (pos == exp_start) throw parse_error("expected exponent digits", pos);
    }
    return Json(std::strtod(s.substr(start, pos - start).c_str(), NULL));
}

uint32_t Json::parse_hex4(const std::string& s, size_t pos) {
    if (pos + 4 > s.size()) throw parse_error("truncated unicode escape", pos);
    uint32_t value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = s[i];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
        else throw parse_error("invalid unicode escape", i);
    }
    return value;
}

std::string Json::parse_string(const std::string& s, size_t& pos) {
    pos++; // opening quote
    std::string result;
    while (true) {
        if (pos >= s.size()) throw parse_error("unterminated string", pos);

        char c = s[pos];
        if (c == '"') {
            pos++;
            return result;
        }
        if (c != '\\') {
            result += c;
            pos++;
            continue;
        }

        pos++;
        if (pos >= s.size()) throw parse_error("unterminated escape", pos);
        switch (s[pos]) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                uint32_t cp = parse_hex4(s, pos + 1);
                pos += 4;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF &&
                    pos + 6 < s.size() && s[pos + 1] == '\\' && s[pos + 2] == 'u') {
                    uint32_t low = parse_hex4(s, pos + 3);
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
                append_utf8(result, cp);
                break;
            }
            default:
                throw parse_error("invalid escape", pos);
        }
        pos++;
    }
}

Json Json::parse_array(const std::string& s, size_t& pos, int depth) {
    pos++; // [
    Json arr = Json::array();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        pos++;
        return arr;
    }
    while (true) {
        arr.array_.push_back(parse_value(s, pos, depth + 1));
        skip_ws(s, pos);
        if (pos >= s.size()) throw parse_error("unterminated array", pos);
        if (s[pos] == ']') {
            pos++;
            return arr;
        }
        if (s[pos] != ',') throw parse_error("expected ',' or ']'", pos);
        pos++;
    }
}

Json Json::parse_object(const std::string& s, size_t& pos, int depth) {
    pos++; // {
    Json obj = Json::object();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        pos++;
        return obj;
    }
    while (true) {
        skip_ws(s, pos);
        if (pos >= s.size()) throw parse_error("unterminated object", pos);
        if (s[pos] != '"') throw parse_error("expected key", pos);
        std::string key = parse_string(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ':') throw parse_error("expected ':'", pos);
        pos++;
        obj.object_[key] = parse_value(s, pos, depth + 1);
        skip_ws(s, pos);
        if (pos >= s.size()) throw parse_error("unterminated object", pos);
        if (s[pos] == '}') {
            pos++;
            return obj;
        }
        if (s[pos] != ',') throw parse_error("expected ',' or '}'", pos);
        pos++;
    }
}

} // namespace matebridge
