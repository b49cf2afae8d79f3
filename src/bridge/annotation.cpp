#include <matebridge/bridge/annotation.hpp>
#include <matebridge/core/utils.hpp>
#include <cctype>
#include <cstring>

namespace matebridge {

namespace {

const char* KV_START = "-- memory";
const char* KV_END = "-- done";

bool is_tag_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':';
}

// Tag name right after '<' at pos, empty if none
std::string tag_name_at(const std::string& text, size_t pos) {
    if (pos >= text.size() || text[pos] != '<') return "";
    size_t end = pos + 1;
    while (end < text.size() && is_tag_name_char(text[end])) end++;
    return text.substr(pos + 1, end - pos - 1);
}

} // namespace

const std::vector<std::string>& AnnotationExtractor::annotation_tags() {
    static std::vector<std::string> tags;
    if (tags.empty()) {
        tags.push_back("observation");
        tags.push_back("fact");
        tags.push_back("narrative");
        tags.push_back("concept");
        tags.push_back("memory_update");
    }
    return tags;
}

bool AnnotationExtractor::is_annotation_tag(const std::string& name) {
    const std::vector<std::string>& tags = annotation_tags();
    for (size_t i = 0; i < tags.size(); ++i) {
        if (tags[i] == name) return true;
    }
    return false;
}

Extraction AnnotationExtractor::extract(const std::string& raw) {
    std::vector<std::string> captured;
    std::string rest = strip_kv_blocks(raw, captured);
    rest = strip_tagged_elements(rest, captured);

    Extraction result;
    result.annotation = join(captured, "\n");
    result.display = trim(collapse_blank_lines(rest));
    return result;
}

std::string AnnotationExtractor::strip_kv_blocks(const std::string& text,
                                                 std::vector<std::string>& captured) {
    std::vector<std::string> lines = split(text, '\n');
    if (!text.empty() && text[text.size() - 1] == '\n') lines.push_back("");

    std::vector<std::string> kept;
    size_t i = 0;
    while (i < lines.size()) {
        std::string line = rtrim(lines[i]);
        bool opens = ends_with(line, KV_START) &&
                     (line.size() == std::strlen(KV_START) ||
                      std::isspace(static_cast<unsigned char>(line[line.size() - std::strlen(KV_START) - 1])));
        if (!opens) {
            kept.push_back(lines[i]);
            i++;
            continue;
        }

        size_t close = i + 1;
        while (close < lines.size() && trim(lines[close]) != KV_END) close++;
        if (close >= lines.size()) {
            // Unterminated block stays visible
            kept.push_back(lines[i]);
            i++;
            continue;
        }

        std::string prose = rtrim(line.substr(0, line.size() - std::strlen(KV_START)));
        if (!prose.empty()) kept.push_back(prose);

        std::vector<std::string> interior(lines.begin() + i + 1, lines.begin() + close);
        std::string body = trim(join(interior, "\n"));
        if (!body.empty()) captured.push_back(body);
        i = close + 1;
    }
    return join(kept, "\n");
}

std::string AnnotationExtractor::strip_tagged_elements(const std::string& text,
                                                       std::vector<std::string>& captured) {
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t lt = text.find('<', pos);
        if (lt == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, lt - pos);

        std::string name = tag_name_at(text, lt);
        size_t after_name = lt + 1 + name.size();
        bool opens = is_annotation_tag(name) && after_name < text.size() &&
                     (text[after_name] == '>' || std::isspace(static_cast<unsigned char>(text[after_name])));
        if (opens) {
            size_t open_end = text.find('>', after_name);
            std::string close_tag = "</" + name + ">";
            size_t close = open_end == std::string::npos ? std::string::npos
                                                        : text.find(close_tag, open_end + 1);
            if (close != std::string::npos) {
                size_t end = close + close_tag.size();
                captured.push_back(text.substr(lt, end - lt));
                pos = end;
                continue;
            }
        }

        // Not a complete annotation element: keep the '<' literally
        out += '<';
        pos = lt + 1;
    }
    return out;
}

std::string AnnotationExtractor::collapse_blank_lines(const std::string& text) {
    std::vector<std::string> lines = split(text, '\n');
    if (!text.empty() && text[text.size() - 1] == '\n') lines.push_back("");

    std::vector<std::string> out;
    bool previous_blank = false;
    for (size_t i = 0; i < lines.size(); ++i) {
        bool blank = trim(lines[i]).empty();
        if (blank) {
            if (!previous_blank) out.push_back("");
        } else {
            out.push_back(lines[i]);
        }
        previous_blank = blank;
    }
    return join(out, "\n");
}

bool AnnotationExtractor::is_bare_tag_segment(const std::string& text) {
    std::string t = trim(text);
    std::string name = tag_name_at(t, 0);
    if (name.empty() || is_annotation_tag(name)) return false;

    size_t after_name = 1 + name.size();
    if (after_name >= t.size() ||
        !(t[after_name] == '>' || t[after_name] == '/' ||
          std::isspace(static_cast<unsigned char>(t[after_name])))) {
        return false;
    }
    return ends_with(t, "</" + name + ">");
}

} // namespace matebridge
