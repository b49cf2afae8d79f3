#include <matebridge/bridge/transcript_tailer.hpp>
#include <matebridge/bridge/annotation.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>
#include <fstream>
#include <sstream>
#include <vector>
#include <sys/stat.h>

namespace matebridge {

const size_t TranscriptTailer::TOOL_RESULT_LIMIT;

TailResult TranscriptTailer::read_new(const std::string& path,
                                      int64_t read_offset,
                                      const SeenKeys& seen_keys) {
    TailResult result;
    result.new_offset = read_offset;
    result.seen_keys = seen_keys;

    struct stat st;
    if (stat(path.c_str(), &st) != 0) return result;
    result.file_found = true;
    if (static_cast<int64_t>(st.st_size) <= read_offset) return result;

    std::ifstream f(path.c_str(), std::ios::in | std::ios::binary);
    if (!f.is_open()) {
        LOG_DEBUG("[Tailer] Cannot open %s", path.c_str());
        return result;
    }
    f.seekg(static_cast<std::streamoff>(read_offset));
    std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    std::vector<std::string> rendered;
    int64_t consumed_end = read_offset;
    size_t pos = 0;

    while (pos < data.size()) {
        size_t nl = data.find('\n', pos);
        bool terminated = nl != std::string::npos;
        size_t line_end = terminated ? nl : data.size();
        size_t next = terminated ? nl + 1 : data.size();
        int64_t line_start = read_offset + static_cast<int64_t>(pos);
        LineKey key(path, line_start);

        if (result.seen_keys.count(key)) {
            pos = next;
            consumed_end = read_offset + static_cast<int64_t>(next);
            continue;
        }

        std::string line = trim(data.substr(pos, line_end - pos));
        if (line.empty()) {
            if (!terminated) break;
            pos = next;
            consumed_end = read_offset + static_cast<int64_t>(next);
            continue;
        }

        Json event;
        try {
            event = Json::parse(line);
        } catch (const std::runtime_error& e) {
            if (!terminated) {
                // Producer is still writing this line
                LOG_DEBUG("[Tailer] Partial line at %s:%lld", path.c_str(),
                          static_cast<long long>(line_start));
                break;
            }
            LOG_DEBUG("[Tailer] Skipping malformed line at %s:%lld: %s", path.c_str(),
                      static_cast<long long>(line_start), e.what());
            result.malformed++;
            result.seen_keys.insert(key);
            pos = next;
            consumed_end = read_offset + static_cast<int64_t>(next);
            continue;
        }

        std::string text = render_event(event);
        if (!text.empty()) {
            rendered.push_back(text);
            result.events++;
        }
        result.seen_keys.insert(key);
        pos = next;
        consumed_end = read_offset + static_cast<int64_t>(next);
    }

    if (!rendered.empty()) {
        result.text = join(rendered, "\n\n\n");
        result.new_offset = consumed_end;
        prune_seen(result.seen_keys, path, consumed_end);
    }
    return result;
}

void TranscriptTailer::prune_seen(SeenKeys& keys, const std::string& path, int64_t offset) {
    SeenKeys::iterator it = keys.lower_bound(LineKey(path, INT64_MIN));
    while (it != keys.end() && it->first == path && it->second < offset) {
        keys.erase(it++);
    }
}

bool TranscriptTailer::is_agent_event(const Json& event) {
    if (event.get_string("type") == "assistant") return true;
    return event["message"].get_string("role") == "assistant";
}

std::string TranscriptTailer::render_event(const Json& event) {
    if (!event.is_object() || !is_agent_event(event)) return "";

    const Json& content = event["message"]["content"];
    if (content.is_string()) {
        std::string text = content.as_string();
        if (trim(text).empty() || AnnotationExtractor::is_bare_tag_segment(text)) return "";
        return text;
    }

    std::vector<std::string> fragments;
    const std::vector<Json>& segments = content.as_array();
    for (size_t i = 0; i < segments.size(); ++i) {
        std::string fragment = render_segment(segments[i]);
        if (!trim(fragment).empty()) fragments.push_back(fragment);
    }
    return join(fragments, "\n\n");
}

std::string TranscriptTailer::render_segment(const Json& segment) {
    std::string type = segment.get_string("type");

    if (type == "text") {
        std::string text = segment.get_string("text");
        if (AnnotationExtractor::is_bare_tag_segment(text)) return "";
        return text;
    }
    if (type == "thinking" || type == "redacted_thinking") return "";
    if (type == "tool_use") return render_tool_use(segment);
    if (type == "tool_result") return render_tool_result(segment);
    if (type == "artifact") return render_artifact(segment);

    if (!type.empty()) {
        LOG_DEBUG("[Tailer] Ignoring segment type '%s'", type.c_str());
    }
    return "";
}

std::string TranscriptTailer::render_tool_use(const Json& segment) {
    std::ostringstream oss;
    oss << "[Tool: " << segment.get_string("name", "unknown") << "]";
    const Json& input = segment["input"];
    if (!input.is_null()) {
        oss << "\n```json\n" << input.dump(2) << "\n```";
    }
    return oss.str();
}

std::string TranscriptTailer::render_tool_result(const Json& segment) {
    const Json& content = segment["content"];
    std::string body;
    if (content.is_string()) {
        body = content.as_string();
    } else if (content.is_array()) {
        std::vector<std::string> parts;
        const std::vector<Json>& items = content.as_array();
        for (size_t i = 0; i < items.size(); ++i) {
            if (items[i].is_string()) {
                parts.push_back(items[i].as_string());
            } else if (items[i].get_string("type") == "text") {
                parts.push_back(items[i].get_string("text"));
            } else if (!items[i].get_string("type").empty()) {
                parts.push_back("[" + items[i].get_string("type") + "]");
            }
        }
        body = join(parts, "\n");
    }

    size_t body_chars = utf8_length(body);
    if (body_chars > TOOL_RESULT_LIMIT) {
        std::string kept = truncate_chars(body, TOOL_RESULT_LIMIT);
        std::ostringstream marker;
        marker << "\n... [truncated " << (body_chars - TOOL_RESULT_LIMIT) << " chars]";
        body = kept + marker.str();
    }

    std::string label = segment.get_bool("is_error") ? "[Tool error]" : "[Tool result]";
    if (trim(body).empty()) return label;
    return label + "\n" + body;
}

std::string TranscriptTailer::artifact_language(const Json& segment) {
    std::string language = segment.get_string("language");
    if (!language.empty()) return language;

    std::string content_type = to_lower(segment.get_string("content_type"));
    if (content_type == "application/vnd.ant.react") return "jsx";
    size_t slash = content_type.find('/');
    if (slash != std::string::npos) {
        std::string sub = content_type.substr(slash + 1);
        if (starts_with(sub, "vnd.ant.")) sub = sub.substr(8);
        if (starts_with(sub, "x-")) sub = sub.substr(2);
        size_t plus = sub.find('+');
        if (plus != std::string::npos) sub = sub.substr(0, plus);
        if (!sub.empty() && sub != "code" && sub != "plain") return sub;
    }

    std::string title = segment.get_string("title");
    size_t dot = title.rfind('.');
    if (dot != std::string::npos && dot + 1 < title.size()) {
        return to_lower(title.substr(dot + 1));
    }
    return "";
}

std::string TranscriptTailer::render_artifact(const Json& segment) {
    std::ostringstream oss;
    oss << "[Artifact: " << segment.get_string("title", "untitled") << "]";
    std::string content_type = segment.get_string("content_type");
    if (!content_type.empty()) oss << " (" << content_type << ")";

    std::string body = segment.get_string("content");
    if (!body.empty()) {
        oss << "\n```" << artifact_language(segment) << "\n" << body;
        if (body[body.size() - 1] != '\n') oss << "\n";
        oss << "```";
    }
    return oss.str();
}

} // namespace matebridge
