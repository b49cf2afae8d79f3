/*
 * MateBridge C++11 - Transcript Tailer
 *
 * Incremental reader over the agent's JSONL transcript. Each call scans from
 * a byte offset, renders agent-authored events to text and reports how far
 * the caller may advance. Lines already seen are skipped by their
 * (path, start offset) key.
 */
#ifndef MATEBRIDGE_BRIDGE_TRANSCRIPT_TAILER_HPP
#define MATEBRIDGE_BRIDGE_TRANSCRIPT_TAILER_HPP

#include <matebridge/core/json.hpp>
#include <string>
#include <set>
#include <utility>
#include <cstdint>

namespace matebridge {

typedef std::pair<std::string, int64_t> LineKey;
typedef std::set<LineKey> SeenKeys;

struct TailResult {
    std::string text;           // Rendered agent output, empty if none
    int64_t new_offset;         // Input offset unless text was found
    SeenKeys seen_keys;
    int events;                 // Agent events that produced text
    int malformed;              // Complete lines that failed to parse
    bool file_found;

    TailResult() : new_offset(0), events(0), malformed(0), file_found(false) {}
};

class TranscriptTailer {
public:
    static const size_t TOOL_RESULT_LIMIT = 3000;

    static TailResult read_new(const std::string& path,
                               int64_t read_offset,
                               const SeenKeys& seen_keys);

    // Rendered text of one transcript record; empty for records that are
    // not agent-authored or carry nothing displayable
    static std::string render_event(const Json& event);

    static std::string render_segment(const Json& segment);

    // Drop keys of this path that start before offset
    static void prune_seen(SeenKeys& keys, const std::string& path, int64_t offset);

private:
    static bool is_agent_event(const Json& event);
    static std::string render_tool_use(const Json& segment);
    static std::string render_tool_result(const Json& segment);
    static std::string render_artifact(const Json& segment);
    static std::string artifact_language(const Json& segment);
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_TRANSCRIPT_TAILER_HPP
