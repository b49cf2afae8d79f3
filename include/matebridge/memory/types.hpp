/*
 * MateBridge C++11 - Memory Types
 * 
 * Records kept by the per-chat memory store.
 */
#ifndef MATEBRIDGE_MEMORY_TYPES_HPP
#define MATEBRIDGE_MEMORY_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace matebridge {

// Content longer than this many characters is cut before storing
const size_t MEMORY_MAX_CONTENT_CHARS = 10000;

enum class MemoryKind {
    CONVERSATION,   // Q/A pair written after a delivered reply
    MANUAL,         // /remember
    META_UPDATE     // Annotation extracted from agent output
};

inline std::string memory_kind_to_string(MemoryKind k) {
    switch (k) {
        case MemoryKind::CONVERSATION: return "conversation";
        case MemoryKind::MANUAL: return "manual";
        case MemoryKind::META_UPDATE: return "meta_update";
    }
    return "conversation";
}

inline bool parse_memory_kind(const std::string& s, MemoryKind& out) {
    if (s == "conversation") { out = MemoryKind::CONVERSATION; return true; }
    if (s == "manual") { out = MemoryKind::MANUAL; return true; }
    if (s == "meta_update") { out = MemoryKind::META_UPDATE; return true; }
    return false;
}

typedef std::map<std::string, std::string> MemoryMetadata;

struct MemoryRecord {
    std::string id;         // SHA-256 of owner:content:created_at seconds
    std::string owner;      // Partition key (chat id)
    std::string content;
    int64_t created_at;     // Unix ms
    int64_t seq;            // Insertion order, breaks created_at ties
    MemoryMetadata metadata;
    MemoryKind kind;
    
    MemoryRecord() : created_at(0), seq(0), kind(MemoryKind::CONVERSATION) {}
};

struct MemoryStats {
    int64_t count;
    int64_t newest;         // Unix ms, 0 when empty
    int64_t oldest;
    std::map<std::string, int64_t> by_kind;
    
    MemoryStats() : count(0), newest(0), oldest(0) {}
};

} // namespace matebridge

#endif // MATEBRIDGE_MEMORY_TYPES_HPP
