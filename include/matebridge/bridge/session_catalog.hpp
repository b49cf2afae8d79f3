#ifndef MATEBRIDGE_BRIDGE_SESSION_CATALOG_HPP
#define MATEBRIDGE_BRIDGE_SESSION_CATALOG_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace matebridge {

// One line of the agent's prompt history file
struct HistoryEntry {
    std::string display;    // Prompt as the user typed it
    std::string project;    // Working directory of the session
    int64_t timestamp;
    
    HistoryEntry() : timestamp(0) {}
};

// Read-only view over the agent's on-disk session data
class SessionCatalog {
public:
    // Newest *.jsonl in dir by modification time, empty if none
    static std::string latest_transcript(const std::string& dir);
    
    // Most recent history entries, newest first. Unparseable lines are skipped.
    static std::vector<HistoryEntry> recent_sessions(const std::string& history_file,
                                                     size_t limit = 5);
    
    // Session id (file stem) of the newest transcript kept for a project
    // directory, empty if the project has none
    static std::string session_id_for_project(const std::string& projects_dir,
                                              const std::string& project);
    
    // "/home/u/app" -> "home-u-app"
    static std::string encode_project_path(const std::string& project);
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_SESSION_CATALOG_HPP
