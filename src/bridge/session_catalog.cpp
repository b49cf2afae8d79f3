#include <matebridge/bridge/session_catalog.hpp>
#include <matebridge/core/json.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>
#include <algorithm>
#include <fstream>
#include <dirent.h>
#include <sys/stat.h>

namespace matebridge {

namespace {

bool newer_first(const HistoryEntry& a, const HistoryEntry& b) {
    return a.timestamp > b.timestamp;
}

// Newest regular *.jsonl file in dir, ties broken by name
std::string newest_jsonl(const std::string& dir) {
    DIR* d = opendir(dir.c_str());
    if (!d) return "";

    std::string best;
    int64_t best_mtime = -1;
    struct dirent* entry;
    while ((entry = readdir(d)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        if (!ends_with(name, ".jsonl")) continue;

        std::string path = join_path(dir, name);
        struct stat st;
        if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;

        int64_t mtime = static_cast<int64_t>(st.st_mtime);
        if (mtime > best_mtime || (mtime == best_mtime && path > best)) {
            best = path;
            best_mtime = mtime;
        }
    }
    closedir(d);
    return best;
}

} // namespace

std::string SessionCatalog::latest_transcript(const std::string& dir) {
    return newest_jsonl(dir);
}

std::vector<HistoryEntry> SessionCatalog::recent_sessions(const std::string& history_file,
                                                          size_t limit) {
    std::vector<HistoryEntry> result;
    std::ifstream in(history_file.c_str());
    if (!in) return result;

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;
        try {
            Json j = Json::parse(line);
            if (!j.is_object()) continue;
            HistoryEntry e;
            e.display = j.get_string("display", "?");
            e.project = j.get_string("project");
            e.timestamp = j.get_int("timestamp");
            result.push_back(e);
        } catch (const std::runtime_error&) {
            LOG_DEBUG("[Sessions] Skipping malformed history line");
        }
    }

    std::stable_sort(result.begin(), result.end(), newer_first);
    if (result.size() > limit) result.resize(limit);
    return result;
}

std::string SessionCatalog::encode_project_path(const std::string& project) {
    std::string encoded = replace_all(project, "/", "-");
    size_t start = encoded.find_first_not_of('-');
    return start == std::string::npos ? "" : encoded.substr(start);
}

std::string SessionCatalog::session_id_for_project(const std::string& projects_dir,
                                                   const std::string& project) {
    std::string encoded = encode_project_path(project);
    if (encoded.empty()) return "";

    const std::string candidates[] = { "-" + encoded, encoded };
    for (size_t i = 0; i < 2; ++i) {
        std::string dir = join_path(projects_dir, candidates[i]);
        if (!is_directory(dir)) continue;

        std::string newest = newest_jsonl(dir);
        if (newest.empty()) continue;

        std::string name = basename(newest);
        return name.substr(0, name.size() - 6);
    }
    return "";
}

} // namespace matebridge
