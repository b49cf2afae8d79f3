#include <matebridge/bridge/response_coordinator.hpp>
#include <matebridge/core/json.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>
#include <sys/stat.h>
#include <sstream>
#include <vector>

namespace matebridge {

namespace {

const size_t REPLY_MEMORY_LIMIT = 2000;
const size_t ANNOTATION_MEMORY_LIMIT = 5000;

// Clears the in-progress flag on scope exit
class InProgressGuard {
public:
    explicit InProgressGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InProgressGuard() { flag_ = false; }
private:
    std::atomic<bool>& flag_;
};

std::string to_decimal(int64_t v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace

const char* coordinator_state_str(CoordinatorState s) {
    switch (s) {
        case CoordinatorState::IDLE: return "idle";
        case CoordinatorState::AWAITING: return "awaiting";
        case CoordinatorState::DELIVERING: return "delivering";
        case CoordinatorState::TIMED_OUT: return "timed_out";
    }
    return "unknown";
}

const char* check_result_str(CheckResult r) {
    switch (r) {
        case CheckResult::IDLE: return "idle";
        case CheckResult::BUSY: return "busy";
        case CheckResult::NO_LOG: return "no_log";
        case CheckResult::TIMED_OUT: return "timed_out";
        case CheckResult::NO_CONTENT: return "no_content";
        case CheckResult::DELIVERED: return "delivered";
        case CheckResult::ANNOTATION_ONLY: return "annotation_only";
        case CheckResult::DELIVERY_FAILED: return "delivery_failed";
    }
    return "unknown";
}

ResponseCoordinator::ResponseCoordinator(ConversationRegistry& registry,
                                         ChatTransport& transport,
                                         MemoryStore* store,
                                         LocateFn locate,
                                         const CoordinatorOptions& opts)
    : registry_(registry)
    , transport_(transport)
    , store_(store)
    , locate_(locate)
    , opts_(opts)
    , in_progress_(false)
    , state_(CoordinatorState::IDLE)
    , use_counter_(0)
    , running_(false) {
    if (opts_.max_tracked_files == 0) opts_.max_tracked_files = 1;
}

ResponseCoordinator::~ResponseCoordinator() {
    stop();
}

CheckResult ResponseCoordinator::check_for_responses() {
    bool expected = false;
    if (!in_progress_.compare_exchange_strong(expected, true)) {
        return CheckResult::BUSY;
    }
    InProgressGuard guard(in_progress_);
    std::lock_guard<std::mutex> lock(mutex_);

    bool expired = expire_stale_pending();

    std::string owner;
    if (!registry_.active_owner(owner)) {
        state_ = CoordinatorState::IDLE;
        return expired ? CheckResult::TIMED_OUT : CheckResult::IDLE;
    }

    state_ = CoordinatorState::AWAITING;
    return check_locked(owner);
}

// Clears every pending marker older than the timeout, active owner or not
bool ResponseCoordinator::expire_stale_pending() {
    bool expired = false;
    std::vector<std::string> owners = registry_.owners();
    for (std::vector<std::string>::const_iterator it = owners.begin(); it != owners.end(); ++it) {
        if (!registry_.is_pending(*it)) continue;
        int64_t age = registry_.pending_age_ms(*it);
        if (age < opts_.pending_timeout_ms) continue;
        state_ = CoordinatorState::TIMED_OUT;
        LOG_WARN("[Coordinator] No reply for %s after %lld s, clearing pending",
                 it->c_str(), static_cast<long long>(age / 1000));
        registry_.clear_pending(*it);
        expired = true;
    }
    if (expired) state_ = CoordinatorState::IDLE;
    return expired;
}

CheckResult ResponseCoordinator::check_locked(const std::string& owner) {
    std::string path = locate_ ? locate_() : std::string();
    if (path.empty()) return CheckResult::NO_LOG;

    TailState* ts = adopt(path);
    if (!ts) return CheckResult::NO_LOG;

    TailResult result = TranscriptTailer::read_new(path, ts->read_offset, ts->seen_keys);
    if (!result.file_found) return CheckResult::NO_LOG;
    if (result.text.empty()) {
        ts->seen_keys = result.seen_keys;
        return CheckResult::NO_CONTENT;
    }

    state_ = CoordinatorState::DELIVERING;
    Extraction ex = AnnotationExtractor::extract(result.text);

    ConversationContext ctx;
    if (!registry_.get(owner, ctx)) {
        state_ = CoordinatorState::AWAITING;
        return CheckResult::NO_CONTENT;
    }

    if (ex.display.empty()) {
        // Annotation-only turn: keep waiting for the visible reply
        commit(*ts, result);
        persist_memory(ctx, ex);
        state_ = CoordinatorState::AWAITING;
        return CheckResult::ANNOTATION_ONLY;
    }

    SendResult sent = transport_.send_text(ctx.chat_id, ex.display);
    if (!sent.success) {
        LOG_WARN("[Coordinator] Delivery to %s failed (%s), will retry",
                 owner.c_str(), sent.error.c_str());
        state_ = CoordinatorState::AWAITING;
        return CheckResult::DELIVERY_FAILED;
    }

    LOG_INFO("[Coordinator] Delivered %zu bytes to %s", ex.display.size(), owner.c_str());
    commit(*ts, result);
    registry_.clear_pending(owner);
    persist_memory(ctx, ex);
    state_ = CoordinatorState::IDLE;
    return CheckResult::DELIVERED;
}

bool ResponseCoordinator::salvage(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool delivered = false;
    ConversationContext ctx;
    std::string path = locate_ ? locate_() : std::string();
    TailState* ts = path.empty() ? nullptr : adopt(path);

    if (ts && registry_.get(owner, ctx)) {
        TailResult result = TranscriptTailer::read_new(path, ts->read_offset, ts->seen_keys);
        if (!result.text.empty()) {
            Extraction ex = AnnotationExtractor::extract(result.text);
            if (ex.display.empty()) {
                commit(*ts, result);
                persist_memory(ctx, ex);
            } else {
                SendResult sent = transport_.send_text(ctx.chat_id, ex.display);
                if (sent.success) {
                    commit(*ts, result);
                    persist_memory(ctx, ex);
                    delivered = true;
                } else {
                    LOG_WARN("[Coordinator] Salvage delivery failed: %s", sent.error.c_str());
                }
            }
        } else {
            ts->seen_keys = result.seen_keys;
        }
    }

    registry_.clear_pending(owner);
    state_ = CoordinatorState::IDLE;
    return delivered;
}

bool ResponseCoordinator::prime() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string path = locate_ ? locate_() : std::string();
    if (path.empty()) return false;

    bool known = states_.find(path) != states_.end();
    TailState* ts = adopt(path);
    if (!ts) return false;
    if (known) {
        LOG_INFO("[Coordinator] Resuming %s at offset %lld", path.c_str(),
                 static_cast<long long>(ts->read_offset));
        return true;
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    ts->read_offset = static_cast<int64_t>(st.st_size);
    ts->seen_keys.clear();
    LOG_INFO("[Coordinator] Tailing %s from offset %lld", path.c_str(),
             static_cast<long long>(ts->read_offset));
    save_checkpoint_locked();
    return true;
}

TailState* ResponseCoordinator::adopt(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        LOG_DEBUG("[Coordinator] Transcript %s not accessible", path.c_str());
        return nullptr;
    }

    if (path != current_path_) {
        if (!current_path_.empty()) {
            LOG_INFO("[Coordinator] Switching transcript %s -> %s",
                     current_path_.c_str(), path.c_str());
        }
        current_path_ = path;
    }

    uint64_t device = static_cast<uint64_t>(st.st_dev);
    uint64_t inode = static_cast<uint64_t>(st.st_ino);

    std::map<std::string, TailState>::iterator it = states_.find(path);
    if (it == states_.end()) {
        TailState fresh;
        fresh.path = path;
        fresh.device = device;
        fresh.inode = inode;
        it = states_.insert(std::make_pair(path, fresh)).first;
    } else if (it->second.device != device || it->second.inode != inode) {
        LOG_INFO("[Coordinator] %s was replaced, starting over", path.c_str());
        TailState fresh;
        fresh.path = path;
        fresh.device = device;
        fresh.inode = inode;
        it->second = fresh;
    } else if (static_cast<int64_t>(st.st_size) < it->second.read_offset) {
        LOG_INFO("[Coordinator] %s shrank below offset %lld, starting over", path.c_str(),
                 static_cast<long long>(it->second.read_offset));
        it->second.read_offset = 0;
        it->second.seen_keys.clear();
    }

    it->second.last_used = ++use_counter_;
    evict_if_needed();
    return &states_[path];
}

void ResponseCoordinator::evict_if_needed() {
    while (states_.size() > opts_.max_tracked_files) {
        std::map<std::string, TailState>::iterator victim = states_.end();
        for (std::map<std::string, TailState>::iterator it = states_.begin();
             it != states_.end(); ++it) {
            if (it->first == current_path_) continue;
            if (victim == states_.end() || it->second.last_used < victim->second.last_used) {
                victim = it;
            }
        }
        if (victim == states_.end()) return;
        LOG_DEBUG("[Coordinator] Forgetting tail state of %s", victim->first.c_str());
        states_.erase(victim);
    }
}

void ResponseCoordinator::commit(TailState& ts, const TailResult& result) {
    ts.read_offset = result.new_offset;
    ts.seen_keys = result.seen_keys;
    save_checkpoint_locked();
}

void ResponseCoordinator::persist_memory(const ConversationContext& ctx, const Extraction& ex) {
    if (!store_ || !opts_.memory_enabled) return;

    MemoryMetadata meta;
    meta["chat_id"] = to_decimal(ctx.chat_id);
    meta["source"] = "transcript";

    if (!ctx.last_user_message.empty() && !ex.display.empty()) {
        std::string pair = "Q: " + ctx.last_user_message + "\nA: " +
                           truncate_chars(ex.display, REPLY_MEMORY_LIMIT);
        if (!store_->add(ctx.owner, pair, meta, MemoryKind::CONVERSATION)) {
            LOG_WARN("[Coordinator] Failed to store conversation: %s", store_->last_error().c_str());
        }
    }

    if (!ex.annotation.empty()) {
        std::string note = truncate_chars(ex.annotation, ANNOTATION_MEMORY_LIMIT);
        if (store_->add(ctx.owner, note, meta, MemoryKind::META_UPDATE)) {
            LOG_INFO("[Coordinator] Stored memory annotation for %s", ctx.owner.c_str());
        } else {
            LOG_WARN("[Coordinator] Failed to store annotation: %s", store_->last_error().c_str());
        }
    }
}

std::string ResponseCoordinator::current_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_path_;
}

bool ResponseCoordinator::get_tail_state(const std::string& path, TailState& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, TailState>::const_iterator it = states_.find(path);
    if (it == states_.end()) return false;
    out = it->second;
    return true;
}

size_t ResponseCoordinator::tracked_files() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

bool ResponseCoordinator::save_checkpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_checkpoint_locked();
}

bool ResponseCoordinator::save_checkpoint_locked() {
    if (opts_.checkpoint_path.empty()) return true;

    Json files = Json::array();
    for (std::map<std::string, TailState>::const_iterator it = states_.begin();
         it != states_.end(); ++it) {
        Json entry = Json::object();
        entry.set("path", Json(it->second.path));
        entry.set("device", Json(to_decimal(static_cast<int64_t>(it->second.device))));
        entry.set("inode", Json(to_decimal(static_cast<int64_t>(it->second.inode))));
        entry.set("offset", Json(it->second.read_offset));
        files.push(entry);
    }
    Json root = Json::object();
    root.set("current", Json(current_path_));
    root.set("files", files);

    if (!write_file_atomic(opts_.checkpoint_path, root.dump(2))) {
        LOG_WARN("[Coordinator] Failed to write checkpoint %s", opts_.checkpoint_path.c_str());
        return false;
    }
    return true;
}

bool ResponseCoordinator::load_checkpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (opts_.checkpoint_path.empty()) return false;

    std::string content;
    if (!read_file(opts_.checkpoint_path, content)) return false;

    Json root;
    try {
        root = Json::parse(content);
    } catch (const std::runtime_error& e) {
        LOG_WARN("[Coordinator] Ignoring corrupt checkpoint %s: %s",
                 opts_.checkpoint_path.c_str(), e.what());
        return false;
    }

    const std::vector<Json>& files = root["files"].as_array();
    for (size_t i = 0; i < files.size(); ++i) {
        TailState ts;
        ts.path = files[i].get_string("path");
        if (ts.path.empty()) continue;
        // Device and inode are stored as strings to keep all 64 bits
        ts.device = static_cast<uint64_t>(files[i].get_int("device"));
        ts.inode = static_cast<uint64_t>(files[i].get_int("inode"));
        ts.read_offset = files[i].get_int("offset");
        ts.last_used = ++use_counter_;
        states_[ts.path] = ts;
    }
    current_path_ = root.get_string("current");
    evict_if_needed();
    LOG_INFO("[Coordinator] Restored %zu tail states", states_.size());
    return true;
}

void ResponseCoordinator::start() {
    if (running_) return;
    running_ = true;
    watch_thread_ = std::thread(&ResponseCoordinator::watch_loop, this);
    poll_thread_ = std::thread(&ResponseCoordinator::poll_loop, this);
}

void ResponseCoordinator::stop() {
    running_ = false;
    if (watch_thread_.joinable()) watch_thread_.join();
    if (poll_thread_.joinable()) poll_thread_.join();
}

void ResponseCoordinator::watch_loop() {
    std::string last_path;
    int64_t last_size = -1;
    int64_t last_mtime = -1;
    uint64_t last_inode = 0;

    while (running_) {
        try {
            std::string path = locate_ ? locate_() : std::string();
            struct stat st;
            if (!path.empty() && stat(path.c_str(), &st) == 0) {
                int64_t size = static_cast<int64_t>(st.st_size);
                int64_t mtime = static_cast<int64_t>(st.st_mtime);
                uint64_t inode = static_cast<uint64_t>(st.st_ino);
                if (path != last_path || size != last_size || mtime != last_mtime || inode != last_inode) {
                    last_path = path;
                    last_size = size;
                    last_mtime = mtime;
                    last_inode = inode;
                    check_for_responses();
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR("[Coordinator] Watcher iteration failed: %s", e.what());
        }
        sleep_ms(opts_.watch_interval_ms);
    }
}

void ResponseCoordinator::poll_loop() {
    while (running_) {
        try {
            check_for_responses();
        } catch (const std::exception& e) {
            LOG_ERROR("[Coordinator] Poll iteration failed: %s", e.what());
        }
        sleep_ms(opts_.poll_interval_ms);
    }
}

} // namespace matebridge
