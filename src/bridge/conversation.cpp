#include <matebridge/bridge/conversation.hpp>
#include <matebridge/core/utils.hpp>
#include <sstream>

namespace matebridge {

ConversationRegistry::ConversationRegistry(ClockFn clock) : clock_(clock) {}

int64_t ConversationRegistry::now_ms() const {
    return clock_ ? clock_() : current_timestamp_ms();
}

std::string ConversationRegistry::owner_for(int64_t chat_id) {
    std::ostringstream oss;
    oss << chat_id;
    return oss.str();
}

ConversationContext ConversationRegistry::ensure(int64_t chat_id) {
    std::string owner = owner_for(chat_id);
    std::lock_guard<std::mutex> lock(mutex_);
    ConversationContext& ctx = contexts_[owner];
    if (ctx.owner.empty()) {
        ctx.owner = owner;
        ctx.chat_id = chat_id;
    }
    return ctx;
}

bool ConversationRegistry::get(const std::string& owner, ConversationContext& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ConversationContext>::const_iterator it = contexts_.find(owner);
    if (it == contexts_.end()) return false;
    out = it->second;
    return true;
}

void ConversationRegistry::record_user_message(const std::string& owner,
                                               const std::string& message,
                                               const std::string& prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ConversationContext>::iterator it = contexts_.find(owner);
    if (it == contexts_.end()) return;
    it->second.last_user_message = message;
    it->second.last_prompt = prompt;
}

void ConversationRegistry::set_pending(const std::string& owner) {
    int64_t now = now_ms();
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ConversationContext>::iterator it = contexts_.find(owner);
    if (it == contexts_.end()) return;
    it->second.pending.set = true;
    it->second.pending.since_ms = now;
    it->second.last_dispatch_ms = now;
}

void ConversationRegistry::clear_pending(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ConversationContext>::iterator it = contexts_.find(owner);
    if (it == contexts_.end()) return;
    it->second.pending = PendingMarker();
}

bool ConversationRegistry::is_pending(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ConversationContext>::const_iterator it = contexts_.find(owner);
    return it != contexts_.end() && it->second.pending.set;
}

int64_t ConversationRegistry::pending_age_ms(const std::string& owner) const {
    int64_t now = now_ms();
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ConversationContext>::const_iterator it = contexts_.find(owner);
    if (it == contexts_.end() || !it->second.pending.set) return 0;
    return now - it->second.pending.since_ms;
}

bool ConversationRegistry::active_owner(std::string& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    bool found = false;
    int64_t newest = 0;
    for (std::map<std::string, ConversationContext>::const_iterator it = contexts_.begin();
         it != contexts_.end(); ++it) {
        if (!it->second.pending.set) continue;
        if (!found || it->second.pending.since_ms >= newest) {
            newest = it->second.pending.since_ms;
            out = it->first;
            found = true;
        }
    }
    return found;
}

std::vector<std::string> ConversationRegistry::owners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (std::map<std::string, ConversationContext>::const_iterator it = contexts_.begin();
         it != contexts_.end(); ++it) {
        out.push_back(it->first);
    }
    return out;
}

} // namespace matebridge
