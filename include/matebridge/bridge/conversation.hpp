/*
 * MateBridge C++11 - Conversation Registry
 *
 * Per-owner session context. The owner is the chat id in string form; the
 * pending marker gates dispatch and drives the reply timeout.
 */
#ifndef MATEBRIDGE_BRIDGE_CONVERSATION_HPP
#define MATEBRIDGE_BRIDGE_CONVERSATION_HPP

#include <matebridge/core/types.hpp>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <cstdint>

namespace matebridge {

// "A request was dispatched and a reply is awaited"
struct PendingMarker {
    bool set;
    int64_t since_ms;
    
    PendingMarker() : set(false), since_ms(0) {}
};

struct ConversationContext {
    std::string owner;
    int64_t chat_id;
    std::string last_user_message;  // As typed, for the Q/A memory record
    std::string last_prompt;        // Full text sent to the agent
    PendingMarker pending;
    int64_t last_dispatch_ms;
    
    ConversationContext() : chat_id(0), last_dispatch_ms(0) {}
};

class ConversationRegistry {
public:
    explicit ConversationRegistry(ClockFn clock = ClockFn());
    
    int64_t now_ms() const;
    
    // Create the context if needed and return a snapshot
    ConversationContext ensure(int64_t chat_id);
    bool get(const std::string& owner, ConversationContext& out) const;
    
    void record_user_message(const std::string& owner,
                             const std::string& message,
                             const std::string& prompt);
    
    void set_pending(const std::string& owner);
    void clear_pending(const std::string& owner);
    bool is_pending(const std::string& owner) const;
    
    // 0 when not pending
    int64_t pending_age_ms(const std::string& owner) const;
    
    // Owner with the most recent pending dispatch
    bool active_owner(std::string& out) const;
    
    std::vector<std::string> owners() const;
    
    static std::string owner_for(int64_t chat_id);

private:
    ClockFn clock_;
    mutable std::mutex mutex_;
    std::map<std::string, ConversationContext> contexts_;
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_CONVERSATION_HPP
