#ifndef MATEBRIDGE_BRIDGE_TYPING_INDICATOR_HPP
#define MATEBRIDGE_BRIDGE_TYPING_INDICATOR_HPP

#include <matebridge/bridge/conversation.hpp>
#include <matebridge/channels/chat_transport.hpp>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>

namespace matebridge {

// Keeps "typing..." visible in a chat while its reply is pending
class TypingIndicator {
public:
    TypingIndicator(ChatTransport& transport, ConversationRegistry& registry);
    ~TypingIndicator();
    
    // Mark a chat as typing and send the first indicator right away
    void start_typing(const std::string& owner);
    void stop_typing(const std::string& owner);
    
    // Check if we should send typing indicator (with throttling)
    bool should_send_typing(const std::string& owner);
    
    std::vector<std::string> active_chats() const;
    
    // One pass: drop owners whose reply arrived, refresh the rest
    void tick();
    
    // Ticker thread
    void start();
    void stop();
    
    void set_interval(int ms) { interval_ms_ = ms; }
    int interval() const { return interval_ms_; }

private:
    ChatTransport& transport_;
    ConversationRegistry& registry_;
    int interval_ms_;
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> last_typing_;   // owner -> last send time
    std::map<std::string, bool> is_typing_;
    std::atomic<bool> running_;
    std::thread thread_;
    
    void send_for(const std::string& owner);
    void run_loop();
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_TYPING_INDICATOR_HPP
