#ifndef MATEBRIDGE_CHANNELS_CHAT_TRANSPORT_HPP
#define MATEBRIDGE_CHANNELS_CHAT_TRANSPORT_HPP

#include "../core/types.hpp"
#include <string>
#include <vector>

namespace matebridge {

// Chat service interface - the bridge talks to users only through this
class ChatTransport {
public:
    virtual ~ChatTransport() {}
    
    // Fetch updates after cursor. next_cursor is the cursor to persist.
    virtual bool poll_updates(int64_t cursor,
                              std::vector<ChatUpdate>& updates,
                              int64_t& next_cursor) = 0;
    
    // Long texts are split into labelled parts
    virtual SendResult send_text(int64_t chat_id, const std::string& text) = 0;
    
    virtual bool send_typing(int64_t chat_id) = 0;
    
    // Acknowledge a menu button press
    virtual bool answer_interaction(const std::string& interaction_id) = 0;
    
    virtual SendResult send_menu(int64_t chat_id,
                                 const std::string& prompt,
                                 const std::vector<MenuOption>& options) = 0;
    
    virtual bool react(int64_t chat_id, int64_t message_id, const std::string& emoji) = 0;
    
    virtual bool register_commands(const std::vector<BotCommand>& commands) = 0;
};

} // namespace matebridge

#endif // MATEBRIDGE_CHANNELS_CHAT_TRANSPORT_HPP
