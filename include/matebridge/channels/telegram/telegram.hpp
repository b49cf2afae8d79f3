#ifndef MATEBRIDGE_CHANNELS_TELEGRAM_HPP
#define MATEBRIDGE_CHANNELS_TELEGRAM_HPP

#include "../chat_transport.hpp"
#include "../../core/http_client.hpp"
#include "../../core/logger.hpp"
#include <string>
#include <vector>

namespace matebridge {

// Telegram Bot API transport (long polling)
class TelegramTransport : public ChatTransport {
public:
    static const size_t MAX_MESSAGE_BYTES = 4000;
    
    TelegramTransport(const std::string& bot_token, int poll_timeout_s = 30);
    
    // getMe; fails on a bad token
    bool connect();
    
    const std::string& bot_username() const { return bot_username_; }
    
    bool poll_updates(int64_t cursor, std::vector<ChatUpdate>& updates, int64_t& next_cursor);
    SendResult send_text(int64_t chat_id, const std::string& text);
    bool send_typing(int64_t chat_id);
    bool answer_interaction(const std::string& interaction_id);
    SendResult send_menu(int64_t chat_id,
                         const std::string& prompt,
                         const std::vector<MenuOption>& options);
    bool react(int64_t chat_id, int64_t message_id, const std::string& emoji);
    bool register_commands(const std::vector<BotCommand>& commands);
    
    // Split text into "[i/n]\n"-prefixed parts that each fit max_bytes.
    // Text that already fits is returned as the single element.
    static std::vector<std::string> label_chunks(const std::string& text, size_t max_bytes);
    
    // Convert one getUpdates entry; false for unsupported update kinds
    static bool parse_update(const Json& update, ChatUpdate& out);

private:
    std::string api_base_;
    std::string bot_username_;
    int poll_timeout_;
    HttpClient poll_http_;      // Held by the long poll
    HttpClient http_;           // Everything else
    
    bool call(const std::string& method, const Json& params);
    SendResult send_message_impl(const Json& params);
};

} // namespace matebridge

#endif // MATEBRIDGE_CHANNELS_TELEGRAM_HPP
