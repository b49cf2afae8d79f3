#ifndef MATEBRIDGE_CORE_TYPES_HPP
#define MATEBRIDGE_CORE_TYPES_HPP

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace matebridge {

// Inbound event from the chat service
struct ChatUpdate {
    enum Kind {
        MESSAGE,        // Plain text or command
        INTERACTION     // Inline menu button press
    };
    
    Kind kind;
    int64_t update_id;
    int64_t chat_id;
    int64_t message_id;
    std::string from_name;
    std::string text;               // Message text (MESSAGE)
    std::string interaction_id;     // Callback query id (INTERACTION)
    std::string interaction_data;   // Button payload (INTERACTION)
    
    ChatUpdate() : kind(MESSAGE), update_id(0), chat_id(0), message_id(0) {}
};

// Result of sending a message
struct SendResult {
    bool success;
    std::string message_id;
    std::string error;
    
    SendResult() : success(false) {}
    
    static SendResult ok(const std::string& msg_id) {
        SendResult r;
        r.success = true;
        r.message_id = msg_id;
        return r;
    }
    
    static SendResult fail(const std::string& err) {
        SendResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// One button of an inline menu
struct MenuOption {
    std::string label;
    std::string data;
    
    MenuOption() {}
    MenuOption(const std::string& l, const std::string& d) : label(l), data(d) {}
};

// Command advertised to the chat client
struct BotCommand {
    std::string command;      // Without the leading slash
    std::string description;
    
    BotCommand() {}
    BotCommand(const std::string& cmd, const std::string& desc)
        : command(cmd), description(desc) {}
};

// Millisecond wall clock, injectable for tests
using ClockFn = std::function<int64_t()>;

} // namespace matebridge

#endif // MATEBRIDGE_CORE_TYPES_HPP
