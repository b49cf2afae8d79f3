#ifndef MATEBRIDGE_CORE_COMMANDS_HPP
#define MATEBRIDGE_CORE_COMMANDS_HPP

#include <matebridge/core/types.hpp>
#include <matebridge/channels/chat_transport.hpp>
#include <matebridge/terminal/terminal_driver.hpp>
#include <matebridge/memory/store.hpp>
#include <matebridge/bridge/conversation.hpp>
#include <matebridge/bridge/dispatch_queue.hpp>
#include <matebridge/bridge/prompt_builder.hpp>
#include <matebridge/bridge/state_files.hpp>
#include <string>
#include <vector>
#include <map>
#include <functional>

namespace matebridge {

class ResponseCoordinator;
class CommandRouter;

// Reply text; empty means the handler answered on its own (or not at all)
typedef std::string (CommandRouter::*CommandHandler)(const ChatUpdate& update, const std::string& args);

struct CommandDef {
    std::string command;      // Command name (e.g., "/status")
    std::string description;  // Help text
    CommandHandler handler;
    
    CommandDef() : handler(NULL) {}
    CommandDef(const std::string& cmd, const std::string& desc, CommandHandler h)
        : command(cmd), description(desc), handler(h) {}
};

struct RouterOptions {
    std::string tmux_session;
    std::string agent_command;
    std::string history_file;
    std::string projects_dir;
    int recall_limit;
    
    RouterOptions()
        : tmux_session("claude")
        , agent_command("claude")
        , recall_limit(10) {}
};

using SleepFn = std::function<void(int)>;

// Turns chat updates into terminal input, queue items and memory operations
class CommandRouter {
public:
    CommandRouter(ChatTransport& transport,
                  TerminalDriver& terminal,
                  ConversationRegistry& registry,
                  DispatchQueue& queue,
                  const PromptBuilder& prompts,
                  MemoryStore* store,
                  ResponseCoordinator* coordinator,
                  StateFiles* state,
                  const RouterOptions& opts);
    
    void handle_update(const ChatUpdate& update);
    
    // Commands advertised via setMyCommands
    std::vector<BotCommand> bot_commands() const;
    
    const std::map<std::string, CommandDef>& commands() const { return commands_; }
    
    void set_sleep(SleepFn fn) { sleep_ = fn; }
    
    // Type a queued item into the terminal; LOOP payloads get a short
    // pause before Enter so the agent's input box settles
    static bool type_into_terminal(TerminalDriver& terminal,
                                   const DispatchItem& item,
                                   const SleepFn& sleep);
    
    static bool is_blocked(const std::string& command);
    
    // "/Status@my_bot now" -> ("/status", "now")
    static void parse_command(const std::string& text, std::string& command, std::string& args);

    std::string cmd_help(const ChatUpdate& update, const std::string& args);
    std::string cmd_status(const ChatUpdate& update, const std::string& args);
    std::string cmd_stop(const ChatUpdate& update, const std::string& args);
    std::string cmd_clear(const ChatUpdate& update, const std::string& args);
    std::string cmd_continue(const ChatUpdate& update, const std::string& args);
    std::string cmd_loop(const ChatUpdate& update, const std::string& args);
    std::string cmd_meta_loop(const ChatUpdate& update, const std::string& args);
    std::string cmd_resume(const ChatUpdate& update, const std::string& args);
    std::string cmd_remember(const ChatUpdate& update, const std::string& args);
    std::string cmd_recall(const ChatUpdate& update, const std::string& args);
    std::string cmd_forget(const ChatUpdate& update, const std::string& args);
    std::string cmd_memstats(const ChatUpdate& update, const std::string& args);
    std::string cmd_metamem(const ChatUpdate& update, const std::string& args);

private:
    ChatTransport& transport_;
    TerminalDriver& terminal_;
    ConversationRegistry& registry_;
    DispatchQueue& queue_;
    const PromptBuilder& prompts_;
    MemoryStore* store_;
    ResponseCoordinator* coordinator_;
    StateFiles* state_;
    RouterOptions opts_;
    SleepFn sleep_;
    std::map<std::string, CommandDef> commands_;
    std::vector<std::string> order_;
    
    void register_command(const CommandDef& def);
    void handle_message(const ChatUpdate& update);
    void handle_command(const ChatUpdate& update);
    void handle_interaction(const ChatUpdate& update);
    
    bool require_terminal(int64_t chat_id);
    void reply(int64_t chat_id, const std::string& text);
    void restart_agent(const std::string& agent_args);
    void enqueue(const ChatUpdate& update, const std::string& text,
                 const std::string& user_message, PayloadTemplate tmpl);
};

} // namespace matebridge

#endif // MATEBRIDGE_CORE_COMMANDS_HPP
