/*
 * MateBridge C++11 - Chat Commands Implementation
 */
#include <matebridge/core/commands.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>
#include <matebridge/bridge/response_coordinator.hpp>
#include <matebridge/bridge/session_catalog.hpp>
#include <sstream>

namespace matebridge {

namespace {

// Agent commands that need an interactive terminal
const char* const BLOCKED_COMMANDS[] = {
    "/mcp", "/settings", "/config", "/model", "/compact", "/cost",
    "/doctor", "/init", "/login", "/logout", "/memory", "/permissions",
    "/pr", "/review", "/terminal", "/vim", "/approved-tools", "/listen"
};

const int LOOP_ENTER_DELAY_MS = 300;
const int ESCAPE_SETTLE_MS = 200;
const int EXIT_SETTLE_MS = 500;

// First max_chars code points of s
std::string head_chars(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < s.size() && chars < max_chars) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (i + len > s.size()) break;
        i += len;
        ++chars;
    }
    return s.substr(0, i);
}

std::string preview(const std::string& s, size_t max_chars) {
    std::string head = head_chars(s, max_chars);
    return head.size() < s.size() ? head + "..." : head;
}

} // namespace

CommandRouter::CommandRouter(ChatTransport& transport,
                             TerminalDriver& terminal,
                             ConversationRegistry& registry,
                             DispatchQueue& queue,
                             const PromptBuilder& prompts,
                             MemoryStore* store,
                             ResponseCoordinator* coordinator,
                             StateFiles* state,
                             const RouterOptions& opts)
    : transport_(transport)
    , terminal_(terminal)
    , registry_(registry)
    , queue_(queue)
    , prompts_(prompts)
    , store_(store)
    , coordinator_(coordinator)
    , state_(state)
    , opts_(opts)
    , sleep_(sleep_ms) {
    register_command(CommandDef("/clear", "Clear conversation", &CommandRouter::cmd_clear));
    register_command(CommandDef("/resume", "Resume session (shows picker)", &CommandRouter::cmd_resume));
    register_command(CommandDef("/continue_", "Continue most recent session", &CommandRouter::cmd_continue));
    register_command(CommandDef("/loop", "Ralph Loop: /loop <prompt>", &CommandRouter::cmd_loop));
    register_command(CommandDef("/meta_loop", "Meta Loop with auto-memory: /meta_loop <prompt>",
                                &CommandRouter::cmd_meta_loop));
    register_command(CommandDef("/stop", "Interrupt the agent (Escape)", &CommandRouter::cmd_stop));
    register_command(CommandDef("/status", "Check tmux status", &CommandRouter::cmd_status));
    register_command(CommandDef("/remember", "Save to memory: /remember <text>", &CommandRouter::cmd_remember));
    register_command(CommandDef("/recall", "Search memories: /recall <query>", &CommandRouter::cmd_recall));
    register_command(CommandDef("/forget", "Delete memory: /forget <query>", &CommandRouter::cmd_forget));
    register_command(CommandDef("/memstats", "Memory statistics", &CommandRouter::cmd_memstats));
    register_command(CommandDef("/metamem", "View meta-update memories", &CommandRouter::cmd_metamem));
    register_command(CommandDef("/help", "Show help message", &CommandRouter::cmd_help));
    LOG_DEBUG("[Commands] %zu commands registered", commands_.size());
}

void CommandRouter::register_command(const CommandDef& def) {
    if (commands_.find(def.command) == commands_.end()) {
        order_.push_back(def.command);
    }
    commands_[def.command] = def;
}

std::vector<BotCommand> CommandRouter::bot_commands() const {
    std::vector<BotCommand> result;
    for (size_t i = 0; i < order_.size(); ++i) {
        std::map<std::string, CommandDef>::const_iterator it = commands_.find(order_[i]);
        result.push_back(BotCommand(it->first.substr(1), it->second.description));
    }
    return result;
}

bool CommandRouter::is_blocked(const std::string& command) {
    const size_t count = sizeof(BLOCKED_COMMANDS) / sizeof(BLOCKED_COMMANDS[0]);
    for (size_t i = 0; i < count; ++i) {
        if (command == BLOCKED_COMMANDS[i]) return true;
    }
    return false;
}

void CommandRouter::parse_command(const std::string& text, std::string& command, std::string& args) {
    std::string t = trim(text);
    size_t space = t.find_first_of(" \t\n");
    command = to_lower(space == std::string::npos ? t : t.substr(0, space));
    args = space == std::string::npos ? "" : trim(t.substr(space + 1));
    
    size_t at = command.find('@');
    if (at != std::string::npos) {
        command = command.substr(0, at);
    }
}

bool CommandRouter::type_into_terminal(TerminalDriver& terminal,
                                       const DispatchItem& item,
                                       const SleepFn& sleep) {
    std::string payload = PromptBuilder::render_payload(item);
    if (!terminal.send_literal_text(payload)) {
        return false;
    }
    if (item.tmpl != PayloadTemplate::PLAIN && sleep) {
        sleep(LOOP_ENTER_DELAY_MS);
    }
    return terminal.send_enter();
}

void CommandRouter::handle_update(const ChatUpdate& update) {
    if (update.kind == ChatUpdate::INTERACTION) {
        handle_interaction(update);
        return;
    }
    
    if (update.text.empty() || update.chat_id == 0) return;
    
    // Remember where to send replies across restarts
    if (state_ && !state_->save_active_chat(update.chat_id)) {
        LOG_WARN("[Commands] Could not persist active chat %lld",
                 static_cast<long long>(update.chat_id));
    }
    
    if (starts_with(update.text, "/")) {
        handle_command(update);
    } else {
        handle_message(update);
    }
}

void CommandRouter::handle_message(const ChatUpdate& update) {
    std::string owner = ConversationRegistry::owner_for(update.chat_id);
    LOG_INFO("[Commands] [%s] %s", owner.c_str(), truncate_safe(update.text, 50).c_str());
    
    if (update.message_id != 0) {
        transport_.react(update.chat_id, update.message_id, "✅");
    }
    
    if (!require_terminal(update.chat_id)) return;
    
    std::string prompt = prompts_.build_prompt(owner, update.text);
    enqueue(update, prompt, update.text, PayloadTemplate::PLAIN);
}

void CommandRouter::handle_command(const ChatUpdate& update) {
    std::string command;
    std::string args;
    parse_command(update.text, command, args);
    
    std::map<std::string, CommandDef>::const_iterator it = commands_.find(command);
    if (it != commands_.end()) {
        LOG_INFO("[Commands] %s from %lld", command.c_str(), static_cast<long long>(update.chat_id));
        std::string response = (this->*(it->second.handler))(update, args);
        if (!response.empty()) {
            reply(update.chat_id, response);
        }
        return;
    }
    
    if (is_blocked(command)) {
        reply(update.chat_id, "'" + command + "' not supported (interactive)");
        return;
    }
    
    LOG_DEBUG("[Commands] Ignoring unknown command %s", command.c_str());
}

void CommandRouter::handle_interaction(const ChatUpdate& update) {
    transport_.answer_interaction(update.interaction_id);
    
    if (update.chat_id == 0 || update.interaction_data.empty()) return;
    if (!require_terminal(update.chat_id)) return;
    
    const std::string& data = update.interaction_data;
    LOG_INFO("[Commands] Callback from %lld: %s", static_cast<long long>(update.chat_id), data.c_str());
    
    if (starts_with(data, "resume:")) {
        std::string session_id = data.substr(7);
        if (session_id.empty()) return;
        restart_agent("--resume " + session_id + " --dangerously-skip-permissions");
        reply(update.chat_id, "Resuming: " + session_id.substr(0, 8) + "...");
    } else if (data == "continue_recent") {
        restart_agent("--continue --dangerously-skip-permissions");
        reply(update.chat_id, "Continuing most recent...");
    } else {
        LOG_DEBUG("[Commands] Unknown callback data: %s", data.c_str());
    }
}

bool CommandRouter::require_terminal(int64_t chat_id) {
    if (terminal_.session_exists()) return true;
    reply(chat_id, "tmux not found");
    return false;
}

void CommandRouter::reply(int64_t chat_id, const std::string& text) {
    SendResult r = transport_.send_text(chat_id, text);
    if (!r.success) {
        LOG_WARN("[Commands] Reply to %lld failed: %s", static_cast<long long>(chat_id), r.error.c_str());
    }
}

void CommandRouter::restart_agent(const std::string& agent_args) {
    terminal_.send_interrupt();
    sleep_(ESCAPE_SETTLE_MS);
    terminal_.send_literal_text("/exit");
    terminal_.send_enter();
    sleep_(EXIT_SETTLE_MS);
    terminal_.send_literal_text(opts_.agent_command + " " + agent_args);
    terminal_.send_enter();
}

void CommandRouter::enqueue(const ChatUpdate& update, const std::string& text,
                            const std::string& user_message, PayloadTemplate tmpl) {
    DispatchItem item;
    item.owner = ConversationRegistry::owner_for(update.chat_id);
    item.chat_id = update.chat_id;
    item.text = text;
    item.user_message = user_message;
    item.tmpl = tmpl;
    item.enqueued_ms = registry_.now_ms();
    queue_.enqueue(item);
}

// ============================================================================
// Command Implementations
// ============================================================================

std::string CommandRouter::cmd_help(const ChatUpdate& /*update*/, const std::string& /*args*/) {
    std::ostringstream oss;
    oss << "MateBridge - agent session: " << opts_.tmux_session << "\n\n"
        << "Commands:\n";
    for (size_t i = 0; i < order_.size(); ++i) {
        oss << order_[i] << " - " << commands_[order_[i]].description << "\n";
    }
    oss << "\nAny other message is typed into the agent's terminal.";
    return oss.str();
}

std::string CommandRouter::cmd_status(const ChatUpdate& /*update*/, const std::string& /*args*/) {
    std::string status = terminal_.session_exists() ? "running" : "not found";
    return "tmux '" + opts_.tmux_session + "': " + status;
}

std::string CommandRouter::cmd_stop(const ChatUpdate& update, const std::string& /*args*/) {
    std::string owner = ConversationRegistry::owner_for(update.chat_id);
    if (terminal_.session_exists()) {
        terminal_.send_interrupt();
    }
    queue_.discard(owner);
    
    // Deliver what the agent managed to write before the interrupt
    if (coordinator_) {
        coordinator_->salvage(owner);
    } else {
        registry_.clear_pending(owner);
    }
    return "Interrupted";
}

std::string CommandRouter::cmd_clear(const ChatUpdate& update, const std::string& /*args*/) {
    if (!require_terminal(update.chat_id)) return "";
    terminal_.send_interrupt();
    sleep_(ESCAPE_SETTLE_MS);
    terminal_.send_literal_text("/clear");
    terminal_.send_enter();
    return "Cleared";
}

std::string CommandRouter::cmd_continue(const ChatUpdate& update, const std::string& /*args*/) {
    if (!require_terminal(update.chat_id)) return "";
    restart_agent("--continue --dangerously-skip-permissions");
    return "Continuing...";
}

std::string CommandRouter::cmd_loop(const ChatUpdate& update, const std::string& args) {
    if (!require_terminal(update.chat_id)) return "";
    if (args.empty()) return "Usage: /loop <prompt>";
    
    enqueue(update, args, args, PayloadTemplate::LOOP);
    return "Ralph Loop started (max 5 iterations)";
}

std::string CommandRouter::cmd_meta_loop(const ChatUpdate& update, const std::string& args) {
    if (!require_terminal(update.chat_id)) return "";
    if (args.empty()) return "Usage: /meta_loop <prompt>";
    
    enqueue(update, prompts_.build_meta_loop_prompt(args), args, PayloadTemplate::META_LOOP);
    return "Meta Loop started (auto-memory enabled, max 5 iterations)";
}

std::string CommandRouter::cmd_resume(const ChatUpdate& update, const std::string& /*args*/) {
    std::vector<HistoryEntry> sessions = SessionCatalog::recent_sessions(opts_.history_file, 5);
    if (sessions.empty()) return "No sessions";
    
    std::vector<MenuOption> options;
    options.push_back(MenuOption("Continue most recent", "continue_recent"));
    for (size_t i = 0; i < sessions.size(); ++i) {
        std::string sid = SessionCatalog::session_id_for_project(opts_.projects_dir, sessions[i].project);
        if (sid.empty()) continue;
        options.push_back(MenuOption(head_chars(sessions[i].display, 40) + "...", "resume:" + sid));
    }
    
    SendResult r = transport_.send_menu(update.chat_id, "Select session:", options);
    if (!r.success) {
        LOG_WARN("[Commands] Session menu failed: %s", r.error.c_str());
    }
    return "";
}

std::string CommandRouter::cmd_remember(const ChatUpdate& update, const std::string& args) {
    if (args.empty()) return "Usage: /remember <text>";
    if (!store_) return "Memory is disabled";
    
    MemoryMetadata meta;
    meta["source"] = "manual";
    std::string owner = ConversationRegistry::owner_for(update.chat_id);
    if (store_->add(owner, args, meta, MemoryKind::MANUAL)) {
        return "✅ Saved to memory";
    }
    LOG_WARN("[Commands] /remember failed: %s", store_->last_error().c_str());
    return "❌ Failed to save";
}

std::string CommandRouter::cmd_recall(const ChatUpdate& update, const std::string& args) {
    if (!store_) return "Memory is disabled";
    
    std::string owner = ConversationRegistry::owner_for(update.chat_id);
    std::vector<MemoryRecord> results = args.empty() ?
        store_->get_recent(owner, opts_.recall_limit) :
        store_->search(owner, args, opts_.recall_limit);
    
    if (results.empty()) return "No memories found";
    
    std::ostringstream oss;
    oss << "📚 Your memories:\n";
    for (size_t i = 0; i < results.size(); ++i) {
        oss << "\n" << (i + 1) << ". " << preview(results[i].content, 100);
    }
    return oss.str();
}

std::string CommandRouter::cmd_forget(const ChatUpdate& update, const std::string& args) {
    if (args.empty()) return "Usage: /forget <query or 'all'>";
    if (!store_) return "Memory is disabled";
    
    std::string owner = ConversationRegistry::owner_for(update.chat_id);
    if (to_lower(args) == "all") {
        return store_->clear_all(owner) ? "🗑️ All memories cleared" : "❌ Failed to clear";
    }
    
    int count = store_->delete_by_query(owner, args);
    std::ostringstream oss;
    oss << "🗑️ Deleted " << count << " memory(s)";
    return oss.str();
}

std::string CommandRouter::cmd_memstats(const ChatUpdate& update, const std::string& /*args*/) {
    if (!store_) return "Memory is disabled";
    
    MemoryStats stats = store_->stats(ConversationRegistry::owner_for(update.chat_id));
    
    std::ostringstream oss;
    oss << "📊 Memory Stats:\n"
        << "Total: " << stats.count << " memories\n"
        << "Newest: " << (stats.newest > 0 ? format_local_minutes(stats.newest) : "N/A") << "\n"
        << "Oldest: " << (stats.oldest > 0 ? format_local_minutes(stats.oldest) : "N/A") << "\n"
        << "By type:";
    if (stats.by_kind.empty()) {
        oss << "\n  N/A";
    }
    for (std::map<std::string, int64_t>::const_iterator it = stats.by_kind.begin();
         it != stats.by_kind.end(); ++it) {
        oss << "\n  " << it->first << ": " << it->second;
    }
    return oss.str();
}

std::string CommandRouter::cmd_metamem(const ChatUpdate& update, const std::string& /*args*/) {
    if (!store_) return "Memory is disabled";
    
    std::vector<MemoryRecord> results = store_->get_by_kind(
        ConversationRegistry::owner_for(update.chat_id), MemoryKind::META_UPDATE, 5);
    if (results.empty()) return "No meta-update memories found";
    
    std::ostringstream oss;
    oss << "🔄 Meta-Update Memories (Self-Referential):\n";
    for (size_t i = 0; i < results.size(); ++i) {
        oss << "\n" << (i + 1) << ". [" << format_local_minutes(results[i].created_at) << "] "
            << preview(results[i].content, 150);
    }
    return oss.str();
}

} // namespace matebridge
