/*
 * MateBridge C++11 - Application Implementation
 */
#include <matebridge/core/application.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>
#include <matebridge/bridge/session_catalog.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <curl/curl.h>

namespace matebridge {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Telegram bridge for a terminal coding agent\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Config file format (JSON, every key may also come from the\n"
              << "environment, e.g. telegram.bot_token -> TELEGRAM_BOT_TOKEN):\n"
              << "  {\n"
              << "    \"log_level\": \"info\",\n"
              << "    \"state_dir\": \"~/.claude\",\n"
              << "    \"telegram\": { \"bot_token\": \"...\", \"poll_timeout\": 30 },\n"
              << "    \"tmux\": { \"session\": \"claude\" },\n"
              << "    \"memory\": { \"enabled\": true, \"db_path\": \"~/.matecode/memory.db\" },\n"
              << "    \"agent\": { \"transcripts_dir\": \"~/.claude/transcripts\" }\n"
              << "  }\n\n"
              << "Example:\n"
              << "  " << prog << " config.json\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

namespace {
    volatile std::sig_atomic_t g_signal = 0;
    
    void signal_handler(int sig) {
        g_signal = sig;
        BridgeApp::instance().stop();
    }
}

BridgeApp& BridgeApp::instance() {
    static BridgeApp app;
    return app;
}

BridgeApp::BridgeApp()
    : running_(true)
    , curl_ready_(false)
{}

bool BridgeApp::parse_args(int argc, char* argv[], const char** config_file) {
    *config_file = nullptr;
    
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        *config_file = argv[i];
    }
    return true;
}

void BridgeApp::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
    
    std::string log_file = config_.get_path("log_file", "");
    if (!log_file.empty()) {
        if (!Logger::instance().set_file(log_file)) {
            LOG_WARN("Cannot open log file %s, logging to stderr only", log_file.c_str());
        }
    }
}

bool BridgeApp::setup_memory() {
    if (!config_.get_bool("memory.enabled", true)) {
        LOG_INFO("Memory disabled by configuration");
        return true;
    }
    
    std::string db_path = config_.get_path("memory.db_path", "~/.matecode/memory.db");
    std::string db_dir = dirname(db_path);
    if (!db_dir.empty() && !mkdir_p(db_dir)) {
        LOG_ERROR("Cannot create memory directory %s", db_dir.c_str());
        return false;
    }
    
    store_.reset(new MemoryStore());
    if (!store_->open(db_path) || !store_->ensure_schema()) {
        LOG_ERROR("Memory store %s unusable: %s", db_path.c_str(), store_->last_error().c_str());
        return false;
    }
    
    LOG_INFO("Memory store: %s (%s search)", db_path.c_str(),
             store_->fts_available() ? "FTS5" : "substring");
    return true;
}

std::string BridgeApp::locate_transcript() const {
    return SessionCatalog::latest_transcript(transcripts_dir_);
}

bool BridgeApp::setup_components() {
    std::string state_dir = config_.get_path("state_dir", "~/.claude");
    if (!mkdir_p(state_dir)) {
        LOG_ERROR("Cannot create state directory %s", state_dir.c_str());
        return false;
    }
    state_.reset(new StateFiles(state_dir));
    
    std::string token = config_.get_string("telegram.bot_token");
    if (token.empty()) {
        LOG_ERROR("telegram.bot_token not configured (or TELEGRAM_BOT_TOKEN unset)");
        return false;
    }
    transport_.reset(new TelegramTransport(token,
        static_cast<int>(config_.get_int("telegram.poll_timeout", 30))));
    if (!transport_->connect()) {
        return false;
    }
    
    std::string session = config_.get_string("tmux.session", "claude");
    terminal_.reset(new TmuxDriver(session));
    if (!terminal_->session_exists()) {
        LOG_WARN("tmux session '%s' not found yet", session.c_str());
    }
    
    registry_.reset(new ConversationRegistry());
    int64_t active_chat = 0;
    if (state_->load_active_chat(active_chat)) {
        registry_->ensure(active_chat);
        LOG_INFO("Last active chat: %lld", static_cast<long long>(active_chat));
    }
    
    typing_.reset(new TypingIndicator(*transport_, *registry_));
    typing_->set_interval(static_cast<int>(config_.get_int("bridge.typing_interval_ms", 4000)));
    
    PromptOptions popts;
    popts.memory_enabled = store_ != nullptr;
    popts.max_results = static_cast<int>(config_.get_int("memory.max_results", 5));
    popts.max_context = static_cast<size_t>(config_.get_int("memory.max_context", 2000));
    std::string instructions = config_.get_path("agent.instructions_file", "");
    if (!instructions.empty()) {
        popts.instruction_files.push_back(instructions);
    } else {
        popts.instruction_files.push_back(".CLAUDE.md");
        popts.instruction_files.push_back("~/.claude/.CLAUDE.md");
    }
    popts.meta_section = config_.get_string("agent.meta_section", popts.meta_section);
    prompts_.reset(new PromptBuilder(store_.get(), popts));
    
    TmuxDriver* terminal = terminal_.get();
    queue_.reset(new DispatchQueue(*registry_,
        [terminal](const DispatchItem& item) {
            return CommandRouter::type_into_terminal(*terminal, item, sleep_ms);
        },
        typing_.get()));
    
    transcripts_dir_ = config_.get_path("agent.transcripts_dir", "~/.claude/transcripts");
    CoordinatorOptions copts;
    copts.pending_timeout_ms = config_.get_int("bridge.pending_timeout_s", 600) * 1000;
    copts.poll_interval_ms = static_cast<int>(config_.get_int("bridge.poll_interval_ms", 1000));
    copts.watch_interval_ms = static_cast<int>(config_.get_int("bridge.watch_interval_ms", 200));
    copts.checkpoint_path = config_.get_path("bridge.tail_state_file",
                                             join_path(state_dir, "matebridge_tail.json"));
    copts.memory_enabled = store_ != nullptr;
    coordinator_.reset(new ResponseCoordinator(*registry_, *transport_, store_.get(),
        [this]() { return locate_transcript(); }, copts));
    
    RouterOptions ropts;
    ropts.tmux_session = session;
    ropts.agent_command = config_.get_string("tmux.agent_command", "claude");
    ropts.history_file = config_.get_path("agent.history_file", "~/.claude/history.jsonl");
    ropts.projects_dir = config_.get_path("agent.projects_dir", "~/.claude/projects");
    router_.reset(new CommandRouter(*transport_, *terminal_, *registry_, *queue_, *prompts_,
                                    store_.get(), coordinator_.get(), state_.get(), ropts));
    return true;
}

bool BridgeApp::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before threads start)
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ready_ = true;
    
    const char* config_file = nullptr;
    if (!parse_args(argc, argv, &config_file)) {
        return false;
    }
    
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    
    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);
    
    if (config_file) {
        if (!config_.load_file(config_file)) {
            LOG_ERROR("Failed to load config from %s: %s", config_file, config_.last_error().c_str());
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file);
    }
    
    setup_logging();
    if (!setup_memory()) return false;
    if (!setup_components()) return false;
    
    if (!transport_->register_commands(router_->bot_commands())) {
        LOG_WARN("Bot command registration failed, continuing");
    }
    
    if (!coordinator_->load_checkpoint()) {
        LOG_DEBUG("No tail checkpoint, starting fresh");
    }
    if (!coordinator_->prime()) {
        LOG_INFO("No transcript in %s yet", transcripts_dir_.c_str());
    }
    coordinator_->start();
    typing_->start();
    return true;
}

int BridgeApp::run() {
    int64_t cursor = state_->load_cursor();
    LOG_INFO("Bridge started | tmux: %s | offset: %lld",
             terminal_->session().c_str(), static_cast<long long>(cursor));
    
    while (running_.load()) {
        std::vector<ChatUpdate> updates;
        int64_t next_cursor = cursor;
        if (!transport_->poll_updates(cursor, updates, next_cursor)) {
            for (int i = 0; i < 50 && running_.load(); ++i) sleep_ms(100);
            continue;
        }
        
        for (size_t i = 0; i < updates.size(); ++i) {
            try {
                router_->handle_update(updates[i]);
            } catch (const std::exception& e) {
                LOG_ERROR("Error handling update %lld: %s",
                          static_cast<long long>(updates[i].update_id), e.what());
            }
            if (updates[i].update_id + 1 > cursor) {
                cursor = updates[i].update_id + 1;
                persist_cursor(cursor);
            }
        }
        
        // Skipped update kinds still advance the cursor
        if (next_cursor > cursor) {
            cursor = next_cursor;
            persist_cursor(cursor);
        }
    }
    
    if (g_signal != 0) {
        LOG_INFO("Received shutdown signal %d", static_cast<int>(g_signal));
    }
    return 0;
}

void BridgeApp::persist_cursor(int64_t cursor) {
    if (!state_->save_cursor(cursor)) {
        LOG_WARN("Failed to persist update offset %lld", static_cast<long long>(cursor));
    }
}

void BridgeApp::shutdown() {
    LOG_INFO("Shutting down...");
    
    if (coordinator_) {
        coordinator_->stop();
        coordinator_->save_checkpoint();
    }
    if (queue_) queue_->stop();
    if (typing_) typing_->stop();
    if (store_) store_->close();
    
    if (curl_ready_) {
        curl_global_cleanup();
        curl_ready_ = false;
    }
    
    LOG_INFO("Goodbye!");
}

} // namespace matebridge
