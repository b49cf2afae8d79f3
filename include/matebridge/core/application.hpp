/*
 * MateBridge C++11 - Application Class
 * 
 * Central application singleton owning configuration, the bridge components
 * and the Telegram update loop.
 */
#ifndef MATEBRIDGE_CORE_APPLICATION_HPP
#define MATEBRIDGE_CORE_APPLICATION_HPP

#include "config.hpp"
#include "commands.hpp"
#include "../channels/telegram/telegram.hpp"
#include "../terminal/tmux_driver.hpp"
#include "../memory/store.hpp"
#include "../bridge/conversation.hpp"
#include "../bridge/dispatch_queue.hpp"
#include "../bridge/prompt_builder.hpp"
#include "../bridge/response_coordinator.hpp"
#include "../bridge/state_files.hpp"
#include "../bridge/typing_indicator.hpp"

#include <string>
#include <memory>
#include <atomic>

namespace matebridge {

struct AppInfo {
    static constexpr const char* VERSION = "0.3.0";
    static constexpr const char* NAME = "MateBridge";
};

class BridgeApp {
public:
    static BridgeApp& instance();
    
    BridgeApp(const BridgeApp&) = delete;
    BridgeApp& operator=(const BridgeApp&) = delete;
    
    Config& config() { return config_; }
    const Config& config() const { return config_; }
    
    bool is_running() const { return running_.load(); }
    void stop() { running_.store(false); }
    
    // Parse arguments, load config, open the store and wire components.
    // False means exit (bad config, --help, --version).
    bool init(int argc, char* argv[]);
    
    // Poll Telegram until stopped
    int run();
    
    void shutdown();

private:
    BridgeApp();
    
    bool parse_args(int argc, char* argv[], const char** config_file);
    void setup_logging();
    bool setup_memory();
    bool setup_components();
    std::string locate_transcript() const;
    void persist_cursor(int64_t cursor);
    
    std::atomic<bool> running_;
    bool curl_ready_;
    Config config_;
    std::string transcripts_dir_;
    
    std::unique_ptr<StateFiles> state_;
    std::unique_ptr<MemoryStore> store_;
    std::unique_ptr<ConversationRegistry> registry_;
    std::unique_ptr<TelegramTransport> transport_;
    std::unique_ptr<TmuxDriver> terminal_;
    std::unique_ptr<TypingIndicator> typing_;
    std::unique_ptr<PromptBuilder> prompts_;
    std::unique_ptr<DispatchQueue> queue_;
    std::unique_ptr<ResponseCoordinator> coordinator_;
    std::unique_ptr<CommandRouter> router_;
};

void print_usage(const char* prog);
void print_version();

} // namespace matebridge

#endif // MATEBRIDGE_CORE_APPLICATION_HPP
