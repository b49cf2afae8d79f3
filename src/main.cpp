/*
 * MateBridge C++11 - Telegram bridge for a terminal coding agent
 * 
 * Relays chat messages into the agent's tmux session and streams the
 * agent's transcript back to the chat, keeping a searchable memory per chat.
 * 
 * Usage:
 *   ./matebridge [config.json]
 */

#include <matebridge/core/application.hpp>

int main(int argc, char* argv[]) {
    matebridge::BridgeApp& app = matebridge::BridgeApp::instance();
    
    if (!app.init(argc, argv)) {
        app.shutdown();
        return 1;
    }
    
    int result = app.run();
    app.shutdown();
    return result;
}
