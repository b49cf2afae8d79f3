#ifndef MATEBRIDGE_TERMINAL_TMUX_DRIVER_HPP
#define MATEBRIDGE_TERMINAL_TMUX_DRIVER_HPP

#include "terminal_driver.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace matebridge {

// Drives a tmux session by running `tmux send-keys` as a child process
class TmuxDriver : public TerminalDriver {
public:
    explicit TmuxDriver(const std::string& session,
                        const std::string& executable = "tmux");
    
    bool session_exists();
    bool send_literal_text(const std::string& text);
    bool send_enter();
    bool send_interrupt();
    std::string last_error() const;
    
    const std::string& session() const { return session_; }

private:
    std::string session_;
    std::string executable_;
    mutable std::mutex mutex_;
    std::string last_error_;
    
    // Run executable with args, output discarded; true on exit status 0
    bool run(const std::vector<std::string>& args);
    void set_error(const std::string& error);
};

} // namespace matebridge

#endif // MATEBRIDGE_TERMINAL_TMUX_DRIVER_HPP
