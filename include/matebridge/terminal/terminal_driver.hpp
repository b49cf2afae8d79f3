#ifndef MATEBRIDGE_TERMINAL_TERMINAL_DRIVER_HPP
#define MATEBRIDGE_TERMINAL_TERMINAL_DRIVER_HPP

#include <string>

namespace matebridge {

// Keystroke injection into the terminal session running the agent
class TerminalDriver {
public:
    virtual ~TerminalDriver() {}
    
    virtual bool session_exists() = 0;
    
    // Typed as-is, no key-name interpretation
    virtual bool send_literal_text(const std::string& text) = 0;
    
    virtual bool send_enter() = 0;
    
    // Escape: stops the agent's current generation
    virtual bool send_interrupt() = 0;
    
    virtual std::string last_error() const = 0;
};

} // namespace matebridge

#endif // MATEBRIDGE_TERMINAL_TERMINAL_DRIVER_HPP
