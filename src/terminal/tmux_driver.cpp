#include <matebridge/terminal/tmux_driver.hpp>
#include <matebridge/core/logger.hpp>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace matebridge {

TmuxDriver::TmuxDriver(const std::string& session, const std::string& executable)
    : session_(session)
    , executable_(executable) {}

bool TmuxDriver::session_exists() {
    std::vector<std::string> args;
    args.push_back("has-session");
    args.push_back("-t");
    args.push_back(session_);
    return run(args);
}

bool TmuxDriver::send_literal_text(const std::string& text) {
    std::vector<std::string> args;
    args.push_back("send-keys");
    args.push_back("-t");
    args.push_back(session_);
    args.push_back("-l");
    args.push_back(text);
    if (!run(args)) {
        LOG_WARN("[Tmux] send-keys to '%s' failed: %s", session_.c_str(), last_error().c_str());
        return false;
    }
    return true;
}

bool TmuxDriver::send_enter() {
    std::vector<std::string> args;
    args.push_back("send-keys");
    args.push_back("-t");
    args.push_back(session_);
    args.push_back("Enter");
    return run(args);
}

bool TmuxDriver::send_interrupt() {
    std::vector<std::string> args;
    args.push_back("send-keys");
    args.push_back("-t");
    args.push_back(session_);
    args.push_back("Escape");
    return run(args);
}

std::string TmuxDriver::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void TmuxDriver::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = error;
}

bool TmuxDriver::run(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.push_back(executable_.c_str());
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(args[i].c_str());
    }
    argv.push_back(nullptr);
    
    pid_t pid = fork();
    if (pid < 0) {
        set_error(std::string("fork() failed: ") + strerror(errno));
        return false;
    }
    
    if (pid == 0) {
        // Child: silence tmux's own diagnostics
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        execvp(executable_.c_str(), const_cast<char* const*>(&argv[0]));
        _exit(127);
    }
    
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            set_error(std::string("waitpid() failed: ") + strerror(errno));
            return false;
        }
    }
    
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return true;
    }
    
    std::ostringstream oss;
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        oss << executable_ << " could not be started";
    } else if (WIFEXITED(status)) {
        oss << executable_ << " " << args[0] << " exited with status " << WEXITSTATUS(status);
    } else {
        oss << executable_ << " " << args[0] << " terminated abnormally";
    }
    set_error(oss.str());
    return false;
}

} // namespace matebridge
