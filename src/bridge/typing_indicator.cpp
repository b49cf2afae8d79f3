#include <matebridge/bridge/typing_indicator.hpp>
#include <matebridge/core/logger.hpp>
#include <matebridge/core/utils.hpp>

namespace matebridge {

TypingIndicator::TypingIndicator(ChatTransport& transport, ConversationRegistry& registry)
    : transport_(transport)
    , registry_(registry)
    , interval_ms_(4000)
    , running_(false) {}

TypingIndicator::~TypingIndicator() {
    stop();
}

void TypingIndicator::start_typing(const std::string& owner) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        is_typing_[owner] = true;
        last_typing_.erase(owner);
    }
    if (should_send_typing(owner)) {
        send_for(owner);
    }
}

void TypingIndicator::stop_typing(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    is_typing_[owner] = false;
}

bool TypingIndicator::should_send_typing(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, bool>::iterator typing_it = is_typing_.find(owner);
    if (typing_it == is_typing_.end() || !typing_it->second) {
        return false;
    }
    
    int64_t now = registry_.now_ms();
    std::map<std::string, int64_t>::iterator last_it = last_typing_.find(owner);
    if (last_it == last_typing_.end() || now - last_it->second >= interval_ms_) {
        last_typing_[owner] = now;
        return true;
    }
    return false;
}

std::vector<std::string> TypingIndicator::active_chats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> chats;
    for (std::map<std::string, bool>::const_iterator it = is_typing_.begin();
         it != is_typing_.end(); ++it) {
        if (it->second) {
            chats.push_back(it->first);
        }
    }
    return chats;
}

void TypingIndicator::send_for(const std::string& owner) {
    ConversationContext ctx;
    if (!registry_.get(owner, ctx)) return;
    if (!transport_.send_typing(ctx.chat_id)) {
        LOG_DEBUG("[Typing] sendChatAction failed for %s", owner.c_str());
    }
}

void TypingIndicator::tick() {
    std::vector<std::string> chats = active_chats();
    for (size_t i = 0; i < chats.size(); ++i) {
        if (!registry_.is_pending(chats[i])) {
            stop_typing(chats[i]);
            continue;
        }
        if (should_send_typing(chats[i])) {
            send_for(chats[i]);
        }
    }
}

void TypingIndicator::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&TypingIndicator::run_loop, this);
}

void TypingIndicator::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void TypingIndicator::run_loop() {
    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("[Typing] Tick failed: %s", e.what());
        }
        sleep_ms(250);
    }
}

} // namespace matebridge
