/*
 * MateBridge C++11 - Dispatch Queue
 *
 * Per-owner coalescing queue in front of the terminal driver. Each owner has
 * a single slot holding the latest request; a newer request replaces an
 * undispatched one. A request is handed off only while its owner has no
 * reply pending, so one turn per owner is in flight at a time.
 */
#ifndef MATEBRIDGE_BRIDGE_DISPATCH_QUEUE_HPP
#define MATEBRIDGE_BRIDGE_DISPATCH_QUEUE_HPP

#include <matebridge/bridge/conversation.hpp>
#include <string>
#include <map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <functional>

namespace matebridge {

class TypingIndicator;

// How the dispatcher wraps the text before typing it into the terminal
enum class PayloadTemplate {
    PLAIN,
    LOOP,
    META_LOOP
};

const char* payload_template_str(PayloadTemplate t);

struct DispatchItem {
    std::string owner;
    int64_t chat_id;
    std::string text;           // Prompt (PLAIN) or loop task
    std::string user_message;   // As typed by the user
    PayloadTemplate tmpl;
    int64_t enqueued_ms;
    
    DispatchItem() : chat_id(0), tmpl(PayloadTemplate::PLAIN), enqueued_ms(0) {}
};

// Returns false when the handoff to the terminal failed
using DispatchFn = std::function<bool(const DispatchItem&)>;

class DispatchQueue {
public:
    // With auto_drain the worker thread starts on demand; otherwise callers
    // drive dispatch through drain_once().
    DispatchQueue(ConversationRegistry& registry,
                  DispatchFn dispatcher,
                  TypingIndicator* typing = nullptr,
                  bool auto_drain = true);
    ~DispatchQueue();
    
    void enqueue(const DispatchItem& item);
    
    // Dispatch every owner whose reply is not pending; returns the count
    int drain_once();
    
    size_t queued() const;
    bool has_queued(const std::string& owner) const;
    int64_t superseded_count() const;
    
    // Drop an owner's undispatched item
    bool discard(const std::string& owner);
    
    void stop();

private:
    ConversationRegistry& registry_;
    DispatchFn dispatcher_;
    TypingIndicator* typing_;
    bool auto_drain_;
    
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, DispatchItem> slots_;
    std::thread worker_;
    bool worker_active_;
    bool stopping_;
    int64_t superseded_;
    
    void ensure_worker();
    void run_worker();
    bool dispatch(const DispatchItem& item);
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_DISPATCH_QUEUE_HPP
