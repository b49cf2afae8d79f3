/*
 * MateBridge C++11 - Response Coordinator
 *
 * Watches the agent transcript on behalf of the owner with a pending reply,
 * delivers new output to the chat and writes memories. Every trigger (file
 * watcher, coarse poll, /stop salvage) runs the same critical section, which
 * is guarded by an in-progress flag plus the coordinator mutex.
 *
 * Per-file tail state is kept in a small LRU map so that switching between
 * transcripts resumes each one where it was left.
 */
#ifndef MATEBRIDGE_BRIDGE_RESPONSE_COORDINATOR_HPP
#define MATEBRIDGE_BRIDGE_RESPONSE_COORDINATOR_HPP

#include <matebridge/bridge/annotation.hpp>
#include <matebridge/bridge/conversation.hpp>
#include <matebridge/bridge/transcript_tailer.hpp>
#include <matebridge/channels/chat_transport.hpp>
#include <matebridge/memory/store.hpp>
#include <string>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>

namespace matebridge {

enum class CoordinatorState {
    IDLE,
    AWAITING,
    DELIVERING,
    TIMED_OUT
};

enum class CheckResult {
    IDLE,               // Nobody is waiting for a reply
    BUSY,               // Another trigger is inside the critical section
    NO_LOG,             // No transcript to read
    TIMED_OUT,          // Pending marker expired and was cleared
    NO_CONTENT,         // Nothing new from the agent yet
    DELIVERED,
    ANNOTATION_ONLY,    // Only memory annotations, nothing shown
    DELIVERY_FAILED     // Kept for retry on the next trigger
};

const char* coordinator_state_str(CoordinatorState s);
const char* check_result_str(CheckResult r);

struct TailState {
    std::string path;
    uint64_t device;
    uint64_t inode;
    int64_t read_offset;
    SeenKeys seen_keys;
    int64_t last_used;
    
    TailState() : device(0), inode(0), read_offset(0), last_used(0) {}
};

struct CoordinatorOptions {
    int64_t pending_timeout_ms;
    size_t max_tracked_files;
    std::string checkpoint_path;    // Empty disables the tail checkpoint
    bool memory_enabled;
    int watch_interval_ms;
    int poll_interval_ms;
    
    CoordinatorOptions()
        : pending_timeout_ms(600000)
        , max_tracked_files(8)
        , memory_enabled(true)
        , watch_interval_ms(200)
        , poll_interval_ms(1000) {}
};

// Returns the transcript currently written by the agent, empty if none
using LocateFn = std::function<std::string()>;

class ResponseCoordinator {
public:
    ResponseCoordinator(ConversationRegistry& registry,
                        ChatTransport& transport,
                        MemoryStore* store,
                        LocateFn locate,
                        const CoordinatorOptions& opts = CoordinatorOptions());
    ~ResponseCoordinator();
    
    CheckResult check_for_responses();
    
    // Start the current transcript at its end so earlier history is not
    // replayed. No-op when the file is already tracked.
    bool prime();
    
    // Deliver whatever the agent has written so far, then clear the
    // owner's pending marker. True if text was delivered.
    bool salvage(const std::string& owner);
    
    // Watcher and coarse poll threads
    void start();
    void stop();
    
    CoordinatorState state() const { return state_.load(); }
    std::string current_path() const;
    bool get_tail_state(const std::string& path, TailState& out) const;
    size_t tracked_files() const;
    
    bool load_checkpoint();
    bool save_checkpoint();

private:
    ConversationRegistry& registry_;
    ChatTransport& transport_;
    MemoryStore* store_;
    LocateFn locate_;
    CoordinatorOptions opts_;
    
    mutable std::mutex mutex_;
    std::atomic<bool> in_progress_;
    std::atomic<CoordinatorState> state_;
    std::map<std::string, TailState> states_;
    std::string current_path_;
    int64_t use_counter_;
    
    std::atomic<bool> running_;
    std::thread watch_thread_;
    std::thread poll_thread_;
    
    bool expire_stale_pending();
    CheckResult check_locked(const std::string& owner);
    TailState* adopt(const std::string& path);
    void evict_if_needed();
    void commit(TailState& ts, const TailResult& result);
    void persist_memory(const ConversationContext& ctx, const Extraction& ex);
    bool save_checkpoint_locked();
    
    void watch_loop();
    void poll_loop();
};

} // namespace matebridge

#endif // MATEBRIDGE_BRIDGE_RESPONSE_COORDINATOR_HPP
