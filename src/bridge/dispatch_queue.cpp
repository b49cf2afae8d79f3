#include <matebridge/bridge/dispatch_queue.hpp>
#include <matebridge/bridge/typing_indicator.hpp>
#include <matebridge/core/logger.hpp>
#include <chrono>
#include <vector>

namespace matebridge {

namespace {
const int WORKER_WAIT_MS = 100;
}

const char* payload_template_str(PayloadTemplate t) {
    switch (t) {
        case PayloadTemplate::PLAIN: return "plain";
        case PayloadTemplate::LOOP: return "loop";
        case PayloadTemplate::META_LOOP: return "meta_loop";
    }
    return "plain";
}

DispatchQueue::DispatchQueue(ConversationRegistry& registry,
                             DispatchFn dispatcher,
                             TypingIndicator* typing,
                             bool auto_drain)
    : registry_(registry)
    , dispatcher_(dispatcher)
    , typing_(typing)
    , auto_drain_(auto_drain)
    , worker_active_(false)
    , stopping_(false)
    , superseded_(0) {}

DispatchQueue::~DispatchQueue() {
    stop();
}

void DispatchQueue::enqueue(const DispatchItem& item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, DispatchItem>::iterator it = slots_.find(item.owner);
        if (it != slots_.end()) {
            LOG_INFO("[Queue] Superseding queued request for %s", item.owner.c_str());
            superseded_++;
            it->second = item;
        } else {
            slots_[item.owner] = item;
        }
        if (slots_[item.owner].enqueued_ms == 0) {
            slots_[item.owner].enqueued_ms = registry_.now_ms();
        }
        if (auto_drain_) ensure_worker();
    }
    cv_.notify_one();
}

int DispatchQueue::drain_once() {
    std::vector<DispatchItem> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, DispatchItem>::iterator it = slots_.begin();
        while (it != slots_.end()) {
            if (registry_.is_pending(it->first)) {
                ++it;
                continue;
            }
            ready.push_back(it->second);
            slots_.erase(it++);
        }
    }
    
    int dispatched = 0;
    for (size_t i = 0; i < ready.size(); ++i) {
        if (dispatch(ready[i])) dispatched++;
    }
    return dispatched;
}

bool DispatchQueue::dispatch(const DispatchItem& item) {
    registry_.ensure(item.chat_id);
    registry_.record_user_message(item.owner, item.user_message, item.text);
    registry_.set_pending(item.owner);
    if (typing_) typing_->start_typing(item.owner);
    
    bool ok = false;
    try {
        ok = dispatcher_ && dispatcher_(item);
    } catch (const std::exception& e) {
        LOG_ERROR("[Queue] Dispatcher threw for %s: %s", item.owner.c_str(), e.what());
        ok = false;
    }
    
    if (!ok) {
        LOG_WARN("[Queue] Handoff failed for %s, clearing pending", item.owner.c_str());
        registry_.clear_pending(item.owner);
        if (typing_) typing_->stop_typing(item.owner);
        return false;
    }
    
    LOG_DEBUG("[Queue] Dispatched %s request for %s",
              payload_template_str(item.tmpl), item.owner.c_str());
    return true;
}

size_t DispatchQueue::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

bool DispatchQueue::has_queued(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.find(owner) != slots_.end();
}

int64_t DispatchQueue::superseded_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return superseded_;
}

bool DispatchQueue::discard(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.erase(owner) > 0;
}

void DispatchQueue::ensure_worker() {
    // Called with mutex_ held
    if (worker_active_ || stopping_) return;
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_active_ = true;
    worker_ = std::thread(&DispatchQueue::run_worker, this);
}

void DispatchQueue::run_worker() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(WORKER_WAIT_MS));
            if (stopping_ || slots_.empty()) {
                worker_active_ = false;
                return;
            }
        }
        try {
            drain_once();
        } catch (const std::exception& e) {
            LOG_ERROR("[Queue] Drain failed: %s", e.what());
        }
    }
}

void DispatchQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

} // namespace matebridge
