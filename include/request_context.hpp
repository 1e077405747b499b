#pragma once

#include <atomic>
#include <functional>
#include <mutex>

namespace apicache {

// Cancellation signal shared by everything one inbound request triggers:
// store calls, upstream attempts and backoff waits. Cancelled by the session
// when the client disconnects or the per-request deadline fires.
class RequestContext {
public:
    enum class Reason {
        none,
        client_gone,
        deadline
    };

    using CancelHandler = std::function<void()>;

    RequestContext() = default;
    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    // First call wins; later calls are ignored. Runs the installed handler.
    void cancel(Reason reason);

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    Reason reason() const { return reason_.load(std::memory_order_acquire); }

    /**
     * Installs the hook that aborts the operation currently in flight
     * (closes an upstream socket, cancels a timer). Replaces any previous
     * hook. If the context is already cancelled the handler runs at once.
     */
    void on_cancel(CancelHandler handler);

    void clear_cancel_handler();

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<Reason> reason_{Reason::none};
    CancelHandler handler_;
    std::mutex mutex_;
};

}
