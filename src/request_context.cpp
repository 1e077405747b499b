#include "request_context.hpp"

namespace apicache {

void RequestContext::cancel(Reason reason) {
    CancelHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_acquire)) return;
        reason_.store(reason, std::memory_order_release);
        cancelled_.store(true, std::memory_order_release);
        handler = std::move(handler_);
        handler_ = nullptr;
    }
    if (handler) handler();
}

void RequestContext::on_cancel(CancelHandler handler) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            handler_ = std::move(handler);
            return;
        }
    }
    if (handler) handler();
}

void RequestContext::clear_cancel_handler() {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = nullptr;
}

}
