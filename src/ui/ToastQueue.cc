#include "toastkit/ui/ToastQueue.hh"

#include "toastkit/core/Log.hh"
#include "toastkit/ui/ToastCanvas.hh"

#include <utility>

namespace toastkit {

const std::string ToastQueue::kEmpty_;

void ToastQueue::show(Toast toast) {
    toasts_.push_back(std::move(toast));
    TOASTKIT_UI_LOG_DEBUG("Toast queued ({} waiting)", toasts_.size());
}

void ToastQueue::update(float dt, ToastCanvas& canvas) {
    if (toasts_.empty()) {
        return;
    }
    if (!toasts_.front().update(dt, canvas)) {
        toasts_.pop_front();
    }
}

bool ToastQueue::active() const {
    return !toasts_.empty();
}

std::size_t ToastQueue::size() const {
    return toasts_.size();
}

const std::string& ToastQueue::currentMessage() const {
    if (toasts_.empty()) {
        return kEmpty_;
    }
    return toasts_.front().message();
}

void ToastQueue::clear() {
    toasts_.clear();
}

} // namespace toastkit
