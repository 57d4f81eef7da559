#pragma once

#include "toastkit/ui/Toast.hh"

#include <cstddef>
#include <deque>
#include <string>

namespace toastkit {

class ToastCanvas;

/// FIFO display helper for hosts.  Call show() to enqueue a toast and
/// update(dt, canvas) each frame; only the oldest toast is on screen and
/// the next one starts once it expires.
class ToastQueue {
  public:
    /// Enqueue a toast behind the ones already waiting.
    void show(Toast toast);

    /// Advance and draw the front toast, dropping it once it expires.
    void update(float dt, ToastCanvas& canvas);

    /// True when at least one toast is queued or visible.
    bool active() const;

    std::size_t size() const;

    /// Message of the toast currently on screen (empty if none).
    const std::string& currentMessage() const;

    /// Remove all pending toasts immediately.
    void clear();

  private:
    std::deque<Toast> toasts_;
    static const std::string kEmpty_;
};

} // namespace toastkit
