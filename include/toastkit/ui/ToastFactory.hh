#pragma once

#include "toastkit/ui/Toast.hh"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace toastkit {

struct ToastSettings;

struct ViewportSize {
    float width = 0.0f;
    float height = 0.0f;
};

// Reports the current drawable size. Queried on every ToastFactory::create()
// so toasts follow window resizes.
using ViewportQuery = std::function<ViewportSize()>;

// Shared toast configuration. Immutable once built; create() may be called
// any number of times.
//
// Usage:
//   auto factory = ToastFactory::Builder(viewport)
//                      .font(font)
//                      .fadingDuration(0.3f)
//                      .build();
//   queue.show(factory.create("Saved", ToastLength::Short));
class ToastFactory {
  public:
    class Builder;

    Toast create(std::string text, ToastLength length) const;

    const std::shared_ptr<const Font>& font() const { return font_; }
    const Color& backgroundColor() const { return style_.backgroundColor; }
    const Color& fontColor() const { return style_.fontColor; }
    float positionY() const { return style_.positionY; }
    float fadingDuration() const { return style_.fadingDuration; }
    float maxTextRelativeWidth() const { return style_.maxRelativeWidth; }
    std::optional<int> customMargin() const { return style_.customMargin; }

  private:
    explicit ToastFactory(ViewportQuery viewport);

    ViewportQuery viewport_;
    std::shared_ptr<const Font> font_;
    ToastStyle style_;
};

// One-shot builder. build() moves the configured factory out, after which
// every call on the builder throws.
class ToastFactory::Builder {
  public:
    explicit Builder(ViewportQuery viewport);

    Builder& font(std::shared_ptr<const Font> font);

    /// Default: rgb(55, 55, 55). Alpha is ignored: the background is always opaque.
    Builder& backgroundColor(const Color& color);

    /// Default: white.
    Builder& fontColor(const Color& color);

    /// Bottom-left Y of every toast. Default: 100 + (viewportHeight - 100) / 10.
    Builder& positionY(float positionY);

    /// Seconds the toast takes to fade out. Default 0.5. Throws when negative.
    Builder& fadingDuration(float fadingDuration);

    /// Text wider than this fraction of the viewport is wrapped. Default 0.65.
    Builder& maxTextRelativeWidth(float maxTextRelativeWidth);

    /// Padding around the text in pixels. Default: twice the line height.
    Builder& margin(int margin);

    /// Applies every field present in `settings`.
    Builder& settings(const ToastSettings& settings);

    /// Throws when no font was set or the builder was already used.
    ToastFactory build();

  private:
    ToastFactory& pending();

    std::optional<ToastFactory> factory_;
};

} // namespace toastkit
