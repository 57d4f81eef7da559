#pragma once

#include "toastkit/ui/Color.hh"
#include "toastkit/ui/Font.hh"

#include <memory>
#include <optional>
#include <string>

namespace toastkit {

class ToastCanvas;

enum class ToastLength {
    Short,
    Long
};

/// Lifetime of a toast in seconds.
constexpr float durationOf(ToastLength length) {
    switch (length) {
        case ToastLength::Short:
            return 2.0f;
        case ToastLength::Long:
            return 3.5f;
    }
    return 2.0f;
}

// Display configuration a factory hands to every toast it creates.
struct ToastStyle {
    Color backgroundColor = colors::kToastGray; // drawn opaque
    Color fontColor = colors::kWhite;
    float positionY = 0.0f;
    float fadingDuration = 0.5f;
    float maxRelativeWidth = 0.65f;
    std::optional<int> customMargin; // absent: twice the line height
};

// Layout fixed at construction. y-up, viewport origin at the bottom-left.
struct ToastGeometry {
    float positionX = 0.0f; // bottom-left corner of the background box
    float positionY = 0.0f;
    int toastWidth = 0;
    int toastHeight = 0;
    float fontX = 0.0f; // top-left corner of the text block
    float fontY = 0.0f;
    int fontWidth = 0;
    int fontHeight = 0;
    int margin = 0;
    bool wrapped = false;
};

// Transient notification: a rounded box with centered text that lives for a
// ToastLength and fades out linearly during the last fadingDuration seconds.
//
// Call update() once per frame with the frame's elapsed time. It draws the
// toast through the canvas and returns false once the lifetime is used up;
// from then on it keeps returning false and draws nothing.
class Toast {
  public:
    /// Text is not drawn once opacity falls to or below this value.
    static constexpr float kMinTextOpacity = 0.15f;

    Toast(std::string text, ToastLength length, std::shared_ptr<const Font> font, const ToastStyle& style,
          float viewportWidth);

    bool update(float delta, ToastCanvas& canvas);

    bool isExpired() const { return timeToLive_ < 0.0f; }

    const std::string& message() const { return message_; }
    float timeToLive() const { return timeToLive_; }
    float opacity() const { return opacity_; }
    float fadingDuration() const { return fadingDuration_; }
    const ToastGeometry& geometry() const { return geometry_; }
    const TextLayout& layout() const { return layout_; }

  private:
    void drawBackground(ToastCanvas& canvas) const;
    void drawText(ToastCanvas& canvas) const;

    std::string message_;
    std::shared_ptr<const Font> font_;
    Color backgroundColor_;
    Color fontColor_;
    float fadingDuration_;
    float timeToLive_;
    float opacity_ = 1.0f;
    float lineHeight_ = 0.0f;
    ToastGeometry geometry_;
    TextLayout layout_;
};

} // namespace toastkit
