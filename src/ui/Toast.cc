#include "toastkit/ui/Toast.hh"

#include "toastkit/core/Log.hh"
#include "toastkit/ui/ToastCanvas.hh"
#include "toastkit/utils/Profiler.hh"

#include <utility>

namespace toastkit {

namespace {

void centerLines(TextLayout& layout) {
    for (auto& line : layout.lines) {
        line.x = (layout.width - line.width) / 2.0f;
    }
}

} // namespace

Toast::Toast(std::string text, ToastLength length, std::shared_ptr<const Font> font, const ToastStyle& style,
             float viewportWidth)
    : message_(std::move(text)),
      font_(std::move(font)),
      backgroundColor_(style.backgroundColor.withAlpha(1.0f)),
      fontColor_(style.fontColor),
      fadingDuration_(style.fadingDuration),
      timeToLive_(durationOf(length)) {
    TOASTKIT_ZONE_SCOPED;

    // Single-line metrics first; pixel sizes are truncated to whole pixels.
    TextLayout simple = font_->layout(message_);
    int lineHeight = static_cast<int>(simple.height);
    int fontWidth = static_cast<int>(simple.width);
    int fontHeight = static_cast<int>(simple.height);

    int margin = style.customMargin.value_or(lineHeight * 2);

    float maxTextWidth = viewportWidth * style.maxRelativeWidth;
    if (static_cast<float>(fontWidth) > maxTextWidth) {
        TextLayout wrapped = font_->layout(message_, maxTextWidth, TextAlign::Center);
        fontWidth = static_cast<int>(wrapped.width);
        fontHeight = static_cast<int>(wrapped.height);
        geometry_.wrapped = true;
        layout_ = std::move(wrapped);
    } else {
        layout_ = std::move(simple);
    }

    geometry_.toastHeight = fontHeight + 2 * margin;
    geometry_.toastWidth = fontWidth + 2 * margin;
    geometry_.positionY = style.positionY;
    geometry_.positionX = viewportWidth / 2.0f - static_cast<float>(geometry_.toastWidth / 2);
    geometry_.fontX = geometry_.positionX + static_cast<float>(margin);
    geometry_.fontY = style.positionY + static_cast<float>(margin + fontHeight);
    geometry_.fontWidth = fontWidth;
    geometry_.fontHeight = fontHeight;
    geometry_.margin = margin;

    // Keep the measured lines; the whole-pixel box size must not re-wrap them.
    centerLines(layout_);
    lineHeight_ = font_->lineHeight();

    TOASTKIT_UI_LOG_DEBUG("Toast created: {}x{} at ({}, {}), {} line(s)", geometry_.toastWidth, geometry_.toastHeight,
                          geometry_.positionX, geometry_.positionY, layout_.lines.size());
}

bool Toast::update(float delta, ToastCanvas& canvas) {
    if (isExpired()) {
        return false;
    }

    timeToLive_ -= delta;
    if (isExpired()) {
        TOASTKIT_UI_LOG_DEBUG("Toast expired: {}", message_);
        return false;
    }

    opacity_ = timeToLive_ < fadingDuration_ ? timeToLive_ / fadingDuration_ : 1.0f;

    drawBackground(canvas);

    canvas.beginText();
    if (timeToLive_ > 0.0f && opacity_ > kMinTextOpacity) {
        drawText(canvas);
    }
    canvas.endText();

    return true;
}

void Toast::drawBackground(ToastCanvas& canvas) const {
    const auto& g = geometry_;
    float radius = static_cast<float>(g.toastHeight / 2);
    float centerY = g.positionY + radius;

    canvas.beginShapes();
    canvas.fillCircle(g.positionX, centerY, radius, backgroundColor_);
    canvas.fillRect(g.positionX, g.positionY, static_cast<float>(g.toastWidth), static_cast<float>(g.toastHeight),
                    backgroundColor_);
    canvas.fillCircle(g.positionX + static_cast<float>(g.toastWidth), centerY, radius, backgroundColor_);
    canvas.endShapes();
}

void Toast::drawText(ToastCanvas& canvas) const {
    Color color = fontColor_.scaledAlpha(opacity_);
    float y = geometry_.fontY;
    for (const auto& line : layout_.lines) {
        if (!line.text.empty())
            canvas.drawText(*font_, line.text, geometry_.fontX + line.x, y, color);
        y -= lineHeight_;
    }
}

} // namespace toastkit
