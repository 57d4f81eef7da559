#pragma once

#include "toastkit/ui/Color.hh"

#include <string_view>

namespace toastkit {

class Font;

// Per-frame drawing context owned by the host and shared by every toast.
// Coordinates are y-up with the origin at the bottom-left of the viewport.
// Shape calls are only valid between beginShapes()/endShapes(), text calls
// between beginText()/endText().
class ToastCanvas {
  public:
    virtual ~ToastCanvas() = default;

    virtual void beginShapes() = 0;
    virtual void fillCircle(float centerX, float centerY, float radius, const Color& color) = 0;
    virtual void fillRect(float x, float y, float width, float height, const Color& color) = 0;
    virtual void endShapes() = 0;

    virtual void beginText() = 0;
    /// Draw one line of text whose top-left corner is (x, y).
    virtual void drawText(const Font& font, std::string_view text, float x, float y, const Color& color) = 0;
    virtual void endText() = 0;
};

} // namespace toastkit
