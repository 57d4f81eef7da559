#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace toastkit {

enum class TextAlign {
    Left,
    Center,
    Right
};

struct TextLine {
    std::string text;
    float x = 0.0f; // offset inside the layout's target width
    float width = 0.0f;
};

// Measured block of text. Height follows the bitmap-font convention:
// capHeight for the first line plus lineHeight for every following line.
struct TextLayout {
    std::vector<TextLine> lines;
    float width = 0.0f;
    float height = 0.0f;
};

// Text-measurement resource shared by every toast a factory creates.
// Fonts only measure; a ToastCanvas decides how glyphs reach the screen.
class Font {
  public:
    virtual ~Font() = default;

    virtual float lineHeight() const = 0;
    virtual float capHeight() const = 0;

    /// Lay out text breaking only at explicit newlines. Lines are left aligned.
    virtual TextLayout layout(std::string_view text) const = 0;

    /// Word-wrap text inside targetWidth; each line's x follows align.
    virtual TextLayout layout(std::string_view text, float targetWidth, TextAlign align) const = 0;
};

} // namespace toastkit
