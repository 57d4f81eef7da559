#pragma once

#include "toastkit/ui/Font.hh"

#include <cstddef>

namespace toastkit {

// Fixed-cell font: every byte advances by glyphWidth. Matches bgfx's
// debug-text font (8x16 cells) so BgfxToastCanvas can draw what it measures.
class MonospaceFont : public Font {
  public:
    static constexpr float kDebugTextCellWidth = 8.0f;
    static constexpr float kDebugTextCellHeight = 16.0f;

    MonospaceFont(float glyphWidth, float lineHeight, float capHeight);

    /// Metrics of bgfx's built-in debug-text font.
    static MonospaceFont debugText();

    float glyphWidth() const { return glyphWidth_; }
    float lineHeight() const override { return lineHeight_; }
    float capHeight() const override { return capHeight_; }

    TextLayout layout(std::string_view text) const override;
    TextLayout layout(std::string_view text, float targetWidth, TextAlign align) const override;

  private:
    float widthOf(std::size_t glyphs) const;
    void finish(TextLayout& layout, float targetWidth, TextAlign align) const;

    float glyphWidth_;
    float lineHeight_;
    float capHeight_;
};

} // namespace toastkit
