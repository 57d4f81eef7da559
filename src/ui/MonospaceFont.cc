#include "toastkit/ui/MonospaceFont.hh"

#include <algorithm>
#include <cmath>

namespace toastkit {

namespace {

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Greedy word wrap of one paragraph into lines of at most maxGlyphs bytes.
// Runs of spaces collapse at line breaks; words longer than a line are split.
void wrapParagraph(std::string_view paragraph, std::size_t maxGlyphs, std::vector<std::string>& out) {
    std::string current;
    for (auto word : split(paragraph, ' ')) {
        if (word.empty()) {
            continue;
        }
        while (word.size() > maxGlyphs) {
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
            out.emplace_back(word.substr(0, maxGlyphs));
            word.remove_prefix(maxGlyphs);
        }
        if (word.empty()) {
            continue;
        }
        if (current.empty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= maxGlyphs) {
            current += ' ';
            current += word;
        } else {
            out.push_back(std::move(current));
            current = word;
        }
    }
    out.push_back(std::move(current));
}

} // namespace

MonospaceFont::MonospaceFont(float glyphWidth, float lineHeight, float capHeight)
    : glyphWidth_(glyphWidth), lineHeight_(lineHeight), capHeight_(capHeight) {}

MonospaceFont MonospaceFont::debugText() {
    return MonospaceFont(kDebugTextCellWidth, kDebugTextCellHeight, kDebugTextCellHeight);
}

float MonospaceFont::widthOf(std::size_t glyphs) const {
    return static_cast<float>(glyphs) * glyphWidth_;
}

TextLayout MonospaceFont::layout(std::string_view text) const {
    TextLayout result;
    for (auto line : split(text, '\n')) {
        result.lines.push_back({std::string(line), 0.0f, widthOf(line.size())});
    }
    finish(result, 0.0f, TextAlign::Left);
    return result;
}

TextLayout MonospaceFont::layout(std::string_view text, float targetWidth, TextAlign align) const {
    TextLayout result;

    // At least one glyph per line so wrapping always makes progress.
    std::size_t maxGlyphs = 1;
    if (glyphWidth_ > 0.0f && targetWidth > glyphWidth_) {
        maxGlyphs = static_cast<std::size_t>(std::floor(targetWidth / glyphWidth_));
    }

    std::vector<std::string> wrapped;
    for (auto paragraph : split(text, '\n')) {
        wrapParagraph(paragraph, maxGlyphs, wrapped);
    }

    for (auto& line : wrapped) {
        float width = widthOf(line.size());
        result.lines.push_back({std::move(line), 0.0f, width});
    }
    finish(result, targetWidth, align);
    return result;
}

void MonospaceFont::finish(TextLayout& layout, float targetWidth, TextAlign align) const {
    for (const auto& line : layout.lines) {
        layout.width = std::max(layout.width, line.width);
    }
    layout.height = capHeight_ + static_cast<float>(layout.lines.size() - 1) * lineHeight_;

    for (auto& line : layout.lines) {
        switch (align) {
            case TextAlign::Left:
                line.x = 0.0f;
                break;
            case TextAlign::Center:
                line.x = (targetWidth - line.width) / 2.0f;
                break;
            case TextAlign::Right:
                line.x = targetWidth - line.width;
                break;
        }
    }
}

} // namespace toastkit
