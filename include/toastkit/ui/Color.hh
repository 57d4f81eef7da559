#pragma once

#include <cstdint>

namespace toastkit {

// RGBA color with float channels in [0, 1].
struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float red, float green, float blue, float alpha = 1.0f) : r(red), g(green), b(blue), a(alpha) {}

    // Unpack 0xRRGGBBAA.
    static constexpr Color fromRgba8(uint32_t rgba) {
        return Color(static_cast<float>((rgba >> 24) & 0xFF) / 255.0f, static_cast<float>((rgba >> 16) & 0xFF) / 255.0f,
                     static_cast<float>((rgba >> 8) & 0xFF) / 255.0f, static_cast<float>(rgba & 0xFF) / 255.0f);
    }

    constexpr Color withAlpha(float alpha) const { return Color(r, g, b, alpha); }

    /// Same color with alpha multiplied by `opacity`.
    constexpr Color scaledAlpha(float opacity) const { return Color(r, g, b, a * opacity); }

    /// Pack as 0xAABBGGRR, the byte order bgfx expects for Color0 Uint8 attributes.
    uint32_t toAbgr() const;

    constexpr bool operator==(const Color&) const = default;
};

namespace colors {
inline constexpr Color kWhite{1.0f, 1.0f, 1.0f, 1.0f};
inline constexpr Color kBlack{0.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color kToastGray{55.0f / 256.0f, 55.0f / 256.0f, 55.0f / 256.0f, 1.0f};
} // namespace colors

} // namespace toastkit
