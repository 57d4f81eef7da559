#pragma once

#include <cstdint>
#include <vector>

namespace toastkit {

// Vertex layout of BgfxToastCanvas: Position2F + Color0_4U8 (ABGR).
struct ColorVertex {
    float x;
    float y;
    uint32_t abgr;
};

static_assert(sizeof(ColorVertex) == 12, "ColorVertex must match the bgfx vertex layout");

constexpr int kDefaultCircleSegments = 32;

// Appends a filled circle as a triangle list (three vertices per segment).
// Non-positive radii or fewer than three segments append nothing.
void appendCircle(std::vector<ColorVertex>& out, float centerX, float centerY, float radius, uint32_t abgr,
                  int segments = kDefaultCircleSegments);

// Appends an axis-aligned rectangle as two triangles. Empty rectangles append nothing.
void appendRect(std::vector<ColorVertex>& out, float x, float y, float width, float height, uint32_t abgr);

} // namespace toastkit
