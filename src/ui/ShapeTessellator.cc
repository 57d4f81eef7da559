#include "toastkit/ui/ShapeTessellator.hh"

#include <cmath>
#include <numbers>

namespace toastkit {

void appendCircle(std::vector<ColorVertex>& out, float centerX, float centerY, float radius, uint32_t abgr,
                  int segments) {
    if (radius <= 0.0f || segments < 3) {
        return;
    }

    const float step = 2.0f * std::numbers::pi_v<float> / static_cast<float>(segments);
    out.reserve(out.size() + static_cast<std::size_t>(segments) * 3);

    float prevX = centerX + radius;
    float prevY = centerY;
    for (int i = 1; i <= segments; ++i) {
        float angle = step * static_cast<float>(i);
        float x = centerX + radius * std::cos(angle);
        float y = centerY + radius * std::sin(angle);
        out.push_back({centerX, centerY, abgr});
        out.push_back({prevX, prevY, abgr});
        out.push_back({x, y, abgr});
        prevX = x;
        prevY = y;
    }
}

void appendRect(std::vector<ColorVertex>& out, float x, float y, float width, float height, uint32_t abgr) {
    if (width <= 0.0f || height <= 0.0f) {
        return;
    }

    const float x1 = x + width;
    const float y1 = y + height;
    out.push_back({x, y, abgr});
    out.push_back({x1, y, abgr});
    out.push_back({x1, y1, abgr});
    out.push_back({x, y, abgr});
    out.push_back({x1, y1, abgr});
    out.push_back({x, y1, abgr});
}

} // namespace toastkit
