#include "toastkit/ui/Color.hh"

#include <algorithm>
#include <cmath>

namespace toastkit {

namespace {

uint32_t toByte(float channel) {
    float clamped = std::clamp(channel, 0.0f, 1.0f);
    return static_cast<uint32_t>(std::lround(clamped * 255.0f));
}

} // namespace

uint32_t Color::toAbgr() const {
    return (toByte(a) << 24) | (toByte(b) << 16) | (toByte(g) << 8) | toByte(r);
}

} // namespace toastkit
