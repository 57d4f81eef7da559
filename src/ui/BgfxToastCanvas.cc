#include "toastkit/ui/BgfxToastCanvas.hh"
#include "toastkit/core/Log.hh"
#include "toastkit/ui/MonospaceFont.hh"
#include "toastkit/utils/Profiler.hh"

// Suppress shader profiles we don't compile per-platform.
// bgfx's embedded_shader.h enables DXBC on Linux and WGSL broadly,
// but we only compile the profiles listed in cmake/ToastkitShaders.cmake.
#if !defined(_WIN32)
#define BGFX_PLATFORM_SUPPORTS_DXBC 0
#define BGFX_PLATFORM_SUPPORTS_DXIL 0
#endif
#define BGFX_PLATFORM_SUPPORTS_WGSL 0
#include <bgfx/embedded_shader.h>

#include <bx/math.h>

// Compiled shader bytecode generated at build time from shaders/*.sc.
// Each profile produces a separate header with a uint8_t array named
// <shader_name>_<profile_ext> (e.g. vs_toast_glsl, fs_toast_spv).
#include "glsl/vs_toast.sc.bin.h"
#include "glsl/fs_toast.sc.bin.h"
#include "essl/vs_toast.sc.bin.h"
#include "essl/fs_toast.sc.bin.h"
#include "spv/vs_toast.sc.bin.h"
#include "spv/fs_toast.sc.bin.h"
#if BX_PLATFORM_WINDOWS
#include "dxbc/vs_toast.sc.bin.h"
#include "dxbc/fs_toast.sc.bin.h"
#endif
#if BX_PLATFORM_OSX || BX_PLATFORM_IOS || BX_PLATFORM_VISIONOS
#include "mtl/vs_toast.sc.bin.h"
#include "mtl/fs_toast.sc.bin.h"
#endif

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

static const bgfx::EmbeddedShader s_embeddedShaders[] = {
    BGFX_EMBEDDED_SHADER(vs_toast),
    BGFX_EMBEDDED_SHADER(fs_toast),
    BGFX_EMBEDDED_SHADER_END()
};

namespace toastkit {

namespace {

// Straight (non-premultiplied) vertex colors
constexpr uint64_t kRenderState =
    BGFX_STATE_WRITE_RGB
    | BGFX_STATE_WRITE_A
    | BGFX_STATE_MSAA
    | BGFX_STATE_BLEND_ALPHA;

// RGB of bgfx's debug-text palette, in attribute index order.
constexpr std::array<uint32_t, 16> kDebugTextPalette = {
    0x000000, // transparent
    0x3465a4, // blue
    0x4e9a06, // green
    0x069a9a, // cyan
    0xcc0000, // red
    0x75507b, // magenta
    0xc4a000, // brown
    0xd3d7cf, // light gray
    0x555753, // dark gray
    0x729fcf, // light blue
    0x8ae234, // light green
    0x34e2e2, // light cyan
    0xef2929, // light red
    0xad7fa8, // light magenta
    0xfce94f, // yellow
    0xeeeeec, // white
};

} // namespace

BgfxToastCanvas::BgfxToastCanvas() {
    layout_
        .begin()
        .add(bgfx::Attrib::Position, 2, bgfx::AttribType::Float)
        .add(bgfx::Attrib::Color0, 4, bgfx::AttribType::Uint8, true)
        .end();
}

BgfxToastCanvas::~BgfxToastCanvas() = default;

void BgfxToastCanvas::init(bgfx::ViewId viewId) {
    TOASTKIT_ZONE_SCOPED;

    viewId_ = viewId;

    bgfx::RendererType::Enum type = bgfx::getRendererType();
    program_ = bgfx::createProgram(
        bgfx::createEmbeddedShader(s_embeddedShaders, type, "vs_toast"),
        bgfx::createEmbeddedShader(s_embeddedShaders, type, "fs_toast"),
        true);

    initialized_ = bgfx::isValid(program_);
    if (initialized_) {
        TOASTKIT_RENDER_LOG_INFO("Toast canvas initialized (view {})", viewId_);
    } else {
        TOASTKIT_RENDER_LOG_WARN("Toast canvas: shader program creation failed for renderer {}",
                                 bgfx::getRendererName(type));
    }
}

void BgfxToastCanvas::shutdown() {
    TOASTKIT_ZONE_SCOPED;

    if (bgfx::isValid(program_))
        bgfx::destroy(program_);
    program_ = BGFX_INVALID_HANDLE;

    vertices_.clear();
    initialized_ = false;

    TOASTKIT_RENDER_LOG_INFO("Toast canvas shut down");
}

void BgfxToastCanvas::beginFrame(uint16_t width, uint16_t height) {
    TOASTKIT_ZONE_SCOPED;

    width_ = width;
    height_ = height;
    if (!initialized_) {
        return;
    }

    float ortho[16];
    const bgfx::Caps* caps = bgfx::getCaps();
    bx::mtxOrtho(
        ortho,
        0.0f,
        static_cast<float>(width),
        0.0f,
        static_cast<float>(height),
        0.0f,
        1000.0f,
        0.0f,
        caps->homogeneousDepth);

    bgfx::setViewTransform(viewId_, nullptr, ortho);
    bgfx::setViewRect(viewId_, 0, 0, width, height);
    bgfx::setViewMode(viewId_, bgfx::ViewMode::Sequential);
    bgfx::setViewClear(viewId_, BGFX_CLEAR_NONE);
    bgfx::touch(viewId_);
    bgfx::dbgTextClear();
}

// -- Shapes --

void BgfxToastCanvas::beginShapes() {
    vertices_.clear();
}

void BgfxToastCanvas::fillCircle(float centerX, float centerY, float radius, const Color& color) {
    appendCircle(vertices_, centerX, centerY, radius, color.toAbgr());
}

void BgfxToastCanvas::fillRect(float x, float y, float width, float height, const Color& color) {
    appendRect(vertices_, x, y, width, height, color.toAbgr());
}

void BgfxToastCanvas::endShapes() {
    TOASTKIT_ZONE_SCOPED;

    if (vertices_.empty() || !initialized_) {
        vertices_.clear();
        return;
    }

    const auto count = static_cast<uint32_t>(vertices_.size());
    if (bgfx::getAvailTransientVertexBuffer(count, layout_) < count) {
        TOASTKIT_RENDER_LOG_WARN("Toast canvas: transient vertex buffer exhausted, dropped {} vertices", count);
        vertices_.clear();
        return;
    }

    bgfx::TransientVertexBuffer tvb;
    bgfx::allocTransientVertexBuffer(&tvb, count, layout_);
    std::memcpy(tvb.data, vertices_.data(), count * sizeof(ColorVertex));

    bgfx::setVertexBuffer(0, &tvb);
    bgfx::setState(kRenderState);
    bgfx::submit(viewId_, program_);

    vertices_.clear();
}

// -- Text --

void BgfxToastCanvas::beginText() {}

void BgfxToastCanvas::drawText(const Font& /*font*/, std::string_view text, float x, float y, const Color& color) {
    if (!initialized_ || text.empty()) {
        return;
    }

    // Debug text is addressed in 8x16 cells counted from the top-left.
    float column = std::floor(x / MonospaceFont::kDebugTextCellWidth);
    float row = std::floor((static_cast<float>(height_) - y) / MonospaceFont::kDebugTextCellHeight);
    if (column < 0.0f || row < 0.0f || column > std::numeric_limits<uint16_t>::max() ||
        row > std::numeric_limits<uint16_t>::max()) {
        return;
    }

    uint8_t attr = debugTextColorIndex(color);
    std::string line(text);
    bgfx::dbgTextPrintf(static_cast<uint16_t>(column), static_cast<uint16_t>(row), attr, "%s", line.c_str());
}

void BgfxToastCanvas::endText() {}

uint8_t BgfxToastCanvas::debugTextColorIndex(const Color& color) {
    const float alpha = std::clamp(color.a, 0.0f, 1.0f);
    const float r = std::clamp(color.r, 0.0f, 1.0f) * alpha * 255.0f;
    const float g = std::clamp(color.g, 0.0f, 1.0f) * alpha * 255.0f;
    const float b = std::clamp(color.b, 0.0f, 1.0f) * alpha * 255.0f;

    uint8_t best = 0;
    float bestDistance = std::numeric_limits<float>::max();
    for (std::size_t i = 0; i < kDebugTextPalette.size(); ++i) {
        const uint32_t rgb = kDebugTextPalette[i];
        const float dr = r - static_cast<float>((rgb >> 16) & 0xFF);
        const float dg = g - static_cast<float>((rgb >> 8) & 0xFF);
        const float db = b - static_cast<float>(rgb & 0xFF);
        const float distance = dr * dr + dg * dg + db * db;
        if (distance < bestDistance) {
            bestDistance = distance;
            best = static_cast<uint8_t>(i);
        }
    }
    return best;
}

} // namespace toastkit
