#pragma once

#include "toastkit/ui/ShapeTessellator.hh"
#include "toastkit/ui/ToastCanvas.hh"

#include <bgfx/bgfx.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace toastkit {

// ToastCanvas on top of bgfx. Created once by the host and shared by every
// toast: shapes are batched per beginShapes()/endShapes() pass into one
// transient vertex buffer, text goes through bgfx debug text (the host must
// enable BGFX_DEBUG_TEXT) and is measured with MonospaceFont::debugText().
class BgfxToastCanvas : public ToastCanvas {
  public:
    BgfxToastCanvas();
    ~BgfxToastCanvas() override;

    BgfxToastCanvas(const BgfxToastCanvas&) = delete;
    BgfxToastCanvas& operator=(const BgfxToastCanvas&) = delete;

    // Call after bgfx::init() to create the shader program
    void init(bgfx::ViewId viewId = kDefaultViewId);

    // Call before bgfx::shutdown() to release GPU resources
    void shutdown();

    bool isInitialized() const { return initialized_; }

    // Call once per frame before any toast update. Sets a y-up orthographic
    // view covering the backbuffer and clears last frame's debug text.
    void beginFrame(uint16_t width, uint16_t height);

    // -- ToastCanvas --

    void beginShapes() override;
    void fillCircle(float centerX, float centerY, float radius, const Color& color) override;
    void fillRect(float x, float y, float width, float height, const Color& color) override;
    void endShapes() override;

    void beginText() override;
    void drawText(const Font& font, std::string_view text, float x, float y, const Color& color) override;
    void endText() override;

    /// Index into bgfx's 16-entry debug-text palette closest to `color`
    /// blended over black. Index 0 is transparent.
    static uint8_t debugTextColorIndex(const Color& color);

    // -- Accessors for testing --

    bgfx::ViewId viewId() const { return viewId_; }
    const bgfx::VertexLayout& vertexLayout() const { return layout_; }
    std::size_t pendingVertexCount() const { return vertices_.size(); }

  private:
    static constexpr bgfx::ViewId kDefaultViewId = 254;

    bgfx::ViewId viewId_ = kDefaultViewId;
    bgfx::VertexLayout layout_;
    bgfx::ProgramHandle program_ = BGFX_INVALID_HANDLE;

    std::vector<ColorVertex> vertices_;
    uint16_t width_ = 0;
    uint16_t height_ = 0;
    bool initialized_ = false;
};

} // namespace toastkit
