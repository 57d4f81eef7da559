#include "toastkit/ui/ToastFactory.hh"

#include "toastkit/core/Log.hh"
#include "toastkit/ui/ToastSettings.hh"
#include "toastkit/utils/ErrorHandling.hh"

#include <utility>

namespace toastkit {

namespace {

constexpr float kBottomGap = 100.0f;

} // namespace

ToastFactory::ToastFactory(ViewportQuery viewport) : viewport_(std::move(viewport)) {}

Toast ToastFactory::create(std::string text, ToastLength length) const {
    ViewportSize size = viewport_();
    return Toast(std::move(text), length, font_, style_, size.width);
}

// -- Builder --

ToastFactory::Builder::Builder(ViewportQuery viewport) {
    if (!viewport) {
        throwError("Viewport query is not set");
    }
    float screenHeight = viewport().height;
    factory_ = ToastFactory(std::move(viewport));
    factory_->style_.positionY = kBottomGap + ((screenHeight - kBottomGap) / 10.0f);
}

ToastFactory& ToastFactory::Builder::pending() {
    if (!factory_) {
        throwError("Builder can be used only once");
    }
    return *factory_;
}

ToastFactory::Builder& ToastFactory::Builder::font(std::shared_ptr<const Font> font) {
    pending().font_ = std::move(font);
    return *this;
}

ToastFactory::Builder& ToastFactory::Builder::backgroundColor(const Color& color) {
    // End caps overlap the body; translucency would blend twice there.
    pending().style_.backgroundColor = color.withAlpha(1.0f);
    return *this;
}

ToastFactory::Builder& ToastFactory::Builder::fontColor(const Color& color) {
    pending().style_.fontColor = color;
    return *this;
}

ToastFactory::Builder& ToastFactory::Builder::positionY(float positionY) {
    pending().style_.positionY = positionY;
    return *this;
}

ToastFactory::Builder& ToastFactory::Builder::fadingDuration(float fadingDuration) {
    auto& factory = pending();
    if (fadingDuration < 0.0f) {
        throwError("Duration must be non-negative number");
    }
    factory.style_.fadingDuration = fadingDuration;
    return *this;
}

ToastFactory::Builder& ToastFactory::Builder::maxTextRelativeWidth(float maxTextRelativeWidth) {
    pending().style_.maxRelativeWidth = maxTextRelativeWidth;
    return *this;
}

ToastFactory::Builder& ToastFactory::Builder::margin(int margin) {
    pending().style_.customMargin = margin;
    return *this;
}

ToastFactory::Builder& ToastFactory::Builder::settings(const ToastSettings& settings) {
    pending();
    if (settings.backgroundColor)
        backgroundColor(*settings.backgroundColor);
    if (settings.fontColor)
        fontColor(*settings.fontColor);
    if (settings.positionY)
        positionY(*settings.positionY);
    if (settings.fadingDuration)
        fadingDuration(*settings.fadingDuration);
    if (settings.maxTextRelativeWidth)
        maxTextRelativeWidth(*settings.maxTextRelativeWidth);
    if (settings.margin)
        margin(*settings.margin);
    return *this;
}

ToastFactory ToastFactory::Builder::build() {
    auto& factory = pending();
    if (!factory.font_) {
        throwError("Font is not set");
    }

    ToastFactory built = std::move(factory);
    factory_.reset();

    TOASTKIT_UI_LOG_INFO("Toast factory built (fading {}s, max width {}, positionY {})", built.style_.fadingDuration,
                         built.style_.maxRelativeWidth, built.style_.positionY);
    return built;
}

} // namespace toastkit
