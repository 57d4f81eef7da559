#include "toastkit/ui/ToastSettings.hh"

#include "toastkit/core/DataLoader.hh"

#include <limits>
#include <string>

namespace toastkit {

namespace {

std::string keyOf(std::string_view section, std::string_view name) {
    std::string key(section);
    key += '.';
    key += name;
    return key;
}

// Error from a typed getter, or the value when the key is present.
template <typename T> Result<std::optional<T>> optionalOf(Result<T> value) {
    if (value.isOk()) {
        return Result<std::optional<T>>::ok(std::optional<T>(std::move(value.value())));
    }
    if (value.code() == ErrorCode::NotFound) {
        return Result<std::optional<T>>::ok(std::nullopt);
    }
    return value.template forward<std::optional<T>>();
}

Result<std::optional<Color>> readColor(const DataLoader& data, const std::string& key) {
    auto raw = optionalOf(data.getInt(key));
    if (raw.isError()) {
        return raw.forward<std::optional<Color>>();
    }
    if (!raw.value()) {
        return Result<std::optional<Color>>::ok(std::nullopt);
    }
    int64_t rgba = *raw.value();
    if (rgba < 0 || rgba > 0xFFFFFFFFLL) {
        return Result<std::optional<Color>>::error(ErrorCode::InvalidState,
                                                   data.formatError(key, "is not an RGBA8 value"));
    }
    return Result<std::optional<Color>>::ok(Color::fromRgba8(static_cast<uint32_t>(rgba)));
}

Result<std::optional<float>> readFloat(const DataLoader& data, const std::string& key) {
    auto raw = optionalOf(data.getFloat(key));
    if (raw.isError()) {
        return raw.forward<std::optional<float>>();
    }
    if (!raw.value()) {
        return Result<std::optional<float>>::ok(std::nullopt);
    }
    return Result<std::optional<float>>::ok(static_cast<float>(*raw.value()));
}

} // namespace

Result<ToastSettings> parseToastSettings(const DataLoader& data, std::string_view section) {
    ToastSettings settings;

    auto fail = [](ErrorCode code, const std::string& message) {
        return Result<ToastSettings>::error(code, message);
    };

    auto backgroundKey = keyOf(section, "background_color");
    auto background = readColor(data, backgroundKey);
    if (background.isError())
        return background.forward<ToastSettings>();
    settings.backgroundColor = background.value();

    auto fontColorKey = keyOf(section, "font_color");
    auto fontColor = readColor(data, fontColorKey);
    if (fontColor.isError())
        return fontColor.forward<ToastSettings>();
    settings.fontColor = fontColor.value();

    auto positionY = readFloat(data, keyOf(section, "position_y"));
    if (positionY.isError())
        return positionY.forward<ToastSettings>();
    settings.positionY = positionY.value();

    auto fadingKey = keyOf(section, "fading_duration");
    auto fading = readFloat(data, fadingKey);
    if (fading.isError())
        return fading.forward<ToastSettings>();
    if (fading.value() && *fading.value() < 0.0f)
        return fail(ErrorCode::InvalidState, data.formatError(fadingKey, "must be non-negative"));
    settings.fadingDuration = fading.value();

    auto widthKey = keyOf(section, "max_text_relative_width");
    auto width = readFloat(data, widthKey);
    if (width.isError())
        return width.forward<ToastSettings>();
    if (width.value() && (*width.value() <= 0.0f || *width.value() > 1.0f))
        return fail(ErrorCode::InvalidState, data.formatError(widthKey, "must be in (0, 1]"));
    settings.maxTextRelativeWidth = width.value();

    auto marginKey = keyOf(section, "margin");
    auto margin = optionalOf(data.getInt(marginKey));
    if (margin.isError())
        return margin.forward<ToastSettings>();
    if (margin.value()) {
        if (*margin.value() < 0)
            return fail(ErrorCode::InvalidState, data.formatError(marginKey, "must be non-negative"));
        if (*margin.value() > std::numeric_limits<int>::max())
            return fail(ErrorCode::InvalidState, data.formatError(marginKey, "is too large"));
        settings.margin = static_cast<int>(*margin.value());
    }

    return Result<ToastSettings>::ok(settings);
}

} // namespace toastkit
