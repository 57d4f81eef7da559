#pragma once

#include "toastkit/ui/Color.hh"
#include "toastkit/utils/ErrorHandling.hh"

#include <optional>
#include <string_view>

namespace toastkit {

class DataLoader;

// Factory knobs read from configuration. Absent keys stay empty and leave
// the builder's defaults untouched.
struct ToastSettings {
    std::optional<Color> backgroundColor;
    std::optional<Color> fontColor;
    std::optional<float> positionY;
    std::optional<float> fadingDuration;
    std::optional<float> maxTextRelativeWidth;
    std::optional<int> margin;
};

// Reads the [section] table:
//   background_color / font_color   RGBA8 integers (0xRRGGBBAA)
//   position_y                      number
//   fading_duration                 number >= 0
//   max_text_relative_width         number in (0, 1]
//   margin                          integer >= 0
// A missing section yields empty settings.
Result<ToastSettings> parseToastSettings(const DataLoader& data, std::string_view section = "toast");

} // namespace toastkit
