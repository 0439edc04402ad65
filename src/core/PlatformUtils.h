#pragma once

#include "Types.h"

#include <string>

namespace ringchart {
namespace PlatformUtils {

    // Get current time as double seconds (high-resolution monotonic clock).
    double getTime();

    // Convert RGBcolor to hex string "#RRGGBB", or "#RRGGBBAA" when not opaque.
    std::string rgb2hex(const RGBcolor& color);

    // Convert hex string "#RRGGBB", "RRGGBB" or "#RRGGBBAA" to RGBcolor.
    // Malformed input yields opaque black.
    RGBcolor hex2rgb(const std::string& hexColor);

    // Generate a process-unique item id ("<hex millis>-<hex random>").
    std::string generateId();

} // namespace PlatformUtils
} // namespace ringchart
