#include "PlatformUtils.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>

namespace ringchart {
namespace PlatformUtils {

// ============================================================================
// getTime - high-resolution monotonic clock, returns seconds as double
// ============================================================================
double getTime() {
    using Clock = std::chrono::steady_clock;
    static const auto startTime = Clock::now();
    auto now = Clock::now();
    std::chrono::duration<double> elapsed = now - startTime;
    return elapsed.count();
}

// ============================================================================
// rgb2hex / hex2rgb
// ============================================================================
static int toByte(float channel) {
    return static_cast<int>(std::round(std::clamp(channel, 0.0f, 1.0f) * 255.0f));
}

std::string rgb2hex(const RGBcolor& color) {
    char buf[10];
    if (toByte(color.a) == 255) {
        std::snprintf(buf, sizeof(buf), "#%02X%02X%02X",
                      toByte(color.r), toByte(color.g), toByte(color.b));
    } else {
        std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X",
                      toByte(color.r), toByte(color.g), toByte(color.b), toByte(color.a));
    }
    return std::string(buf);
}

RGBcolor hex2rgb(const std::string& hexColor) {
    RGBcolor color{};
    const char* str = hexColor.c_str();
    if (*str == '#') str++;

    size_t len = std::strlen(str);
    if (len != 6 && len != 8) {
        return color;
    }

    unsigned int r = 0, g = 0, b = 0, a = 255;
    int parsed = (len == 8)
        ? std::sscanf(str, "%02x%02x%02x%02x", &r, &g, &b, &a)
        : std::sscanf(str, "%02x%02x%02x", &r, &g, &b);
    if (parsed == static_cast<int>(len / 2)) {
        color.r = static_cast<float>(r) / 255.0f;
        color.g = static_cast<float>(g) / 255.0f;
        color.b = static_cast<float>(b) / 255.0f;
        color.a = static_cast<float>(a) / 255.0f;
    }
    return color;
}

// ============================================================================
// generateId - millisecond timestamp plus 32 bits, both in hex. The low
// 16 bits come from a process-wide counter so ids generated within the
// same millisecond never collide.
// ============================================================================
std::string generateId() {
    static std::mt19937 rng{std::random_device{}()};
    static std::atomic<uint32_t> counter{0};

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint32_t randomValue = (static_cast<uint32_t>(rng()) & 0xFFFF0000u) |
                           (counter.fetch_add(1) & 0xFFFFu);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%llx-%x",
                  static_cast<unsigned long long>(millis), randomValue);
    return std::string(buf);
}

} // namespace PlatformUtils
} // namespace ringchart
