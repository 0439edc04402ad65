#include "app/Config.h"
#include "animation/Easing.h"
#include "core/PlatformUtils.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sys/stat.h>

#ifdef _WIN32
#include <direct.h>
#else
#include <sys/types.h>
#endif

namespace ringchart {

// ============================================================================
// Singleton accessor
// ============================================================================
Config& Config::instance() {
    static Config inst;
    return inst;
}

// ============================================================================
// getConfigPath - platform-appropriate config file location
// ============================================================================
std::string Config::getConfigPath() {
#ifdef _WIN32
    // %APPDATA%/ringchart/config.json
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\ringchart\\config.json";
    }
    return "ringchart_config.json";
#else
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return std::string(xdgConfig) + "/ringchart/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/ringchart/config.json";
    }
    return "ringchart_config.json";
#endif
}

// ============================================================================
// Helper: create parent directories for a path
// ============================================================================
static void createParentDirs(const std::string& filePath) {
    auto lastSlash = filePath.find_last_of("/\\");
    if (lastSlash == std::string::npos) {
        return;
    }
    std::string dir = filePath.substr(0, lastSlash);

    std::string accumulated;
    for (size_t i = 0; i < dir.size(); ++i) {
        char c = dir[i];
        accumulated += c;
#ifdef _WIN32
        if (c == ':') {
            continue;
        }
#endif
        if (c == '/' || c == '\\' || i == dir.size() - 1) {
#ifdef _WIN32
            _mkdir(accumulated.c_str());
#else
            mkdir(accumulated.c_str(), 0755);
#endif
        }
    }
}

void Config::resetToDefaults() {
    windowWidth = 960;
    windowHeight = 720;
    chart = ChartConfig{};
}

// ============================================================================
// load / save
// ============================================================================
void Config::load() {
    loadFromFile(getConfigPath());
}

bool Config::save() const {
    std::string path = getConfigPath();
    createParentDirs(path);
    return saveToFile(path);
}

bool Config::loadFromFile(const std::string& path) {
    resetToDefaults();

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return false;
    }

    try {
        nlohmann::json j;
        ifs >> j;
        fromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "ringchart: failed to parse config " << path << ": " << e.what()
                  << std::endl;
        resetToDefaults();
        return false;
    }
    return true;
}

bool Config::saveToFile(const std::string& path) const {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        std::cerr << "ringchart: failed to write config to " << path << std::endl;
        return false;
    }
    ofs << toJson().dump(4) << std::endl;
    return static_cast<bool>(ofs);
}

// ============================================================================
// toJson
// ============================================================================
nlohmann::json Config::cornerToJson(const CornerRadius& corner) {
    return nlohmann::json{{"x", corner.x}, {"y", corner.y}};
}

nlohmann::json Config::toJson() const {
    nlohmann::json j;

    j["window"]["width"] = windowWidth;
    j["window"]["height"] = windowHeight;

    nlohmann::json& jc = j["chart"];
    jc["ringWidth"] = chart.ringWidth;
    jc["segmentSpacing"] = chart.segmentSpacing;
    jc["cornerRadii"]["outerLeading"] = cornerToJson(chart.cornerRadii.outerLeading);
    jc["cornerRadii"]["outerTrailing"] = cornerToJson(chart.cornerRadii.outerTrailing);
    jc["cornerRadii"]["innerLeading"] = cornerToJson(chart.cornerRadii.innerLeading);
    jc["cornerRadii"]["innerTrailing"] = cornerToJson(chart.cornerRadii.innerTrailing);
    jc["defaultColor"] = PlatformUtils::rgb2hex(chart.defaultColor);
    jc["animationDuration"] = chart.animationDuration;
    jc["easing"] = Easing::name(chart.easing);
    if (chart.labelStyle) {
        jc["labelStyle"]["color"] = PlatformUtils::rgb2hex(chart.labelStyle->color);
        jc["labelStyle"]["fontScale"] = chart.labelStyle->fontScale;
    }

    return j;
}

// ============================================================================
// fromJson
// ============================================================================
static bool positiveNumber(const nlohmann::json& j, const char* key, double& out) {
    if (!j.contains(key) || !j[key].is_number()) {
        return false;
    }
    double v = j[key].get<double>();
    if (!std::isfinite(v) || v <= 0.0) {
        return false;
    }
    out = v;
    return true;
}

void Config::cornerFromJson(const nlohmann::json& j, const char* key, CornerRadius& corner) {
    if (!j.contains(key) || !j[key].is_object()) {
        return;
    }
    const auto& jr = j[key];
    if (jr.contains("x") && jr["x"].is_number() && jr.contains("y") && jr["y"].is_number()) {
        corner.x = jr["x"].get<double>();
        corner.y = jr["y"].get<double>();
    }
}

void Config::fromJson(const nlohmann::json& j) {
    resetToDefaults();

    if (j.contains("window") && j["window"].is_object()) {
        const auto& jw = j["window"];
        if (jw.contains("width") && jw["width"].is_number_integer() &&
            jw["width"].get<int>() > 0) {
            windowWidth = jw["width"].get<int>();
        }
        if (jw.contains("height") && jw["height"].is_number_integer() &&
            jw["height"].get<int>() > 0) {
            windowHeight = jw["height"].get<int>();
        }
    }

    if (!j.contains("chart") || !j["chart"].is_object()) {
        return;
    }
    const auto& jc = j["chart"];

    positiveNumber(jc, "ringWidth", chart.ringWidth);
    positiveNumber(jc, "animationDuration", chart.animationDuration);

    if (jc.contains("segmentSpacing") && jc["segmentSpacing"].is_number()) {
        double spacing = jc["segmentSpacing"].get<double>();
        if (std::isfinite(spacing) && spacing >= 0.0) {
            chart.segmentSpacing = spacing;
        }
    }

    if (jc.contains("cornerRadii") && jc["cornerRadii"].is_object()) {
        const auto& jr = jc["cornerRadii"];
        cornerFromJson(jr, "outerLeading", chart.cornerRadii.outerLeading);
        cornerFromJson(jr, "outerTrailing", chart.cornerRadii.outerTrailing);
        cornerFromJson(jr, "innerLeading", chart.cornerRadii.innerLeading);
        cornerFromJson(jr, "innerTrailing", chart.cornerRadii.innerTrailing);
    }

    if (jc.contains("defaultColor") && jc["defaultColor"].is_string()) {
        chart.defaultColor = PlatformUtils::hex2rgb(jc["defaultColor"].get<std::string>());
    }

    if (jc.contains("easing") && jc["easing"].is_string()) {
        EasingType easing;
        if (Easing::fromName(jc["easing"].get<std::string>(), easing)) {
            chart.easing = easing;
        }
    }

    if (jc.contains("labelStyle") && jc["labelStyle"].is_object()) {
        const auto& jl = jc["labelStyle"];
        LabelStyle style;
        if (jl.contains("color") && jl["color"].is_string()) {
            style.color = PlatformUtils::hex2rgb(jl["color"].get<std::string>());
        }
        double scale = 0.0;
        if (positiveNumber(jl, "fontScale", scale)) {
            style.fontScale = static_cast<float>(scale);
        }
        chart.labelStyle = style;
    }
}

} // namespace ringchart
