#pragma once

#include "geometry/ChartConfig.h"
#include "core/Types.h"

#include <string>
#include <nlohmann/json.hpp>

namespace ringchart {

// Persisted application settings: the chart style and the window size.
// Item data is never stored.
class Config {
public:
    static Config& instance();

    // Read getConfigPath(). Missing or unreadable files keep the defaults.
    void load();
    bool save() const;

    // Returns false (and restores defaults) if the file is missing or not valid JSON.
    bool loadFromFile(const std::string& path);
    bool saveToFile(const std::string& path) const;

    nlohmann::json toJson() const;
    // Missing keys keep their defaults; values of the wrong type or out of
    // range are skipped.
    void fromJson(const nlohmann::json& j);

    void resetToDefaults();

    // Window settings
    int windowWidth = 960;
    int windowHeight = 720;

    ChartConfig chart;

    // Get config file path
    static std::string getConfigPath();

private:
    Config() = default;

    static nlohmann::json cornerToJson(const CornerRadius& corner);
    static void cornerFromJson(const nlohmann::json& j, const char* key, CornerRadius& corner);
};

} // namespace ringchart
