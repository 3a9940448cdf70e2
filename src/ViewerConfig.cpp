#include "droview/ViewerConfig.hpp"
#include "droview/JsonUtils.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace droview {

ViewerConfig ViewerConfig::from_json(const nlohmann::json& j)
{
    ViewerConfig c;
    c.color_quantile = j.value("colorQuantile", c.color_quantile);
    c.rss_color_max  = j.value("rssColorMax",   c.rss_color_max);
    c.ylim_scale     = j.value("ylimScale",     c.ylim_scale);
    c.figure_width   = j.value("figureWidth",   c.figure_width);
    c.figure_height  = j.value("figureHeight",  c.figure_height);
    c.output_path    = j.value("outputPath",    c.output_path);
    c.data_path      = j.value("dataPath",      c.data_path);

    if (!(c.color_quantile >= 0.0 && c.color_quantile <= 1.0))
        throw std::runtime_error("colorQuantile must lie in [0, 1]");
    if (!(c.rss_color_max > 0.0))
        throw std::runtime_error("rssColorMax must be positive");
    if (c.figure_width <= 0 || c.figure_height <= 0)
        throw std::runtime_error("figure size must be positive");
    return c;
}

ViewerConfig load_viewer_config()
{
    std::vector<std::string> search_paths = {
        // 1. Current working directory
        "droview_settings.json",

        // 2. Same directory as executable
        []() {
            std::error_code ec;
            auto exe_path = std::filesystem::canonical("/proc/self/exe", ec);
            if (ec) return std::string("./droview_settings.json");
            return (exe_path.parent_path() / "droview_settings.json").string();
        }(),

        // 3. Build directory (for development)
        "../droview_settings.json",

        // 4. Source directory (fallback)
        "../../droview_settings.json"
    };

    for (const auto& path : search_paths) {
        if (!std::filesystem::exists(path)) continue;

        nlohmann::json cfg = load_json(path);   // a broken file is an error
        expand_env(cfg);
        std::cout << "Loaded config from: " << path << std::endl;
        return ViewerConfig::from_json(cfg);
    }
    return ViewerConfig{};
}

} // namespace droview
