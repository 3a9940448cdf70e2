#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace droview {

struct ViewerConfig {
    double      color_quantile = 0.9;      // upper colour limit of parameter maps
    double      rss_color_max  = 5e-4;     // upper colour limit of RSS panels
    double      ylim_scale     = 1.1;      // curve plot y-range / observed extrema
    int         figure_width   = 600;
    int         figure_height  = 400;
    std::string output_path    = "./droview_out";
    std::string data_path;

    static ViewerConfig from_json(const nlohmann::json& j);
};

// droview_settings.json from cwd, executable dir, ../ or ../../;
// built-in defaults when none exists
ViewerConfig load_viewer_config();

} // namespace droview
