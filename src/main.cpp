#include "droview/DatasetLoader.hpp"
#include "droview/SelectionState.hpp"
#include "droview/MapResolver.hpp"
#include "droview/CurveComposer.hpp"
#include "droview/FigureExport.hpp"
#include "droview/ViewerConfig.hpp"
#include "droview/Errors.hpp"
#include <cxxopts.hpp>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <optional>

using namespace droview;

static std::vector<ModelId> parse_model_list(const std::string& csv)
{
    std::vector<ModelId> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ','))
        if (!item.empty()) out.push_back(parse_model_id(item));
    return out;
}

static void print_record(const ParameterRecord& rec)
{
    for (const auto& [name, value] : rec.entries())
        std::cout << "  " << std::setw(4) << name << " = " << value;
    std::cout << '\n';
}

int main(int argc, char** argv) {
    try {
        cxxopts::Options opts("droview", "Compare kinetic model fits on a digital reference object");
        opts.add_options()
            ("d,data", "Reference-object dataset (JSON)", cxxopts::value<std::string>())
            ("m,models", "Comma separated models; the first one drives the parameter map",
                cxxopts::value<std::string>())
            ("p,param", "Parameter of the primary model", cxxopts::value<std::string>())
            ("x", "Voxel x", cxxopts::value<int>())
            ("y", "Voxel y", cxxopts::value<int>())
            ("width", "Figure width [px]", cxxopts::value<int>())
            ("height", "Figure height [px]", cxxopts::value<int>())
            ("o,output", "Output directory for the figures", cxxopts::value<std::string>())
            ("summary-only", "Print the summary, do not export figures")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        ViewerConfig cfg = load_viewer_config();
        if (cli.count("data"))   cfg.data_path   = cli["data"].as<std::string>();
        if (cli.count("output")) cfg.output_path = cli["output"].as<std::string>();
        if (cfg.data_path.empty()) {
            std::cout << opts.help() << '\n';
            return 1;
        }

        const ModelRegistry registry = ModelRegistry::standard();
        const Dataset ds = load_dataset(cfg.data_path, registry);
        std::cout << "Loaded: " << cfg.data_path << " (" << ds.nx() << "x" << ds.ny()
                  << " voxels, " << ds.nt() << " frames, "
                  << ds.models().size() << " models)\n";

        /* ---------- selection: defaults, then one field at a time ------ */
        SelectionState sel = SelectionState::defaults(ds, registry,
                                                      cfg.figure_width, cfg.figure_height);
        if (cli.count("models"))
            sel = sel.with_models(parse_model_list(cli["models"].as<std::string>()), registry);
        if (cli.count("param"))
            sel = sel.with_parameter(cli["param"].as<std::string>());
        if (cli.count("x") || cli.count("y"))
            sel = sel.with_voxel({cli.count("x") ? cli["x"].as<int>() : sel.voxel().x,
                                  cli.count("y") ? cli["y"].as<int>() : sel.voxel().y});
        if (cli.count("width") || cli.count("height"))
            sel = sel.with_figure_size(
                cli.count("width")  ? cli["width"].as<int>()  : sel.figure_width(),
                cli.count("height") ? cli["height"].as<int>() : sel.figure_height());
        sel.validate(ds, registry);

        const Voxel v = sel.voxel();
        std::cout << "\nVoxel (x = " << v.x << ", y = " << v.y << ")\n";

        /* ---------- parameter map --------------------------------------- */
        std::optional<ParameterMapView> pmap;
        try {
            pmap = resolve_parameter_map(ds, sel.primary(), sel.parameter(), v,
                                         cfg.color_quantile);
            std::cout << to_string(sel.primary()) << ": " << sel.parameter()
                      << "  colour range [" << pmap->bounds.first << ", "
                      << pmap->bounds.second << "]\n";
        } catch (const EmptyDistributionError& e) {
            std::cerr << e.what() << '\n';
        }

        /* ---------- curves ---------------------------------------------- */
        const CurveBundle bundle = compose_curves(ds, registry, sel.models(), v,
                                                  cfg.ylim_scale);
        for (const auto& fc : bundle.fits) {
            std::cout << std::left << std::setw(14) << to_string(fc.model) << std::right;
            switch (fc.status) {
                case FittedCurve::Status::Fitted:
                    std::cout << "fitted, RSS = "
                              << ds.residual_map(fc.model)(v.x, v.y) << '\n';
                    print_record(fc.parameters);
                    break;
                case FittedCurve::Status::Skipped:
                    std::cout << "no converged fit\n";
                    break;
                case FittedCurve::Status::Failed:
                    std::cout << "failed\n";
                    std::cerr << to_string(fc.model)
                              << ": fit unavailable at this voxel (" << fc.error << ")\n";
                    break;
            }
        }

        /* ---------- residual views (always every model) ---------------- */
        const std::vector<ModelId> all = ds.models();
        const IndexMap best = resolve_best_model_map(ds, all);
        const int here = best(v.x, v.y);
        std::cout << "Lowest RSS here: "
                  << (here == kUndefinedModel ? std::string("undefined")
                                              : to_string(all[here])) << '\n';

        if (cli.count("summary-only")) return 0;

        FigureExporter fig(cfg.output_path, sel.figure_width(), sel.figure_height());
        if (pmap) fig.parameter_map(*pmap);
        fig.curves(bundle);
        fig.residual_panels(resolve_residual_panels(ds, cfg.rss_color_max));
        fig.best_model_map(best, all, v);
        std::cout << "\nFigures written to " << cfg.output_path << '\n';

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
