#include "droview/FigureExport.hpp"
#include "matplotlibcpp.h"               // <-- header-only Python wrapper
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace plt = matplotlibcpp;           // shorthand
namespace fs  = std::filesystem;

namespace droview {

/* ===================================================================== */
/*                              helpers                                  */
/* ===================================================================== */
static std::vector<float> row_major(const Matrix& m)
{
    std::vector<float> out(static_cast<std::size_t>(m.size()));
    for (Eigen::Index r = 0; r < m.rows(); ++r)
        for (Eigen::Index c = 0; c < m.cols(); ++c)
            out[r * m.cols() + c] = static_cast<float>(m(r, c));
    return out;
}

static std::vector<double> to_std(const Vector& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

/*  imshow + fixed colour limits + colour bar.  matplotlibcpp only
 *  forwards string keywords, so the limits go through set_clim().      */
static void heatmap(const Matrix& m,
                    std::pair<double, double> clim,
                    const std::string& origin,
                    const std::string& cmap = "viridis")
{
    const std::vector<float> buf = row_major(m);
    PyObject* img = nullptr;
    plt::imshow(buf.data(), static_cast<int>(m.rows()), static_cast<int>(m.cols()), 1,
                {{"origin", origin}, {"cmap", cmap}, {"interpolation", "nearest"},
                 {"aspect", "auto"}},
                &img);
    if (!img)
        throw std::runtime_error("imshow failed");

    PyObject* res = PyObject_CallMethod(img, "set_clim", "(dd)", clim.first, clim.second);
    if (!res) {
        Py_DECREF(img);
        throw std::runtime_error("set_clim failed");
    }
    Py_DECREF(res);

    plt::colorbar(img);
    Py_DECREF(img);
}

/* ===================================================================== */
/*                          FigureExporter                               */
/* ===================================================================== */
FigureExporter::FigureExporter(std::string out_dir, int width_px, int height_px)
    : out_dir_(std::move(out_dir)), width_(width_px), height_(height_px)
{
    if (width_ <= 0 || height_ <= 0)
        throw std::invalid_argument("figure size must be positive");
    fs::create_directories(out_dir_);
}

std::string FigureExporter::path_for(const std::string& stem) const
{
    return (fs::path(out_dir_) / (stem + ".png")).string();
}

void FigureExporter::parameter_map(const ParameterMapView& view) const
{
    plt::figure_size(width_, height_);
    heatmap(view.map, view.bounds, "upper");            // row 0 on top
    plt::title(to_string(view.model) + ": " + view.parameter);
    plt::save(path_for("parameter_map"));
    plt::close();
}

void FigureExporter::curves(const CurveBundle& b) const
{
    plt::figure_size(width_, height_);

    const std::vector<double> t = to_std(b.time);
    plt::scatter(t, to_std(b.observed), 20.0, {{"color", "black"}});

    for (const auto& fc : b.fits) {
        if (fc.status != FittedCurve::Status::Fitted) continue;
        plt::plot(t, to_std(*fc.values), {{"label", to_string(fc.model)},
                                          {"linewidth", "2.5"}});
    }

    plt::ylim(b.ylim.first, b.ylim.second);
    plt::xlabel("Time [min]");
    plt::ylabel("Concentration [mM]");
    plt::title("Fitted values at voxel (x = " + std::to_string(b.voxel.x) +
               ", y = " + std::to_string(b.voxel.y) + ")");
    plt::grid(true);
    plt::legend({{"loc", "lower right"}});
    plt::save(path_for("curves"));
    plt::close();
}

void FigureExporter::residual_panels(const std::vector<ResidualPanel>& panels) const
{
    if (panels.empty()) return;

    const long ncols = static_cast<long>(std::ceil(std::sqrt(double(panels.size()))));
    const long nrows = static_cast<long>((panels.size() + ncols - 1) / ncols);

    plt::figure_size(width_, height_);
    for (std::size_t i = 0; i < panels.size(); ++i) {
        plt::subplot(nrows, ncols, static_cast<long>(i) + 1);
        heatmap(panels[i].map, panels[i].bounds, "lower");
        plt::title(to_string(panels[i].model));
    }
    plt::tight_layout();
    plt::save(path_for("rss"));
    plt::close();
}

void FigureExporter::best_model_map(const IndexMap& best,
                                    const std::vector<ModelId>& models,
                                    const Voxel& voxel) const
{
    // undefined category -> NaN -> left blank by matplotlib
    Matrix cat(best.rows(), best.cols());
    for (Eigen::Index c = 0; c < best.cols(); ++c)
        for (Eigen::Index r = 0; r < best.rows(); ++r)
            cat(r, c) = best(r, c) < 0 ? std::numeric_limits<double>::quiet_NaN()
                                       : double(best(r, c));

    std::string legend;
    for (std::size_t k = 0; k < models.size(); ++k)
        legend += (k ? ", " : "") + std::to_string(k) + "=" + to_string(models[k]);

    plt::figure_size(width_, height_);
    heatmap(cat, {-0.5, double(models.size()) - 0.5}, "upper", "tab10");
    plt::scatter(std::vector<double>{double(voxel.y)},
                 std::vector<double>{double(voxel.x)}, 30.0,
                 {{"color", "white"}, {"marker", "+"}});
    plt::title("Lowest RSS (" + legend + ")");
    plt::save(path_for("best_model"));
    plt::close();
}

} // namespace droview
