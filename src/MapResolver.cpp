#include "droview/MapResolver.hpp"
#include "droview/Statistics.hpp"
#include "droview/Errors.hpp"
#include <cmath>
#include <limits>

namespace droview {

namespace {

void zero_if_inside(Matrix& m, Eigen::Index r, Eigen::Index c)
{
    if (r >= 0 && r < m.rows() && c >= 0 && c < m.cols())
        m(r, c) = 0.0;
}

} // unnamed namespace

void apply_crosshair(Matrix& map, const Voxel& v)
{
    // two cells on each arm, one-cell gap around the centre
    for (int d : {2, 3}) {
        zero_if_inside(map, v.x - d, v.y);
        zero_if_inside(map, v.x + d, v.y);
        zero_if_inside(map, v.x, v.y - d);
        zero_if_inside(map, v.x, v.y + d);
    }
}

ParameterMapView resolve_parameter_map(const Dataset&     ds,
                                       ModelId            model,
                                       const std::string& param,
                                       const Voxel&       voxel,
                                       double             quantile_p)
{
    const Matrix& src = ds.parameter_map(model, param);

    std::vector<double> finite = finite_values(src);
    if (finite.empty())
        throw EmptyDistributionError(to_string(model) + ": no valid fits for " + param);

    ParameterMapView view{model, param, voxel, src,
                          {0.0, quantile(std::move(finite), quantile_p)}};
    apply_crosshair(view.map, voxel);
    return view;
}

IndexMap resolve_best_model_map(const Dataset&              ds,
                                const std::vector<ModelId>& models)
{
    std::vector<const Matrix*> rss;
    rss.reserve(models.size());
    for (ModelId m : models) rss.push_back(&ds.residual_map(m));

    IndexMap best = IndexMap::Constant(ds.nx(), ds.ny(), kUndefinedModel);

    for (int y = 0; y < ds.ny(); ++y)
        for (int x = 0; x < ds.nx(); ++x) {
            double lowest = std::numeric_limits<double>::infinity();
            for (std::size_t k = 0; k < rss.size(); ++k) {
                const double r = (*rss[k])(x, y);
                if (std::isnan(r)) continue;                      // acts as +inf
                // strict '<': an equal later residual never displaces
                if (best(x, y) == kUndefinedModel || r < lowest) {
                    lowest    = r;
                    best(x, y) = static_cast<int>(k);
                }
            }
        }
    return best;
}

std::vector<ResidualPanel> resolve_residual_panels(const Dataset& ds, double rss_max)
{
    std::vector<ResidualPanel> panels;
    for (ModelId m : ds.models())
        panels.push_back({m, ds.residual_map(m), {0.0, rss_max}});
    return panels;
}

} // namespace droview
