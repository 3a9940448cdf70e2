#pragma once
#include "Types.hpp"
#include "Dataset.hpp"
#include "ModelRegistry.hpp"
#include <string>
#include <utility>
#include <vector>

namespace droview {

// category emitted where no model has a valid residual
inline constexpr int kUndefinedModel = -1;

struct ParameterMapView {
    ModelId                   model;
    std::string               parameter;
    Voxel                     voxel;
    Matrix                    map;        // masked copy, row 0 drawn on top
    std::pair<double, double> bounds;     // colour limits
};

struct ResidualPanel {
    ModelId                   model;
    Matrix                    map;
    std::pair<double, double> bounds;
};

/*  Zero the open crosshair around (x, y):
 *      rows x-3..x-2 and x+2..x+3 of column y,
 *      columns y-3..y-2 and y+2..y+3 of row x.
 *  Cells falling outside the map are skipped.  Idempotent.            */
void apply_crosshair(Matrix& map, const Voxel& v);

/*  Masked copy of the (model, param) map with colour limits
 *  (0, quantile_p of the finite entries).  Throws
 *  EmptyDistributionError if the map has no finite entry.             */
ParameterMapView resolve_parameter_map(const Dataset&     ds,
                                       ModelId            model,
                                       const std::string& param,
                                       const Voxel&       voxel,
                                       double             quantile_p = 0.9);

/*  Index (into `models`) of the smallest residual per voxel.  NaN
 *  residuals lose against any valid one; ties go to the earlier model;
 *  voxels with no valid residual get kUndefinedModel.                 */
IndexMap resolve_best_model_map(const Dataset&              ds,
                                const std::vector<ModelId>& models);

// the static residual figure, one panel per dataset model
std::vector<ResidualPanel> resolve_residual_panels(const Dataset& ds,
                                                   double rss_max = 5e-4);

} // namespace droview
