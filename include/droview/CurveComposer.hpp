#pragma once
#include "Types.hpp"
#include "Dataset.hpp"
#include "ModelRegistry.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace droview {

struct FittedCurve {
    enum class Status { Fitted, Skipped, Failed };

    ModelId               model;
    Status                status = Status::Skipped;
    ParameterRecord       parameters;
    std::optional<Vector> values;    // set iff status == Fitted
    std::string           error;     // set iff status == Failed
};

struct CurveBundle {
    Vector                    time;
    Vector                    observed;
    Voxel                     voxel;
    std::vector<FittedCurve>  fits;     // analyst's selection order
    std::pair<double, double> ylim;     // from the observed series only
};

// fitted values of every parameter of `model` at `voxel`
ParameterRecord parameter_record(const Dataset&       ds,
                                 const ModelRegistry& reg,
                                 ModelId              model,
                                 const Voxel&         voxel);

/*  One model.  Skipped when the first parameter is NaN; evaluator
 *  failures (or a result of the wrong length) are rethrown as
 *  ModelEvaluationError.                                              */
FittedCurve compose_curve(const Dataset&       ds,
                          const ModelRegistry& reg,
                          ModelId              model,
                          const Voxel&         voxel);

/*  Observed curve plus one entry per selected model.  A
 *  ModelEvaluationError only marks its own entry as Failed.           */
CurveBundle compose_curves(const Dataset&              ds,
                           const ModelRegistry&        reg,
                           const std::vector<ModelId>& models,
                           const Voxel&                voxel,
                           double                      ylim_scale = 1.1);

} // namespace droview
