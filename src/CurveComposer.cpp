#include "droview/CurveComposer.hpp"
#include "droview/Statistics.hpp"
#include "droview/Errors.hpp"
#include <cmath>
#include <exception>

namespace droview {

ParameterRecord parameter_record(const Dataset&       ds,
                                 const ModelRegistry& reg,
                                 ModelId              model,
                                 const Voxel&         voxel)
{
    if (!ds.contains(voxel))
        throw OutOfRangeError("voxel (" + std::to_string(voxel.x) + ", " +
                              std::to_string(voxel.y) + ") outside the image");

    ParameterRecord rec;
    for (const auto& name : reg.parameter_names(model))
        rec.set(name, ds.parameter_map(model, name)(voxel.x, voxel.y));
    return rec;
}

FittedCurve compose_curve(const Dataset&       ds,
                          const ModelRegistry& reg,
                          ModelId              model,
                          const Voxel&         voxel)
{
    FittedCurve fc{model};
    fc.parameters = parameter_record(ds, reg, model, voxel);

    // the fit did not converge here: nothing to draw, not an error
    if (std::isnan(fc.parameters.first())) {
        fc.status = FittedCurve::Status::Skipped;
        return fc;
    }

    const ModelSpec& spec = reg.spec(model);
    Vector curve;
    try {
        curve = spec.evaluate(ds.time(), ds.aif(), fc.parameters);
    } catch (const std::exception& e) {
        throw ModelEvaluationError(to_string(model), e.what());
    }
    if (curve.size() != ds.nt())
        throw ModelEvaluationError(to_string(model),
                                   "evaluator returned " + std::to_string(curve.size()) +
                                   " samples, expected " + std::to_string(ds.nt()));

    fc.status = FittedCurve::Status::Fitted;
    fc.values = std::move(curve);
    return fc;
}

CurveBundle compose_curves(const Dataset&              ds,
                           const ModelRegistry&        reg,
                           const std::vector<ModelId>& models,
                           const Voxel&                voxel,
                           double                      ylim_scale)
{
    CurveBundle b;
    b.time     = ds.time();
    b.observed = ds.time_series_at(voxel);
    b.voxel    = voxel;

    const auto [lo, hi] = extrema(b.observed);
    b.ylim = {ylim_scale * lo, ylim_scale * hi};

    b.fits.reserve(models.size());
    for (ModelId m : models) {
        try {
            b.fits.push_back(compose_curve(ds, reg, m, voxel));
        } catch (const ModelEvaluationError& e) {
            FittedCurve failed{m};
            failed.status     = FittedCurve::Status::Failed;
            failed.parameters = parameter_record(ds, reg, m, voxel);
            failed.error      = e.what();
            b.fits.push_back(std::move(failed));
        }
    }
    return b;
}

} // namespace droview
