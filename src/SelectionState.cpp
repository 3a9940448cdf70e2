#include "droview/SelectionState.hpp"
#include "droview/Errors.hpp"
#include <algorithm>
#include <set>

namespace droview {

static bool has_parameter(const ModelRegistry& reg, ModelId m, const std::string& p)
{
    const auto& names = reg.parameter_names(m);
    return std::find(names.begin(), names.end(), p) != names.end();
}

std::pair<int, int> SelectionState::voxel_range(int dim)
{
    return {kCrosshairMargin, dim - kCrosshairMargin};
}

SelectionState SelectionState::defaults(const Dataset& ds,
                                        const ModelRegistry& reg,
                                        int width, int height)
{
    SelectionState s;
    for (ModelId m : ds.models())
        if (reg.contains(m)) s.models_.push_back(m);
    if (s.models_.empty())
        throw SelectionError("no dataset model is registered");

    s.parameter_ = reg.parameter_names(s.models_.front()).back();

    const auto clamp_mid = [](int dim) {
        const auto [lo, hi] = voxel_range(dim);
        return std::clamp(dim / 2, lo, std::max(lo, hi - 1));
    };
    s.voxel_  = {clamp_mid(ds.nx()), clamp_mid(ds.ny())};
    s.width_  = width;
    s.height_ = height;
    return s;
}

SelectionState SelectionState::with_models(std::vector<ModelId> models,
                                           const ModelRegistry& reg) const
{
    SelectionState s = *this;
    s.models_ = std::move(models);
    // the parameter menu is rebuilt for the new primary model
    if (!s.models_.empty() && reg.contains(s.models_.front())
        && !has_parameter(reg, s.models_.front(), s.parameter_))
        s.parameter_ = reg.parameter_names(s.models_.front()).back();
    return s;
}

SelectionState SelectionState::with_parameter(std::string param) const
{
    SelectionState s = *this;
    s.parameter_ = std::move(param);
    return s;
}

SelectionState SelectionState::with_voxel(Voxel v) const
{
    SelectionState s = *this;
    s.voxel_ = v;
    return s;
}

SelectionState SelectionState::with_figure_size(int width, int height) const
{
    SelectionState s = *this;
    s.width_  = width;
    s.height_ = height;
    return s;
}

ModelId SelectionState::primary() const
{
    if (models_.empty())
        throw SelectionError("no model selected");
    return models_.front();
}

void SelectionState::validate(const Dataset& ds, const ModelRegistry& reg) const
{
    if (models_.empty())
        throw SelectionError("no model selected");

    std::set<ModelId> seen;
    for (ModelId m : models_) {
        if (!reg.contains(m) || !ds.has_model(m))
            throw SelectionError("model '" + to_string(m) + "' is not available");
        if (!seen.insert(m).second)
            throw SelectionError("model '" + to_string(m) + "' selected twice");
    }

    if (!has_parameter(reg, primary(), parameter_))
        throw SelectionError("parameter '" + parameter_ + "' does not belong to '" +
                             to_string(primary()) + "'");

    const auto check_axis = [](const char* axis, int v, int dim) {
        const auto [lo, hi] = voxel_range(dim);
        if (v < lo || v >= hi)
            throw SelectionError(std::string(axis) + " = " + std::to_string(v) +
                                 " outside [" + std::to_string(lo) + ", " +
                                 std::to_string(hi) + ")");
    };
    check_axis("x", voxel_.x, ds.nx());
    check_axis("y", voxel_.y, ds.ny());

    if (width_ <= 0 || height_ <= 0)
        throw SelectionError("figure size must be positive");
}

} // namespace droview
