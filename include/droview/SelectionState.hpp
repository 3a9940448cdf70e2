#pragma once
#include "Dataset.hpp"
#include "ModelRegistry.hpp"
#include <string>
#include <utility>
#include <vector>

namespace droview {

/*
 *  Snapshot of the analyst's choices.  Owned by the UI layer; the
 *  resolvers only read it.  Every update produces a new snapshot with
 *  exactly one field replaced.
 */
class SelectionState {
public:
    static constexpr int kCrosshairMargin = 3;
    static constexpr int kDefaultWidth    = 600;
    static constexpr int kDefaultHeight   = 400;

    // all models, last parameter of the primary model, middle voxel
    static SelectionState defaults(const Dataset& ds,
                                   const ModelRegistry& reg,
                                   int width  = kDefaultWidth,
                                   int height = kDefaultHeight);

    // admissible slider values for one axis: [3, dim-3)
    static std::pair<int, int> voxel_range(int dim);

    SelectionState with_models(std::vector<ModelId> models,
                               const ModelRegistry& reg) const;
    SelectionState with_parameter(std::string param) const;
    SelectionState with_voxel(Voxel v) const;
    SelectionState with_figure_size(int width, int height) const;

    // throws SelectionError on the first violated constraint
    void validate(const Dataset& ds, const ModelRegistry& reg) const;

    const std::vector<ModelId>& models() const { return models_; }
    ModelId            primary()   const;
    const std::string& parameter() const { return parameter_; }
    const Voxel&       voxel()     const { return voxel_; }
    int figure_width()  const { return width_; }
    int figure_height() const { return height_; }

private:
    SelectionState() = default;

    std::vector<ModelId> models_;
    std::string          parameter_;
    Voxel                voxel_;
    int                  width_  = kDefaultWidth;
    int                  height_ = kDefaultHeight;
};

} // namespace droview
