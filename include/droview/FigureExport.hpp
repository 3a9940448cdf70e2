#pragma once
#include "Types.hpp"
#include "MapResolver.hpp"
#include "CurveComposer.hpp"
#include <string>
#include <vector>

namespace droview {

/* --------------------------------------------------------------------- */
/*        PNG export of the viewer figures through matplotlib            */
/* --------------------------------------------------------------------- */
class FigureExporter {
public:
    FigureExporter(std::string out_dir, int width_px, int height_px);

    void parameter_map(const ParameterMapView& view) const;
    void curves(const CurveBundle& bundle) const;
    void residual_panels(const std::vector<ResidualPanel>& panels) const;
    void best_model_map(const IndexMap& best,
                        const std::vector<ModelId>& models,
                        const Voxel& voxel) const;

    std::string path_for(const std::string& stem) const;

private:
    std::string out_dir_;
    int         width_;
    int         height_;
};

} // namespace droview
