#pragma once
#include "Types.hpp"
#include "ModelRegistry.hpp"

#include <ankerl/unordered_dense.h>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace droview {

struct Voxel {
    int x = 0;
    int y = 0;

    bool operator==(const Voxel&) const = default;
};

// Fitted maps of one model as they come out of the loader
struct ModelFits {
    std::vector<std::pair<std::string, Matrix>> parameters;   // (x, y) maps
    Matrix                                      rss;          // (x, y)
};

/*
 *  The loaded reference object.  Immutable after construction; every
 *  shape invariant is checked in the constructor, which throws
 *  ShapeMismatchError / DatasetLoadError instead of building a partial
 *  object.
 *
 *  Concentration layout: ct(x + nx*y, t).
 */
class Dataset {
public:
    Dataset(Vector time, Vector aif, Matrix concentration,
            int nx, int ny,
            std::map<ModelId, ModelFits> fits);

    int nx() const { return nx_; }
    int ny() const { return ny_; }
    int nt() const { return static_cast<int>(time_.size()); }

    const Vector& time() const { return time_; }
    const Vector& aif()  const { return aif_; }
    const Matrix& concentration() const { return ct_; }

    Vector time_series_at(int x, int y) const;
    Vector time_series_at(const Voxel& v) const { return time_series_at(v.x, v.y); }

    const Matrix& parameter_map(ModelId model, const std::string& param) const;
    const Matrix& residual_map(ModelId model) const;

    bool has_model(ModelId model) const;
    bool contains(const Voxel& v) const;
    std::vector<ModelId> models() const;                       // canonical order
    const std::vector<std::string>& parameter_names(ModelId model) const;

private:
    struct Maps {
        std::vector<std::string>                         names;
        ankerl::unordered_dense::map<std::string, Matrix> by_name;
        Matrix                                           rss;
    };

    const Maps& maps_for(ModelId model) const;

    Vector time_;
    Vector aif_;
    Matrix ct_;
    int    nx_ = 0;
    int    ny_ = 0;
    std::map<ModelId, Maps> maps_;
};

} // namespace droview
