#include "droview/Dataset.hpp"
#include "droview/Errors.hpp"
#include <sstream>

namespace droview {

static std::string shape_str(Eigen::Index r, Eigen::Index c)
{
    std::ostringstream s; s << r << "x" << c;
    return s.str();
}

Dataset::Dataset(Vector time, Vector aif, Matrix concentration,
                 int nx, int ny,
                 std::map<ModelId, ModelFits> fits)
    : time_(std::move(time)), aif_(std::move(aif)),
      ct_(std::move(concentration)), nx_(nx), ny_(ny)
{
    if (nx_ <= 0 || ny_ <= 0)
        throw ShapeMismatchError("spatial dimensions must be positive, got " +
                                 shape_str(nx_, ny_));
    if (time_.size() == 0)
        throw DatasetLoadError("empty time grid");
    if (aif_.size() != time_.size())
        throw ShapeMismatchError("AIF has " + std::to_string(aif_.size()) +
                                 " samples, time grid has " +
                                 std::to_string(time_.size()));
    for (int i = 1; i < time_.size(); ++i)
        if (!(time_[i] > time_[i - 1]))
            throw DatasetLoadError("time grid is not strictly increasing at index " +
                                   std::to_string(i));

    if (ct_.rows() != Eigen::Index(nx_) * ny_ || ct_.cols() != time_.size())
        throw ShapeMismatchError("concentration volume is " +
                                 shape_str(ct_.rows(), ct_.cols()) +
                                 " (voxels x frames), expected " +
                                 shape_str(Eigen::Index(nx_) * ny_, time_.size()));

    if (fits.empty())
        throw DatasetLoadError("dataset declares no models");

    for (auto& [id, mf] : fits) {
        const std::string model = to_string(id);
        if (mf.parameters.empty())
            throw DatasetLoadError("model '" + model + "' has no parameter maps");

        Maps maps;
        for (auto& [name, m] : mf.parameters) {
            if (m.rows() != nx_ || m.cols() != ny_)
                throw ShapeMismatchError("parameter map " + model + "/" + name +
                                         " is " + shape_str(m.rows(), m.cols()) +
                                         ", expected " + shape_str(nx_, ny_));
            if (maps.by_name.count(name))
                throw DatasetLoadError("duplicate parameter " + model + "/" + name);
            maps.names.push_back(name);
            maps.by_name.emplace(name, std::move(m));
        }

        if (mf.rss.rows() != nx_ || mf.rss.cols() != ny_)
            throw ShapeMismatchError("RSS map of " + model + " is " +
                                     shape_str(mf.rss.rows(), mf.rss.cols()) +
                                     ", expected " + shape_str(nx_, ny_));
        for (Eigen::Index j = 0; j < mf.rss.cols(); ++j)
            for (Eigen::Index i = 0; i < mf.rss.rows(); ++i)
                if (mf.rss(i, j) < 0.0)
                    throw DatasetLoadError("negative RSS in " + model + " at (" +
                                           std::to_string(i) + ", " +
                                           std::to_string(j) + ")");
        maps.rss = std::move(mf.rss);

        maps_.emplace(id, std::move(maps));
    }
}

const Dataset::Maps& Dataset::maps_for(ModelId model) const
{
    auto it = maps_.find(model);
    if (it == maps_.end())
        throw UnknownModelError("model '" + to_string(model) + "' not in dataset");
    return it->second;
}

bool Dataset::contains(const Voxel& v) const
{
    return v.x >= 0 && v.x < nx_ && v.y >= 0 && v.y < ny_;
}

Vector Dataset::time_series_at(int x, int y) const
{
    if (!contains({x, y}))
        throw OutOfRangeError("voxel (" + std::to_string(x) + ", " +
                              std::to_string(y) + ") outside " +
                              shape_str(nx_, ny_));
    return ct_.row(x + Eigen::Index(nx_) * y).transpose();
}

const Matrix& Dataset::parameter_map(ModelId model, const std::string& param) const
{
    const Maps& maps = maps_for(model);
    auto it = maps.by_name.find(param);
    if (it == maps.by_name.end())
        throw UnknownParameterError("model '" + to_string(model) +
                                    "' has no parameter '" + param + "'");
    return it->second;
}

const Matrix& Dataset::residual_map(ModelId model) const
{
    return maps_for(model).rss;
}

bool Dataset::has_model(ModelId model) const
{
    return maps_.count(model) != 0;
}

std::vector<ModelId> Dataset::models() const
{
    std::vector<ModelId> out;
    for (const auto& [id, m] : maps_) out.push_back(id);
    return out;
}

const std::vector<std::string>& Dataset::parameter_names(ModelId model) const
{
    return maps_for(model).names;
}

} // namespace droview
