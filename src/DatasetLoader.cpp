#include "droview/DatasetLoader.hpp"
#include "droview/JsonUtils.hpp"
#include "droview/Errors.hpp"
#include <algorithm>
#include <iostream>

namespace droview {
namespace {

const nlohmann::json& require(const nlohmann::json& j, const std::string& key)
{
    if (!j.is_object() || !j.contains(key))
        throw DatasetLoadError("missing key '" + key + "'");
    return j.at(key);
}

// ct[x][y][t]  ->  (nx*ny, nt) with row x + nx*y
Matrix read_volume(const nlohmann::json& j, int& nx, int& ny, int nt)
{
    if (!j.is_array() || j.empty())
        throw DatasetLoadError("ct: expected a non-empty [nx][ny][nt] array");

    nx = static_cast<int>(j.size());
    ny = -1;
    Matrix ct;
    for (int x = 0; x < nx; ++x) {
        const Matrix plane = json_to_matrix(j[x], "ct[" + std::to_string(x) + "]");
        if (ny < 0) {
            ny = static_cast<int>(plane.rows());
            ct.resize(Eigen::Index(nx) * ny, nt);
        }
        if (plane.rows() != ny || plane.cols() != nt)
            throw ShapeMismatchError("ct[" + std::to_string(x) + "] is " +
                                     std::to_string(plane.rows()) + "x" +
                                     std::to_string(plane.cols()) + ", expected " +
                                     std::to_string(ny) + "x" + std::to_string(nt));
        for (int y = 0; y < ny; ++y)
            ct.row(x + Eigen::Index(nx) * y) = plane.row(y);
    }
    return ct;
}

} // unnamed namespace

Dataset dataset_from_json(const nlohmann::json& j, const ModelRegistry& reg)
{
    Vector t  = json_to_vector(require(j, "t"),  "t");
    Vector ca = json_to_vector(require(j, "ca"), "ca");

    int nx = 0, ny = 0;
    Matrix ct = read_volume(require(j, "ct"), nx, ny, static_cast<int>(t.size()));

    const auto& fits_j = require(j, "fits");
    const auto& rss_j  = require(j, "rss");
    if (!fits_j.is_object() || !rss_j.is_object())
        throw DatasetLoadError("'fits' and 'rss' must be objects keyed by model");

    std::map<ModelId, ModelFits> fits;
    for (const auto& el : fits_j.items()) {
        const std::string     name     = el.key();
        const nlohmann::json& params_j = el.value();
        ModelId id;
        try {
            id = parse_model_id(name);
        } catch (const UnknownModelError& e) {
            throw DatasetLoadError(e.what());
        }
        if (!reg.contains(id))
            throw DatasetLoadError("model '" + name + "' is not registered");
        if (!params_j.is_object())
            throw DatasetLoadError("fits/" + name + ": expected an object");

        ModelFits mf;
        // registry order first, so the first parameter is the convergence flag
        for (const auto& p : reg.parameter_names(id)) {
            if (!params_j.contains(p))
                throw DatasetLoadError("fits/" + name + ": missing parameter '" + p + "'");
            mf.parameters.emplace_back(p, json_to_matrix(params_j.at(p),
                                                         "fits/" + name + "/" + p));
        }
        const auto& known = reg.parameter_names(id);
        for (const auto& p : params_j.items())
            if (std::find(known.begin(), known.end(), p.key()) == known.end())
                std::cerr << "Warning: ignoring unknown parameter fits/"
                          << name << "/" << p.key() << '\n';

        if (!rss_j.contains(name))
            throw DatasetLoadError("rss: missing model '" + name + "'");
        mf.rss = json_to_matrix(rss_j.at(name), "rss/" + name);

        fits.emplace(id, std::move(mf));
    }
    for (const auto& el : rss_j.items())
        if (!fits_j.contains(el.key()))
            throw DatasetLoadError("rss: model '" + el.key() + "' has no parameter maps");

    return Dataset(std::move(t), std::move(ca), std::move(ct), nx, ny, std::move(fits));
}

Dataset load_dataset(const std::string& path, const ModelRegistry& reg)
{
    nlohmann::json j;
    try {
        j = load_json(path);
    } catch (const std::exception& e) {
        throw DatasetLoadError("cannot read dataset '" + path + "': " + e.what());
    }
    return dataset_from_json(j, reg);
}

nlohmann::json dataset_to_json(const Dataset& ds)
{
    nlohmann::json j;
    j["t"]  = vector_to_json(ds.time());
    j["ca"] = vector_to_json(ds.aif());

    nlohmann::json ct = nlohmann::json::array();
    for (int x = 0; x < ds.nx(); ++x) {
        nlohmann::json plane = nlohmann::json::array();
        for (int y = 0; y < ds.ny(); ++y)
            plane.push_back(vector_to_json(ds.time_series_at(x, y)));
        ct.push_back(std::move(plane));
    }
    j["ct"] = std::move(ct);

    j["fits"] = nlohmann::json::object();
    j["rss"]  = nlohmann::json::object();
    for (ModelId m : ds.models()) {
        const std::string name = to_string(m);
        for (const auto& p : ds.parameter_names(m))
            j["fits"][name][p] = matrix_to_json(ds.parameter_map(m, p));
        j["rss"][name] = matrix_to_json(ds.residual_map(m));
    }
    return j;
}

void save_dataset(const std::string& path, const Dataset& ds)
{
    save_json(path, dataset_to_json(ds));
}

} // namespace droview
