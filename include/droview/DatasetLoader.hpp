#pragma once
#include "Dataset.hpp"
#include "ModelRegistry.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace droview {

/*
 *  JSON layout of a reference-object file (NaN stored as null):
 *
 *    { "t"   : [nt],
 *      "ca"  : [nt],
 *      "ct"  : [nx][ny][nt],
 *      "fits": { "<model>": { "<param>": [nx][ny], ... }, ... },
 *      "rss" : { "<model>": [nx][ny], ... } }
 *
 *  Every model in "fits" must appear in the registry and provide all of
 *  the registry's parameter names.  Any defect -> DatasetLoadError.
 */
Dataset dataset_from_json(const nlohmann::json& j, const ModelRegistry& reg);
Dataset load_dataset(const std::string& path, const ModelRegistry& reg);

nlohmann::json dataset_to_json(const Dataset& ds);
void save_dataset(const std::string& path, const Dataset& ds);

} // namespace droview
