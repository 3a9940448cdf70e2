#include "droview/ModelRegistry.hpp"
#include "droview/PerfusionModels.hpp"
#include "droview/Errors.hpp"

namespace droview {

std::string to_string(ModelId id)
{
    switch (id) {
        case ModelId::Exchange:      return "exchange";
        case ModelId::ExtendedTofts: return "extendedtofts";
        case ModelId::Uptake:        return "uptake";
        case ModelId::Tofts:         return "tofts";
    }
    throw UnknownModelError("invalid model id");
}

ModelId parse_model_id(const std::string& name)
{
    for (ModelId id : kAllModels)
        if (to_string(id) == name) return id;
    throw UnknownModelError("unknown model '" + name + "'");
}

ModelRegistry ModelRegistry::standard()
{
    ModelRegistry reg;
    reg.add({ModelId::Exchange,
             {"Fp", "PS", "ve", "vp", "T", "Te", "Tp"},
             model_exchange});
    reg.add({ModelId::ExtendedTofts,
             {"Kt", "ve", "vp", "kep"},
             model_tofts});
    reg.add({ModelId::Uptake,
             {"Fp", "PS", "vp"},
             model_uptake});
    reg.add({ModelId::Tofts,
             {"Kt", "ve", "vp"},
             model_tofts});
    return reg;
}

void ModelRegistry::add(ModelSpec spec)
{
    if (spec.parameter_names.empty())
        throw std::invalid_argument("model '" + to_string(spec.id) +
                                    "' declares no parameters");
    if (!spec.evaluate)
        throw std::invalid_argument("model '" + to_string(spec.id) +
                                    "' has no evaluator");
    specs_.insert_or_assign(spec.id, std::move(spec));
}

const ModelSpec& ModelRegistry::spec(ModelId id) const
{
    auto it = specs_.find(id);
    if (it == specs_.end())
        throw UnknownModelError("model '" + to_string(id) + "' is not registered");
    return it->second;
}

bool ModelRegistry::contains(ModelId id) const
{
    return specs_.count(id) != 0;
}

const std::vector<std::string>& ModelRegistry::parameter_names(ModelId id) const
{
    return spec(id).parameter_names;
}

std::vector<ModelId> ModelRegistry::canonical_order() const
{
    std::vector<ModelId> out;
    out.reserve(specs_.size());
    for (const auto& [id, s] : specs_) out.push_back(id);   // map is ordered by id
    return out;
}

} // namespace droview
