#pragma once
#include "Types.hpp"
#include "ParameterRecord.hpp"
#include <array>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace droview {

/* Declaration order is the canonical model order used for stacking
 * residuals and breaking ties. */
enum class ModelId {
    Exchange,        // two compartment exchange model (2CXM)
    ExtendedTofts,
    Uptake,          // compartmental tissue uptake model (CTUM)
    Tofts
};

inline constexpr std::array<ModelId, 4> kAllModels = {
    ModelId::Exchange, ModelId::ExtendedTofts, ModelId::Uptake, ModelId::Tofts
};

std::string to_string(ModelId id);
ModelId     parse_model_id(const std::string& name);

// (time grid, arterial input function, parameters) -> tissue concentration
using Evaluator =
    std::function<Vector(const Vector&, const Vector&, const ParameterRecord&)>;

struct ModelSpec {
    ModelId                  id;
    std::vector<std::string> parameter_names;   // fixed, non-empty
    Evaluator                evaluate;
};

class ModelRegistry {
public:
    // exchange, extendedtofts, uptake and tofts with the shipped evaluators
    static ModelRegistry standard();

    void add(ModelSpec spec);
    const ModelSpec& spec(ModelId id) const;
    bool contains(ModelId id) const;

    const std::vector<std::string>& parameter_names(ModelId id) const;
    std::vector<ModelId> canonical_order() const;

private:
    std::map<ModelId, ModelSpec> specs_;
};

} // namespace droview
