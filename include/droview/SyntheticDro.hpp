#pragma once
#include "Types.hpp"
#include "Dataset.hpp"
#include "ModelRegistry.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace droview {

// Parameter distribution types
enum class DistributionType {
    Fixed,
    Gaussian,
    Uniform
};

struct ParameterConfig {
    DistributionType type = DistributionType::Fixed;
    double value = 0.0;
    double error = 0.0;  // for Gaussian
    double min = 0.0;    // for Uniform
    double max = 0.0;    // for Uniform

    double sample(std::mt19937& rng) const;

    // "value" | "mean,sigma" | "min:max"
    static ParameterConfig from_string(const std::string& str);
    std::string to_string() const;
};

struct DroConfig {
    int    nx = 32;
    int    ny = 32;
    int    nt = 60;
    double dt = 0.1;                       // min

    // ground-truth 2CXM ranges: Fp along x, PS along y
    double fp_min = 0.2,  fp_max = 1.2;    // ml/min/ml
    double ps_min = 0.01, ps_max = 0.3;    // ml/min/ml
    double ve = 0.2;
    double vp = 0.05;

    double noise_sigma = 0.005;            // mM
    ParameterConfig fit_scatter{DistributionType::Gaussian, 1.0, 0.05};  // multiplicative
    double nonconverged_fraction = 0.05;

    double aif_delay = 0.5;                // min, bolus arrival of the Parker AIF

    // optional tabulated AIF (time [min], conc [mM]); empty -> Parker AIF
    std::vector<double> aif_time;
    std::vector<double> aif_conc;

    std::uint32_t seed = 42;
    int num_threads = 1;

    static DroConfig from_json(const nlohmann::json& j);
};

/* Parker et al. (2006) population AIF, blood concentration [mM], t [min] */
Vector parker_aif(const Vector& t, double delay = 0.0);

/* Ground-truth 2CXM parameters of every registered model derived from
 * (Fp, PS, ve, vp).  The exchange record also carries the derived
 * transit times T, Te, Tp. */
ParameterRecord truth_for_model(ModelId id, double fp, double ps,
                                double ve, double vp);

Dataset generate_dro(const DroConfig& cfg, const ModelRegistry& reg);

} // namespace droview
