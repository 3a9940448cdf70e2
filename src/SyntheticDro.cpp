/* ===================================================================== *
 *  src/SyntheticDro.cpp   ––  synthetic digital reference object
 * ===================================================================== */

#include "droview/SyntheticDro.hpp"
#include "droview/PerfusionModels.hpp"
#include "droview/AkimaSpline.hpp"
#include "droview/Errors.hpp"

#include <omp.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace droview {

/* ------------------------------------------------------------------ *
 *  parameter distributions                                           *
 * ------------------------------------------------------------------ */
double ParameterConfig::sample(std::mt19937& rng) const
{
    switch(type) {
        case DistributionType::Fixed:
            return value;
        case DistributionType::Gaussian: {
            std::normal_distribution<> dist(value, error);
            return dist(rng);
        }
        case DistributionType::Uniform: {
            std::uniform_real_distribution<> dist(min, max);
            return dist(rng);
        }
    }
    return value;
}

ParameterConfig ParameterConfig::from_string(const std::string& str)
{
    ParameterConfig config;

    if (str.find(',') != std::string::npos) {
        auto pos = str.find(',');
        config.type = DistributionType::Gaussian;
        config.value = std::stod(str.substr(0, pos));
        config.error = std::stod(str.substr(pos + 1));
    } else if (str.find(':') != std::string::npos) {
        auto pos = str.find(':');
        config.type = DistributionType::Uniform;
        config.min = std::stod(str.substr(0, pos));
        config.max = std::stod(str.substr(pos + 1));
    } else {
        config.type = DistributionType::Fixed;
        config.value = std::stod(str);
    }
    return config;
}

std::string ParameterConfig::to_string() const
{
    switch(type) {
        case DistributionType::Fixed:
            return "Fixed(" + std::to_string(value) + ")";
        case DistributionType::Gaussian:
            return "Gaussian(" + std::to_string(value) + "±" + std::to_string(error) + ")";
        case DistributionType::Uniform:
            return "Uniform[" + std::to_string(min) + "," + std::to_string(max) + "]";
    }
    return "";
}

/* ------------------------------------------------------------------ *
 *  configuration                                                     *
 * ------------------------------------------------------------------ */
DroConfig DroConfig::from_json(const nlohmann::json& j)
{
    DroConfig c;
    c.nx = j.value("nx", c.nx);
    c.ny = j.value("ny", c.ny);
    c.nt = j.value("nt", c.nt);
    c.dt = j.value("dt", c.dt);

    if (j.contains("fpRange")) {
        auto r = j["fpRange"].get<std::array<double, 2>>();
        c.fp_min = r[0]; c.fp_max = r[1];
    }
    if (j.contains("psRange")) {
        auto r = j["psRange"].get<std::array<double, 2>>();
        c.ps_min = r[0]; c.ps_max = r[1];
    }
    c.ve = j.value("ve", c.ve);
    c.vp = j.value("vp", c.vp);

    c.noise_sigma = j.value("noiseSigma", c.noise_sigma);
    if (j.contains("fitScatter"))
        c.fit_scatter = ParameterConfig::from_string(j["fitScatter"].get<std::string>());
    c.nonconverged_fraction = j.value("nonconvergedFraction", c.nonconverged_fraction);

    c.aif_delay = j.value("aifDelay", c.aif_delay);
    if (j.contains("aif")) {
        c.aif_time = j["aif"].at("t").get<std::vector<double>>();
        c.aif_conc = j["aif"].at("c").get<std::vector<double>>();
    }

    c.seed        = j.value("seed", c.seed);
    c.num_threads = j.value("threads", c.num_threads);
    return c;
}

static void check_config(const DroConfig& c)
{
    if (c.nx <= 0 || c.ny <= 0 || c.nt < 2)
        throw std::invalid_argument("need nx, ny > 0 and nt >= 2");
    if (!(c.dt > 0.0))
        throw std::invalid_argument("dt must be positive");
    if (!(c.fp_min > 0.0) || c.fp_max < c.fp_min)
        throw std::invalid_argument("invalid Fp range");
    if (c.ps_min < 0.0 || c.ps_max < c.ps_min)
        throw std::invalid_argument("invalid PS range");
    if (!(c.ve > 0.0) || !(c.vp > 0.0))
        throw std::invalid_argument("ve and vp must be positive");
    if (c.noise_sigma < 0.0)
        throw std::invalid_argument("noise sigma must not be negative");
    if (c.nonconverged_fraction < 0.0 || c.nonconverged_fraction > 1.0)
        throw std::invalid_argument("non-converged fraction must lie in [0, 1]");
    if (c.aif_time.size() != c.aif_conc.size())
        throw std::invalid_argument("AIF table columns differ in length");
    if (!c.aif_time.empty() && c.aif_time.size() < 4)
        throw std::invalid_argument("AIF table needs at least 4 anchors");
}

/* ------------------------------------------------------------------ *
 *  Parker population AIF                                             *
 * ------------------------------------------------------------------ */
Vector parker_aif(const Vector& t, double delay)
{
    constexpr double A1 = 0.809, A2 = 0.330;        // mmol·min
    constexpr double T1 = 0.17046, T2 = 0.365;      // min
    constexpr double s1 = 0.0563,  s2 = 0.132;      // min
    constexpr double alpha = 1.050, beta = 0.1685;  // mmol, 1/min
    constexpr double s = 38.078, tau = 0.483;       // 1/min, min

    const double norm = 1.0 / std::sqrt(2.0 * std::numbers::pi);

    Vector cb(t.size());
    for (int i = 0; i < t.size(); ++i) {
        const double tt = t[i] - delay;
        if (tt < 0.0) { cb[i] = 0.0; continue; }

        const double g1 = A1 / s1 * norm * std::exp(-(tt - T1) * (tt - T1) / (2 * s1 * s1));
        const double g2 = A2 / s2 * norm * std::exp(-(tt - T2) * (tt - T2) / (2 * s2 * s2));
        const double ex = alpha * std::exp(-beta * tt) / (1.0 + std::exp(-s * (tt - tau)));
        cb[i] = g1 + g2 + ex;
    }
    return cb;
}

/* ------------------------------------------------------------------ *
 *  model-consistent parameter records                                 *
 * ------------------------------------------------------------------ */
ParameterRecord truth_for_model(ModelId id, double fp, double ps,
                                double ve, double vp)
{
    const double kt = fp * ps / (fp + ps);   // Ktrans = E·Fp

    ParameterRecord r;
    switch (id) {
        case ModelId::Exchange:
            r.set("Fp", fp);  r.set("PS", ps);
            r.set("ve", ve);  r.set("vp", vp);
            r.set("T",  (vp + ve) / fp);
            r.set("Te", ps > 0.0 ? ve / ps : std::numeric_limits<double>::infinity());
            r.set("Tp", vp / (fp + ps));
            break;
        case ModelId::ExtendedTofts:
            r.set("Kt", kt);  r.set("ve", ve);
            r.set("vp", vp);  r.set("kep", kt / ve);
            break;
        case ModelId::Uptake:
            r.set("Fp", fp);  r.set("PS", ps);  r.set("vp", vp);
            break;
        case ModelId::Tofts:
            r.set("Kt", kt);  r.set("ve", ve);  r.set("vp", 0.0);   // no plasma term
            break;
    }
    return r;
}

/* ------------------------------------------------------------------ *
 *                         main routine                               *
 * ------------------------------------------------------------------ */
Dataset generate_dro(const DroConfig& cfg, const ModelRegistry& reg)
{
    check_config(cfg);

    const int nx = cfg.nx, ny = cfg.ny, nt = cfg.nt;
    const double NaN = std::numeric_limits<double>::quiet_NaN();

    Vector t(nt);
    for (int i = 0; i < nt; ++i) t[i] = i * cfg.dt;

    Vector ca;
    if (cfg.aif_time.empty()) {
        ca = parker_aif(t, cfg.aif_delay);
    } else {
        const AkimaSpline spline(
            Eigen::Map<const Vector>(cfg.aif_time.data(), cfg.aif_time.size()),
            Eigen::Map<const Vector>(cfg.aif_conc.data(), cfg.aif_conc.size()));
        ca = spline(t);
    }

    const std::vector<ModelId> models = reg.canonical_order();

    Matrix ct(Eigen::Index(nx) * ny, nt);
    std::vector<std::vector<Matrix>> params(models.size());
    std::vector<Matrix>              rss(models.size(), Matrix::Constant(nx, ny, NaN));
    for (std::size_t k = 0; k < models.size(); ++k)
        params[k].assign(reg.parameter_names(models[k]).size(),
                         Matrix::Constant(nx, ny, NaN));

    const auto lerp = [](double lo, double hi, int i, int n) {
        return (n > 1) ? lo + (hi - lo) * double(i) / double(n - 1) : lo;
    };

    if (cfg.num_threads > 0) omp_set_num_threads(cfg.num_threads);

    const int nvox = nx * ny;
    #pragma omp parallel for schedule(dynamic)
    for (int v = 0; v < nvox; ++v) {
        const int x = v % nx;
        const int y = v / nx;

        // per-voxel stream: result independent of the thread count
        std::seed_seq seq{cfg.seed, static_cast<std::uint32_t>(v)};
        std::mt19937  rng(seq);
        std::normal_distribution<>       noise(0.0, cfg.noise_sigma > 0.0 ? cfg.noise_sigma : 1.0);
        std::bernoulli_distribution      fails(cfg.nonconverged_fraction);

        const double fp = lerp(cfg.fp_min, cfg.fp_max, x, nx);
        const double ps = lerp(cfg.ps_min, cfg.ps_max, y, ny);

        Vector conc = model_exchange(t, ca, truth_for_model(ModelId::Exchange,
                                                            fp, ps, cfg.ve, cfg.vp));
        if (cfg.noise_sigma > 0.0)
            for (int i = 0; i < nt; ++i) conc[i] += noise(rng);
        ct.row(v) = conc.transpose();

        for (std::size_t k = 0; k < models.size(); ++k) {
            if (fails(rng)) continue;                    // stays NaN

            const auto scatter = [&] { return std::max(cfg.fit_scatter.sample(rng), 1e-3); };
            const ParameterRecord rec = truth_for_model(models[k],
                                                        fp * scatter(), ps * scatter(),
                                                        cfg.ve * scatter(), cfg.vp * scatter());
            const ModelSpec& spec = reg.spec(models[k]);

            Vector fitted;
            try {
                fitted = spec.evaluate(t, ca, rec);
            } catch (const std::invalid_argument&) {
                continue;                                // non-converged voxel
            }
            if (fitted.size() != nt) continue;

            for (std::size_t p = 0; p < spec.parameter_names.size(); ++p)
                params[k][p](x, y) = rec.value_or(spec.parameter_names[p], NaN);
            rss[k](x, y) = (conc - fitted).squaredNorm();
        }
    }

    std::map<ModelId, ModelFits> fits;
    for (std::size_t k = 0; k < models.size(); ++k) {
        ModelFits mf;
        const auto& names = reg.parameter_names(models[k]);
        for (std::size_t p = 0; p < names.size(); ++p)
            mf.parameters.emplace_back(names[p], std::move(params[k][p]));
        mf.rss = std::move(rss[k]);
        fits.emplace(models[k], std::move(mf));
    }

    return Dataset(std::move(t), std::move(ca), std::move(ct), nx, ny, std::move(fits));
}

} // namespace droview
