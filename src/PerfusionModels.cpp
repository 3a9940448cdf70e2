#include "droview/PerfusionModels.hpp"
#include "droview/ExpConvolution.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace droview {

static void check_inputs(const Vector& t, const Vector& ca)
{
    if (t.size() != ca.size())
        throw std::invalid_argument("time grid and AIF differ in length (" +
                                    std::to_string(t.size()) + " vs " +
                                    std::to_string(ca.size()) + ")");
}

static double require_positive(const ParameterRecord& p, const std::string& name)
{
    const double v = p.at(name);
    if (!(v > 0.0))
        throw std::invalid_argument(name + " must be positive (got " +
                                    std::to_string(v) + ")");
    return v;
}

// NaN and absent both mean "no plasma term"
static double optional_value(const ParameterRecord& p, const std::string& name)
{
    const double v = p.value_or(name, 0.0);
    return std::isnan(v) ? 0.0 : v;
}

/* ------------------------------------------------------------------ *
 *  (extended) Tofts:   C = Kt · (ca ⊗ e^{-kep t}) + vp · ca          *
 * ------------------------------------------------------------------ */
Vector model_tofts(const Vector& t, const Vector& ca, const ParameterRecord& p)
{
    check_inputs(t, ca);

    const double kt = p.at("Kt");
    double kep = p.value_or("kep", std::nan(""));
    if (std::isnan(kep))
        kep = kt / require_positive(p, "ve");
    if (kep < 0.0)
        throw std::invalid_argument("kep must not be negative");

    const double vp = optional_value(p, "vp");
    return kt * expconv(1.0 / kep, t, ca) + vp * ca;
}

/* ------------------------------------------------------------------ *
 *  compartmental tissue uptake:                                       *
 *     E  = PS/(Fp+PS),  Tp = vp/(Fp+PS)                              *
 *     C  = Fp · [ (1-E) (ca ⊗ e^{-t/Tp}) + E ∫ca ]                   *
 * ------------------------------------------------------------------ */
Vector model_uptake(const Vector& t, const Vector& ca, const ParameterRecord& p)
{
    check_inputs(t, ca);

    const double fp = require_positive(p, "Fp");
    const double ps = p.at("PS");
    const double vp = require_positive(p, "vp");
    if (ps < 0.0) throw std::invalid_argument("PS must not be negative");

    const double E  = ps / (fp + ps);
    const double Tp = vp / (fp + ps);
    return fp * ((1.0 - E) * expconv(Tp, t, ca) + E * cumulative_trapz(t, ca));
}

/* ------------------------------------------------------------------ *
 *  two compartment exchange:                                          *
 *     Tp = vp/(Fp+PS),  Te = ve/PS,  Tb = vp/Fp                      *
 *     K± = ½ (1/Tp + 1/Te ± √((1/Tp + 1/Te)² − 4/(Te·Tb)))            *
 *     E₋ = (K₊ − 1/Tb)/(K₊ − K₋)                                     *
 *     C  = Fp · [ (1−E₋)(ca ⊗ e^{-K₊t}) + E₋ (ca ⊗ e^{-K₋t}) ]        *
 * ------------------------------------------------------------------ */
Vector model_exchange(const Vector& t, const Vector& ca, const ParameterRecord& p)
{
    check_inputs(t, ca);

    const double fp = require_positive(p, "Fp");
    const double ps = p.at("PS");
    const double ve = require_positive(p, "ve");
    const double vp = require_positive(p, "vp");
    if (ps < 0.0) throw std::invalid_argument("PS must not be negative");

    // no exchange: a single plasma compartment
    if (ps == 0.0)
        return fp * expconv(vp / fp, t, ca);

    const double Tp = vp / (fp + ps);
    const double Te = ve / ps;
    const double Tb = vp / fp;

    const double a    = 1.0 / Tp + 1.0 / Te;
    const double disc = a * a - 4.0 / (Te * Tb);
    const double root = std::sqrt(std::max(disc, 0.0));
    const double kpos = 0.5 * (a + root);
    const double kneg = 0.5 * (a - root);
    if (kpos <= kneg)
        throw std::invalid_argument("degenerate exchange rates");

    const double eneg = (kpos - 1.0 / Tb) / (kpos - kneg);
    return fp * ((1.0 - eneg) * expconv(1.0 / kpos, t, ca)
                 + eneg * expconv(1.0 / kneg, t, ca));
}

} // namespace droview
