#include "droview/ExpConvolution.hpp"
#include <cmath>
#include <stdexcept>

namespace droview {

Vector cumulative_trapz(const Vector& t, const Vector& x)
{
    if (t.size() != x.size())
        throw std::invalid_argument("cumulative_trapz: size mismatch");

    const int N = t.size();
    Vector F = Vector::Zero(N);
    for (int i = 1; i < N; ++i)
        F[i] = F[i - 1] +
               0.5 * (x[i] + x[i - 1]) * (t[i] - t[i - 1]);
    return F;
}

/* -------------------------------------------------------------- *
 *  recursive form (Flouri et al. 2016): with  u = Δt/T           *
 *                                                                *
 *     f_{i+1} = e^{-u} f_i + x_i (1-e^{-u})                      *
 *               + (Δx/u) (u - 1 + e^{-u})                        *
 *                                                                *
 *  and the result scaled by T.                                   *
 * -------------------------------------------------------------- */
Vector expconv(double T, const Vector& t, const Vector& x)
{
    if (t.size() != x.size())
        throw std::invalid_argument("expconv: size mismatch");
    if (T < 0.0 || std::isnan(T))
        throw std::invalid_argument("expconv: negative time constant");

    const int N = t.size();
    if (T == 0.0)       return Vector::Zero(N);
    if (std::isinf(T))  return cumulative_trapz(t, x);

    Vector f = Vector::Zero(N);
    for (int i = 0; i + 1 < N; ++i) {
        const double u = (t[i + 1] - t[i]) / T;
        if (u == 0.0) { f[i + 1] = f[i]; continue; }

        const double E  = std::exp(-u);
        const double E0 = 1.0 - E;
        const double E1 = u - E0;
        const double dx = (x[i + 1] - x[i]) / u;
        f[i + 1] = E * f[i] + x[i] * E0 + dx * E1;
    }
    return T * f;
}

} // namespace droview
