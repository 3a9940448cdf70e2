#pragma once
#include "Types.hpp"

namespace droview {

/*  Convolution of a sampled input with a normalised exponential kernel
 *
 *        f(t) = ∫₀ᵗ x(τ) · exp(-(t-τ)/T) dτ
 *
 *  evaluated exactly for piecewise-linear x(τ) on a (possibly
 *  non-uniform) time grid.  T == +inf gives the running integral,
 *  T == 0 gives zero.
 */
Vector expconv(double T, const Vector& t, const Vector& x);

/*  Running trapezoidal integral, F(t_0) = 0.  */
Vector cumulative_trapz(const Vector& t, const Vector& x);

} // namespace droview
