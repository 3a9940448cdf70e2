#pragma once
#include "Types.hpp"
#include <utility>
#include <vector>

namespace droview {

// every finite entry of m (NaN and ±inf dropped), column-major order
std::vector<double> finite_values(const Matrix& m);

/*  Sample quantile with linear interpolation between order statistics,
 *  h = (n-1)·p  (Hyndman & Fan definition 7).
 *  Throws EmptyDistributionError for an empty sample.                 */
double quantile(std::vector<double> values, double p);

std::pair<double, double> extrema(const Vector& v);

} // namespace droview
