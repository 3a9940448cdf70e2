#include "droview/Statistics.hpp"
#include "droview/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace droview {

std::vector<double> finite_values(const Matrix& m)
{
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(m.size()));
    const double* p = m.data();
    for (Eigen::Index i = 0; i < m.size(); ++i)
        if (std::isfinite(p[i])) out.push_back(p[i]);
    return out;
}

double quantile(std::vector<double> v, double p)    // by value: sorted in place
{
    if (v.empty())
        throw EmptyDistributionError("quantile(): no finite values");
    if (!(p >= 0.0 && p <= 1.0))
        throw std::invalid_argument("quantile(): p must lie in [0, 1]");

    std::sort(v.begin(), v.end());

    const double      h  = (static_cast<double>(v.size()) - 1.0) * p;
    const std::size_t lo = static_cast<std::size_t>(std::floor(h));
    const std::size_t hi = std::min(lo + 1, v.size() - 1);
    const double      w  = h - static_cast<double>(lo);
    return v[lo] + w * (v[hi] - v[lo]);
}

std::pair<double, double> extrema(const Vector& v)
{
    if (v.size() == 0)
        throw EmptyDistributionError("extrema(): empty series");
    return {v.minCoeff(), v.maxCoeff()};
}

} // namespace droview
